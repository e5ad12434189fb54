#include <jsonctc-cpp/edit.hpp>

#include <jsonctc-cpp/error.hpp>
#include <jsonctc-cpp/log.hpp>
#include <jsonctc-cpp/parser.hpp>

#include "syntax/layout.hpp"

#include <algorithm>

namespace jsonctc_cpp {

namespace {

const auto tolerant = ParseOptions{true, true, true};

void pad_to(Json& array, std::size_t index) {
    while (array.size() <= index) array.push_back(nullptr);
}

// Set (value != nullptr) or delete path[from..] inside a plain value
void edit_value(Json& target, const Path& path, std::size_t from, const Json* value) {
    auto* current = &target;
    for (auto i = from; i < path.size(); ++i) {
        const auto& element = path[i];
        auto last = i + 1 == path.size();
        if (current->is_null() && value) {
            *current = std::holds_alternative<std::size_t>(element) ? Json::array() : Json::object();
        }
        if (current->is_array()) {
            auto index = as_index(element);
            if (!index) {
                if (!value) return;
                throw Exception{ErrorKind::invalid_path,
                                "cannot set '" + to_string(path) + "': '" + to_key(element)
                                    + "' is not an array index"};
            }
            if (*index >= current->size()) {
                if (!value) return;
                pad_to(*current, *index);
            }
            if (last) {
                if (value) {
                    (*current)[*index] = *value;
                } else {
                    current->erase(*index);
                }
                return;
            }
            current = &(*current)[*index];
        } else if (current->is_object()) {
            auto key = to_key(element);
            if (last) {
                if (value) {
                    (*current)[key] = *value;
                } else {
                    current->erase(key);
                }
                return;
            }
            if (!current->contains(key) && !value) return;
            current = &(*current)[key];
        } else {
            if (!value) return;
            throw Exception{ErrorKind::invalid_path,
                            "cannot set '" + to_string(path) + "': parent is not an object"};
        }
    }
}

}  // anonymous namespace

ArrayEditor::ArrayEditor(std::shared_ptr<const PathEditor> delegate)
    : delegate_{std::move(delegate)} {
    if (!delegate_) throw Exception{ErrorKind::invalid_operation, "ArrayEditor needs a delegate"};
}

auto ArrayEditor::edit_for_set(std::string_view text, const Path& path, const Json& value) const
    -> std::vector<TextEdit> {
    return edit(text, path, &value);
}

auto ArrayEditor::edit_for_delete(std::string_view text, const Path& path) const
    -> std::vector<TextEdit> {
    return edit(text, path, nullptr);
}

auto ArrayEditor::edit(std::string_view text, const Path& path, const Json* value) const
    -> std::vector<TextEdit> {
    auto tree = parse_tree(text, tolerant);

    // Find the first position whose container is an array
    const SyntaxNode* node = tree ? &*tree : nullptr;
    auto split = path.size();
    for (auto i = std::size_t{0}; i < path.size() && node; ++i) {
        if (node->type == NodeType::array) {
            split = i;
            break;
        }
        const auto* property = node->type == NodeType::object
            ? find_property(*node, to_key(path[i]))
            : nullptr;
        node = property ? &property->children[1] : nullptr;
    }

    if (split == path.size()) {
        auto has_index = std::any_of(path.begin(), path.end(), [](const PathElement& element) {
            return std::holds_alternative<std::size_t>(element);
        });
        if (has_index) {
            detail::log_debug("array-editor", "no array at '" + to_string(path) + "', edit skipped");
            return {};
        }
        return value ? delegate_->edit_for_set(text, path, *value)
                     : delegate_->edit_for_delete(text, path);
    }

    const auto& array = *node;
    auto index = as_index(path[split]);
    if (!index) {
        if (!value) return {};
        throw Exception{ErrorKind::invalid_path,
                        "cannot set '" + to_string(path) + "': '" + to_key(path[split])
                            + "' is not an array index"};
    }

    auto nested = split + 1 < path.size();
    if (!nested && *index < array.children.size()) {
        if (!value) return detail::remove_member(text, array, *index, false);
        const auto& element = array.children[*index];
        return {TextEdit{element.offset, element.length,
                         value->dump(-1, ' ', false, Json::error_handler_t::replace)}};
    }
    if (!nested && !value) return {};

    // Appends and edits inside an element rewrite the whole array
    auto current = node_value(array);
    auto updated = current;
    edit_value(updated, path, split, value);
    if (updated == current) return {};
    auto prefix = Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(split));
    return delegate_->edit_for_set(text, prefix, updated);
}

}  // namespace jsonctc_cpp
