#include <jsonctc-cpp/edit.hpp>

#include <jsonctc-cpp/error.hpp>
#include <jsonctc-cpp/parser.hpp>

#include "syntax/layout.hpp"

#include <algorithm>

namespace jsonctc_cpp {

auto apply_edits(std::string_view text, std::vector<TextEdit> edits) -> std::string {
    std::stable_sort(edits.begin(), edits.end(),
                     [](const TextEdit& a, const TextEdit& b) { return a.offset < b.offset; });
    for (std::size_t i = 0; i < edits.size(); ++i) {
        const auto& edit = edits[i];
        if (edit.offset > text.size() || edit.length > text.size() - edit.offset) {
            throw Exception{ErrorKind::edit_failed,
                            "edit at offset " + std::to_string(edit.offset) + " is outside the text"};
        }
        if (i + 1 < edits.size() && edit.offset + edit.length > edits[i + 1].offset) {
            throw Exception{ErrorKind::edit_failed,
                            "edits overlap at offset " + std::to_string(edits[i + 1].offset)};
        }
    }
    auto result = std::string{text};
    for (auto it = edits.rbegin(); it != edits.rend(); ++it) {
        result.replace(it->offset, it->length, it->content);
    }
    return result;
}

namespace {

const auto tolerant = ParseOptions{true, true, true};

// Build the value to insert when path[from..] does not exist yet
auto wrap(const Path& path, std::size_t from, const Json& value) -> Json {
    auto result = value;
    for (auto i = path.size(); i > from; --i) {
        const auto& element = path[i - 1];
        if (std::holds_alternative<std::size_t>(element)) {
            auto wrapped = Json::array();
            wrapped.push_back(std::move(result));
            result = std::move(wrapped);
        } else {
            auto wrapped = Json::object();
            wrapped[to_key(element)] = std::move(result);
            result = std::move(wrapped);
        }
    }
    return result;
}

auto quote_key(const std::string& key) -> std::string {
    return Json(key).dump(-1, ' ', false, Json::error_handler_t::replace);
}

auto reaches_into_array(const Path& path) -> Exception {
    return Exception{ErrorKind::invalid_operation,
                     "path '" + to_string(path) + "' reaches into an array"};
}

}  // anonymous namespace

PropertyEditor::PropertyEditor(FormattingOptions formatting)
    : formatting_{std::move(formatting)} {}

auto PropertyEditor::edit_for_set(std::string_view text, const Path& path, const Json& value) const
    -> std::vector<TextEdit> {
    auto tree = parse_tree(text, tolerant);
    if (!tree) {
        return {TextEdit{0, text.size(), detail::render_value(wrap(path, 0, value), formatting_, "", true)}};
    }

    const SyntaxNode* parent = nullptr;
    const SyntaxNode* node = &*tree;
    for (auto i = std::size_t{0}; i < path.size(); ++i) {
        if (node->type == NodeType::array) throw reaches_into_array(path);
        if (node->type != NodeType::object) {
            throw Exception{ErrorKind::invalid_path,
                            "cannot set '" + to_string(path) + "': parent is not an object"};
        }
        auto key = to_key(path[i]);
        const auto* property = find_property(*node, key);
        if (!property) {
            // Insert after the last property, or right after '{' when empty
            auto inserted = wrap(path, i + 1, value);
            const auto& object = *node;
            auto base = detail::line_indent(text, object.offset);
            const auto& eol = formatting_.eol;
            if (object.children.empty()) {
                auto indent = base + detail::indent_unit(formatting_);
                auto content = eol + indent + quote_key(key) + ": "
                             + detail::render_value(inserted, formatting_, indent, true);
                auto inner_begin = object.offset + 1;
                auto close = object.end() - 1;
                if (!detail::spans_lines(text, object.offset, close)) {
                    content += eol + base;
                    if (detail::is_blank(text.substr(inner_begin, close - inner_begin))) {
                        return {TextEdit{inner_begin, close - inner_begin, std::move(content)}};
                    }
                }
                return {TextEdit{inner_begin, 0, std::move(content)}};
            }
            const auto& last = object.children.back();
            if (!detail::spans_lines(text, object.offset, object.end())) {
                return {TextEdit{last.end(), 0, ", " + quote_key(key) + ": "
                                 + detail::render_value(inserted, formatting_, "", false)}};
            }
            auto indent = detail::starts_line(text, last.offset)
                ? detail::line_indent(text, last.offset)
                : base + detail::indent_unit(formatting_);
            return {TextEdit{last.end(), 0, "," + eol + indent + quote_key(key) + ": "
                             + detail::render_value(inserted, formatting_, indent, true)}};
        }
        parent = node;
        node = &property->children[1];
    }

    auto multiline = parent == nullptr || detail::spans_lines(text, parent->offset, parent->end());
    auto indent = detail::line_indent(text, node->offset);
    return {TextEdit{node->offset, node->length,
                     detail::render_value(value, formatting_, indent, multiline)}};
}

auto PropertyEditor::edit_for_delete(std::string_view text, const Path& path) const
    -> std::vector<TextEdit> {
    if (path.empty()) {
        throw Exception{ErrorKind::invalid_operation, "cannot delete the document root"};
    }
    auto tree = parse_tree(text, tolerant);
    if (!tree) return {};

    const SyntaxNode* node = &*tree;
    for (auto i = std::size_t{0}; i + 1 < path.size(); ++i) {
        if (node->type == NodeType::array) throw reaches_into_array(path);
        const auto* property = find_property(*node, to_key(path[i]));
        if (!property) return {};
        node = &property->children[1];
    }
    if (node->type == NodeType::array) throw reaches_into_array(path);
    if (node->type != NodeType::object) return {};

    auto key = to_key(path.back());
    auto found = std::optional<std::size_t>{};
    for (auto i = std::size_t{0}; i < node->children.size(); ++i) {
        if (node->children[i].children[0].value.get_ref<const std::string&>() == key) found = i;
    }
    if (!found) return {};
    return detail::remove_member(text, *node, *found, true);
}

auto make_default_editor(FormattingOptions formatting) -> std::shared_ptr<const PathEditor> {
    return std::make_shared<ArrayEditor>(std::make_shared<PropertyEditor>(std::move(formatting)));
}

auto modify(std::string_view text, const Path& path, const std::optional<Json>& value,
            const FormattingOptions& formatting) -> std::vector<TextEdit> {
    auto editor = ArrayEditor{std::make_shared<PropertyEditor>(formatting)};
    if (value) return editor.edit_for_set(text, path, *value);
    return editor.edit_for_delete(text, path);
}

}  // namespace jsonctc_cpp
