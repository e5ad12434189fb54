#include <jsonctc-cpp/document.hpp>

#include <jsonctc-cpp/error.hpp>
#include <jsonctc-cpp/log.hpp>

#include "doc_state.hpp"

#include <algorithm>
#include <exception>

namespace jsonctc_cpp {

namespace {

using detail::DocState;
using detail::NodeState;

// =============================================================================
// Node state helpers
// =============================================================================

auto describe(const Path& path) -> std::string {
    return path.empty() ? std::string{"<root>"} : to_string(path);
}

auto child_path(const NodeState& node, const PathElement& key) -> Path {
    auto path = node.path;
    path.push_back(key);
    return path;
}

// The key as this node stores it, or nullopt if it can address nothing here.
auto normalize(const NodeState& node, const PathElement& key) -> std::optional<PathElement> {
    if (node.baseline->is_array()) {
        auto index = as_index(key);
        if (!index) return std::nullopt;
        return PathElement{*index};
    }
    return PathElement{to_key(key)};
}

auto baseline_entry(const NodeState& node, const PathElement& key) -> const Json* {
    const auto& base = *node.baseline;
    if (base.is_array()) {
        auto index = std::get<std::size_t>(key);
        return index < base.size() ? &base[index] : nullptr;
    }
    if (base.is_object()) {
        auto it = base.find(std::get<std::string>(key));
        return it != base.end() ? &*it : nullptr;
    }
    return nullptr;
}

// Array length counting deleted slots; appends past the end extend it.
auto slot_count(const NodeState& node) -> std::size_t {
    auto length = node.baseline->size();
    for (const auto& [key, value] : node.changes) {
        length = std::max(length, std::get<std::size_t>(key) + 1);
    }
    for (const auto& [key, child] : node.children) {
        length = std::max(length, std::get<std::size_t>(key) + 1);
    }
    return length;
}

auto visible_keys(const NodeState& node) -> std::vector<PathElement> {
    auto keys = std::vector<PathElement>{};
    const auto& base = *node.baseline;
    if (base.is_object()) {
        for (const auto& [key, value] : base.items()) {
            auto element = PathElement{key};
            if (!node.deletions.contains(element)) keys.push_back(std::move(element));
        }
        keys.insert(keys.end(), node.added.begin(), node.added.end());
    } else if (base.is_array()) {
        auto length = slot_count(node);
        for (std::size_t i = 0; i < length; ++i) {
            if (!node.deletions.contains(PathElement{i})) keys.emplace_back(i);
        }
    }
    return keys;
}

auto materialize(const DocState& state, NodeId id) -> Json;

auto effective(const DocState& state, NodeId id, const PathElement& key) -> std::optional<Json> {
    const auto& node = state.nodes[id];
    if (node.deletions.contains(key)) return std::nullopt;
    if (auto it = node.children.find(key); it != node.children.end()) {
        return materialize(state, it->second);
    }
    if (auto it = node.find_change(key); it != node.changes.end()) return it->second;
    if (const auto* base = baseline_entry(node, key)) return *base;
    return std::nullopt;
}

auto materialize(const DocState& state, NodeId id) -> Json {
    const auto& node = state.nodes[id];
    const auto& base = *node.baseline;
    if (base.is_object()) {
        auto result = Json::object();
        for (const auto& key : visible_keys(node)) {
            if (auto value = effective(state, id, key)) {
                result[std::get<std::string>(key)] = std::move(*value);
            }
        }
        return result;
    }
    if (base.is_array()) {
        auto result = Json::array();
        for (const auto& key : visible_keys(node)) {
            result.push_back(effective(state, id, key).value_or(Json(nullptr)));
        }
        return result;
    }
    return base;
}

void check_writable(const NodeState& node) {
    if (!node.attached) {
        throw Exception{ErrorKind::invalid_operation,
                        "node at '" + describe(node.path) + "' is detached"};
    }
    if (!is_structured(*node.baseline)) {
        throw Exception{ErrorKind::invalid_operation,
                        "cannot write into the primitive value at '" + describe(node.path) + "'"};
    }
}

// =============================================================================
// Node operations
// =============================================================================

auto get_entry(DocState& state, NodeId id, const PathElement& raw) -> std::optional<Entry> {
    const auto& node = state.nodes[id];
    auto key = normalize(node, raw);
    if (!key || node.deletions.contains(*key)) return std::nullopt;
    if (auto it = node.children.find(*key); it != node.children.end()) {
        return Entry{state.handle(it->second)};
    }
    if (auto it = node.find_change(*key); it != node.changes.end()) return Entry{it->second};
    if (const auto* base = baseline_entry(node, *key)) return Entry{*base};
    // Padding before an appended element
    if (node.baseline->is_array() && std::get<std::size_t>(*key) < slot_count(node)) {
        return Entry{Json(nullptr)};
    }
    return std::nullopt;
}

auto child_node(DocState& state, NodeId id, const PathElement& raw) -> std::optional<Node> {
    auto& node = state.nodes[id];
    auto key = normalize(node, raw);
    if (!key || node.deletions.contains(*key)) return std::nullopt;
    if (auto it = node.children.find(*key); it != node.children.end()) {
        return state.handle(it->second);
    }
    auto change = node.find_change(*key);
    if (change == node.changes.end() || !is_structured(change->second)) return std::nullopt;

    // Promote the assigned structure to a fresh node of its own
    auto anchor = std::make_shared<const Json>(std::move(change->second));
    node.changes.erase(change);
    auto path = child_path(node, *key);
    auto child = state.wrap(std::move(path), anchor, anchor.get(), true);
    state.nodes[id].children.emplace(*key, child);
    return state.handle(child);
}

void erase_entry(DocState& state, NodeId id, const PathElement& raw);

void set_entry(DocState& state, NodeId id, const PathElement& raw, Json value);

void reconcile(DocState& state, NodeId id, const Json& array) {
    auto length = std::max(slot_count(state.nodes[id]), array.size());
    for (std::size_t i = 0; i < length; ++i) {
        if (i < array.size()) {
            set_entry(state, id, PathElement{i}, array[i]);
        } else {
            erase_entry(state, id, PathElement{i});
        }
    }
}

void set_entry(DocState& state, NodeId id, const PathElement& raw, Json value) {
    check_writable(state.nodes[id]);
    auto key = normalize(state.nodes[id], raw);
    if (!key) {
        throw Exception{ErrorKind::invalid_path,
                        "cannot set '" + to_string(child_path(state.nodes[id], raw))
                            + "': '" + to_key(raw) + "' is not an array index"};
    }

    auto current = effective(state, id, *key);
    if (current && *current == value) return;

    if (auto it = state.nodes[id].children.find(*key); it != state.nodes[id].children.end()) {
        auto child = it->second;
        if (value.is_array() && state.nodes[child].baseline->is_array()) {
            reconcile(state, child, value);
            return;
        }
        state.detach(child);
        state.nodes[id].children.erase(it);
    }

    auto& node = state.nodes[id];
    node.deletions.erase(*key);
    if (auto it = node.find_change(*key); it != node.changes.end()) {
        it->second = std::move(value);
    } else {
        node.changes.emplace_back(*key, std::move(value));
    }
    if (node.baseline->is_object() && !baseline_entry(node, *key)
        && std::find(node.added.begin(), node.added.end(), *key) == node.added.end()) {
        node.added.push_back(*key);
    }
}

void erase_entry(DocState& state, NodeId id, const PathElement& raw) {
    check_writable(state.nodes[id]);
    auto key = normalize(state.nodes[id], raw);
    if (!key) return;

    if (auto it = state.nodes[id].children.find(*key); it != state.nodes[id].children.end()) {
        state.detach(it->second);
        state.nodes[id].children.erase(it);
    }
    auto& node = state.nodes[id];
    if (auto it = node.find_change(*key); it != node.changes.end()) node.changes.erase(it);
    std::erase(node.added, *key);
    if (baseline_entry(node, *key)) node.deletions.insert(*key);
}

auto contains_entry(const DocState& state, NodeId id, const PathElement& raw) -> bool {
    const auto& node = state.nodes[id];
    auto key = normalize(node, raw);
    if (!key || node.deletions.contains(*key)) return false;
    if (node.baseline->is_array()) return std::get<std::size_t>(*key) < slot_count(node);
    return node.children.contains(*key) || node.find_change(*key) != node.changes.end()
        || baseline_entry(node, *key) != nullptr;
}

auto entry_value(DocState& state, NodeId id, const PathElement& raw) -> std::optional<Json> {
    auto entry = get_entry(state, id, raw);
    if (!entry) return std::nullopt;
    return std::visit(overload{
        [](const Node& node) { return node.materialize(); },
        [](const Json& value) { return value; },
    }, *entry);
}

// =============================================================================
// Diff and serialization helpers
// =============================================================================

void collect(const DocState& state, NodeId id, Diff& diff) {
    const auto& node = state.nodes[id];
    for (const auto& [key, value] : node.changes) {
        diff.changes.emplace_back(child_path(node, key), value);
    }
    for (const auto& key : node.deletions) {
        diff.deletions.push_back(child_path(node, key));
    }
    for (const auto& [key, child] : node.children) {
        if (state.nodes[child].fresh) {
            diff.changes.emplace_back(state.nodes[child].path, materialize(state, child));
        } else {
            collect(state, child, diff);
        }
    }
}

auto element_less(const PathElement& a, const PathElement& b) -> bool {
    const auto* ai = std::get_if<std::size_t>(&a);
    const auto* bi = std::get_if<std::size_t>(&b);
    if (ai && bi) return *ai < *bi;
    return to_key(a) < to_key(b);
}

auto path_less(const Path& a, const Path& b) -> bool {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), element_less);
}

// Rebase index segments onto the array after deletions have been applied.
auto shift_indices(const Path& path, const std::vector<Path>& deletions) -> Path {
    auto shifted = path;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto* index = std::get_if<std::size_t>(&path[i]);
        if (!index) continue;
        auto removed = std::size_t{0};
        for (const auto& deleted : deletions) {
            if (deleted.size() != i + 1) continue;
            const auto* gone = std::get_if<std::size_t>(&deleted[i]);
            if (gone && *gone < *index
                && std::equal(deleted.begin(), deleted.begin() + static_cast<std::ptrdiff_t>(i),
                              path.begin())) {
                ++removed;
            }
        }
        shifted[i] = *index - removed;
    }
    return shifted;
}

// Collapse a trailing run of line terminators to exactly one
auto with_final_newline(std::string text) -> std::string {
    auto eol = std::string{"\n"};
    if (text.size() >= 2 && text.ends_with("\r\n")) eol = "\r\n";
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    return text + eol;
}

auto make_state(Json value, std::shared_ptr<const std::string> source)
    -> std::unique_ptr<DocState> {
    auto state = std::make_unique<DocState>();
    state->source = std::move(source);
    state->snapshot = std::make_shared<const Json>(std::move(value));
    state->editor = make_default_editor();
    state->wrap({}, state->snapshot, state->snapshot.get(), false);
    return state;
}

auto lookup(const Json& value, const PathElement& element) -> std::optional<Json> {
    if (value.is_object()) {
        auto it = value.find(to_key(element));
        if (it == value.end()) return std::nullopt;
        return *it;
    }
    if (value.is_array()) {
        auto index = as_index(element);
        if (!index || *index >= value.size()) return std::nullopt;
        return value[*index];
    }
    return std::nullopt;
}

// Keys of overlay win; objects present on both sides merge recursively.
auto deep_merge(Json base, const Json& overlay) -> Json {
    for (const auto& [key, value] : overlay.items()) {
        auto it = base.find(key);
        if (it != base.end() && it->is_object() && value.is_object()) {
            *it = deep_merge(std::move(*it), value);
        } else {
            base[key] = value;
        }
    }
    return base;
}

}  // anonymous namespace

// =============================================================================
// Node
// =============================================================================

auto Node::get(std::string_view key) const -> std::optional<Entry> {
    return get_entry(*state_, id_, PathElement{std::string{key}});
}

auto Node::get(std::size_t index) const -> std::optional<Entry> {
    return get_entry(*state_, id_, PathElement{index});
}

auto Node::value(std::string_view key) const -> std::optional<Json> {
    return entry_value(*state_, id_, PathElement{std::string{key}});
}

auto Node::value(std::size_t index) const -> std::optional<Json> {
    return entry_value(*state_, id_, PathElement{index});
}

auto Node::child(std::string_view key) const -> std::optional<Node> {
    return child_node(*state_, id_, PathElement{std::string{key}});
}

auto Node::child(std::size_t index) const -> std::optional<Node> {
    return child_node(*state_, id_, PathElement{index});
}

void Node::set(std::string_view key, Json value) {
    set_entry(*state_, id_, PathElement{std::string{key}}, std::move(value));
}

void Node::set(std::size_t index, Json value) {
    set_entry(*state_, id_, PathElement{index}, std::move(value));
}

void Node::erase(std::string_view key) {
    erase_entry(*state_, id_, PathElement{std::string{key}});
}

void Node::erase(std::size_t index) {
    erase_entry(*state_, id_, PathElement{index});
}

auto Node::contains(std::string_view key) const -> bool {
    return contains_entry(*state_, id_, PathElement{std::string{key}});
}

auto Node::contains(std::size_t index) const -> bool {
    return contains_entry(*state_, id_, PathElement{index});
}

auto Node::keys() const -> std::vector<PathElement> {
    return visible_keys(state_->nodes[id_]);
}

auto Node::size() const -> std::size_t {
    return keys().size();
}

auto Node::is_object() const -> bool {
    return state_->nodes[id_].baseline->is_object();
}

auto Node::is_array() const -> bool {
    return state_->nodes[id_].baseline->is_array();
}

auto Node::is_attached() const -> bool {
    return state_->nodes[id_].attached;
}

auto Node::path() const -> Path {
    return state_->nodes[id_].path;
}

auto Node::materialize() const -> Json {
    return jsonctc_cpp::materialize(*state_, id_);
}

// =============================================================================
// Document: construction
// =============================================================================

Document::Document()
    : state_{make_state(Json::object(), nullptr)} {}

Document::Document(std::unique_ptr<detail::DocState> state)
    : state_{std::move(state)} {}

auto Document::parse(std::string_view text, const ParseOptions& options) -> Document {
    auto value = jsonctc_cpp::parse(text, options);
    return Document{make_state(std::move(value), std::make_shared<const std::string>(text))};
}

auto Document::from_value(Json value, std::optional<std::string> source) -> Document {
    auto text = source ? std::make_shared<const std::string>(std::move(*source)) : nullptr;
    return Document{make_state(std::move(value), std::move(text))};
}

Document::~Document() = default;

Document::Document(Document&& other) noexcept
    : state_{std::move(other.state_)} {}

auto Document::operator=(Document&& other) noexcept -> Document& {
    if (this != &other) {
        state_ = std::move(other.state_);
    }
    return *this;
}

Document::Document(const Document& other)
    : state_{std::make_unique<detail::DocState>(*other.state_)} {}

auto Document::operator=(const Document& other) -> Document& {
    if (this != &other) {
        state_ = std::make_unique<detail::DocState>(*other.state_);
    }
    return *this;
}

// =============================================================================
// Document: access
// =============================================================================

auto Document::root() -> Node {
    return state_->handle(0);
}

auto Document::source() const -> std::optional<std::string_view> {
    if (!state_->source) return std::nullopt;
    return std::string_view{*state_->source};
}

auto Document::materialize() const -> Json {
    return jsonctc_cpp::materialize(*state_, 0);
}

// =============================================================================
// Document: typed path accessors
// =============================================================================

auto Document::extract(std::string_view path, Json default_value) const -> Json {
    return extract(parse_dotted(path), std::move(default_value));
}

auto Document::extract(std::string_view path, const char* default_value) const -> std::string {
    return extract(parse_dotted(path), Json(default_value)).get<std::string>();
}

auto Document::extract(const Path& path, Json default_value) const -> Json {
    const auto& state = *state_;
    auto id = NodeId{0};
    auto plain = std::optional<Json>{};
    for (const auto& element : path) {
        if (plain) {
            plain = lookup(*plain, element);
            if (!plain) return default_value;
            continue;
        }
        const auto& node = state.nodes[id];
        auto key = normalize(node, element);
        if (!key) return default_value;
        if (auto it = node.children.find(*key); it != node.children.end()) {
            id = it->second;
            continue;
        }
        plain = effective(state, id, *key);
        if (!plain) return default_value;
    }

    auto found = plain ? std::move(*plain) : jsonctc_cpp::materialize(state, id);
    if (kind_of(found) != kind_of(default_value)) return default_value;
    if (found.is_object()) return deep_merge(std::move(default_value), found);
    return found;
}

void Document::update(std::string_view path, Json value) {
    update(parse_dotted(path), std::move(value));
}

void Document::update(const Path& path, Json value) {
    if (path.empty()) throw Exception{ErrorKind::invalid_path, "cannot update root"};

    auto& state = *state_;
    auto id = NodeId{0};
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        auto next = child_node(state, id, path[i]);
        if (!next) {
            auto existing = entry_value(state, id, path[i]);
            if ((existing && !existing->is_null())
                || (!existing && !normalize(state.nodes[id], path[i]))) {
                throw Exception{ErrorKind::invalid_path,
                                "cannot update '" + jsonctc_cpp::to_string(path) + "': parent is not an object"};
            }
            set_entry(state, id, path[i], Json::object());
            next = child_node(state, id, path[i]);
        }
        id = next->id_;
    }
    set_entry(state, id, path.back(), std::move(value));
}

// =============================================================================
// Document: serialization
// =============================================================================

auto Document::diff() const -> Diff {
    auto result = Diff{};
    collect(*state_, 0, result);
    return result;
}

auto Document::fallback_text() const -> std::string {
    return materialize().dump(2, ' ', false, Json::error_handler_t::replace) + "\n";
}

auto Document::to_string() const -> std::string {
    const auto& state = *state_;
    if (!state.source) return fallback_text();

    try {
        auto collected = diff();
        auto text = *state.source;

        // Highest paths first, so no deletion moves one still pending
        std::sort(collected.deletions.begin(), collected.deletions.end(),
                  [](const Path& a, const Path& b) { return path_less(b, a); });
        for (const auto& path : collected.deletions) {
            text = apply_edits(text, state.editor->edit_for_delete(text, path));
        }
        for (const auto& [path, value] : collected.changes) {
            auto target = shift_indices(path, collected.deletions);
            text = apply_edits(text, state.editor->edit_for_set(text, target, value));
        }
        return with_final_newline(std::move(text));
    } catch (const std::exception& e) {
        detail::log_warning("serializer",
                            std::string{"surgical write-back failed, printing the whole document: "}
                                + e.what());
        return fallback_text();
    }
}

void Document::set_editor(std::shared_ptr<const PathEditor> editor) {
    state_->editor = editor ? std::move(editor) : make_default_editor();
}

}  // namespace jsonctc_cpp
