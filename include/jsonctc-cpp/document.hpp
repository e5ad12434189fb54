/// @file document.hpp
/// @brief The Document class -- the primary API for jsonctc-cpp.

#pragma once

#include <jsonctc-cpp/edit.hpp>
#include <jsonctc-cpp/parser.hpp>
#include <jsonctc-cpp/path.hpp>
#include <jsonctc-cpp/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonctc_cpp {

namespace detail {
struct DocState;
}  // namespace detail

/// Index of a node in its document's node arena.
using NodeId = std::size_t;

class Node;

/// What a read returns: a nested object/array node, or a plain value.
using Entry = std::variant<Node, Json>;

/// The collected edits of a document, as full paths from the root.
struct Diff {
    std::vector<std::pair<Path, Json>> changes;
    std::vector<Path> deletions;
};

/// A handle to one object or array inside a Document.
///
/// A Node records writes locally (changed keys, deleted keys, nested
/// nodes) instead of copying the parsed value, so the document can later
/// be written back by editing only the affected bytes of the source text.
///
/// Handles are cheap to copy. They stay valid while the owning Document
/// is alive, including across moves of the Document. A handle whose node
/// was replaced or deleted is detached: reads see its last state and
/// writes raise invalid_operation.
///
/// On arrays, keys are indices into the parsed array; deleting an element
/// does not renumber the others until the document is written.
class Node {
public:
    /// Read an entry. Nested objects and arrays come back as Nodes.
    auto get(std::string_view key) const -> std::optional<Entry>;
    auto get(std::size_t index) const -> std::optional<Entry>;

    /// Read an entry as a plain value, materializing nested nodes.
    auto value(std::string_view key) const -> std::optional<Json>;
    auto value(std::size_t index) const -> std::optional<Json>;

    /// The nested node at a key, if the entry is an object or array.
    auto child(std::string_view key) const -> std::optional<Node>;
    auto child(std::size_t index) const -> std::optional<Node>;

    /// Assign a value. Arrays assigned over an existing array node are
    /// reconciled element by element; equal values are not recorded.
    /// @throws Exception invalid_path for a non-index key on an array,
    ///         invalid_operation if this node is detached or a primitive.
    void set(std::string_view key, Json value);
    void set(std::size_t index, Json value);

    /// Remove an entry. Removing a missing entry has no effect.
    void erase(std::string_view key);
    void erase(std::size_t index);

    auto contains(std::string_view key) const -> bool;
    auto contains(std::size_t index) const -> bool;

    /// Visible keys: strings for objects, indices for arrays.
    auto keys() const -> std::vector<PathElement>;
    auto size() const -> std::size_t;

    auto is_object() const -> bool;
    auto is_array() const -> bool;
    auto is_attached() const -> bool;

    /// Location of this node from the document root.
    auto path() const -> Path;

    /// The current value: parsed baseline plus every recorded change.
    auto materialize() const -> Json;

    auto id() const noexcept -> NodeId { return id_; }

    auto operator==(const Node& other) const -> bool = default;

private:
    friend class Document;
    friend struct detail::DocState;

    Node(detail::DocState* state, NodeId id) : state_{state}, id_{id} {}

    detail::DocState* state_;
    NodeId id_;
};

/// A JSONC document that keeps its comments and formatting when edited.
///
/// @code
/// auto doc = Document::parse(R"({
///   // listen port
///   "port": 8080
/// })");
/// doc.update("port", 9090);
/// auto text = doc.to_string();  // the comment is still there
/// @endcode
class Document {
public:
    /// An empty object with no source text.
    Document();

    /// Parse source text. The text is kept for surgical write-back.
    /// @throws ParseException if the text is not valid JSONC.
    static auto parse(std::string_view text, const ParseOptions& options = {}) -> Document;

    /// Track a plain value, optionally backed by the text it came from.
    static auto from_value(Json value, std::optional<std::string> source = std::nullopt)
        -> Document;

    ~Document();

    Document(Document&&) noexcept;
    auto operator=(Document&&) noexcept -> Document&;

    /// Deep-copy a document. The copy shares only immutable source data.
    Document(const Document&);
    auto operator=(const Document&) -> Document&;

    // -- Access ---------------------------------------------------------------

    /// The root node. For a primitive root it has no keys.
    auto root() -> Node;

    /// The source text, if the document has one.
    auto source() const -> std::optional<std::string_view>;

    /// The current value of the whole document.
    auto materialize() const -> Json;

    // -- Typed path accessors -------------------------------------------------

    /// Read the value at a dotted path ("server.port") or Path.
    ///
    /// Returns @p default_value when the path is missing or the value's
    /// type differs. When both are objects the result is a deep merge in
    /// which the document's keys win.
    auto extract(std::string_view path, Json default_value) const -> Json;
    auto extract(const Path& path, Json default_value) const -> Json;

    /// String-literal defaults read as std::string.
    auto extract(std::string_view path, const char* default_value) const -> std::string;

    /// Typed read through nlohmann's get<T>().
    template <typename T>
    auto extract(std::string_view path, T default_value) const -> T {
        return extract(path, Json(std::move(default_value))).template get<T>();
    }

    template <typename T>
    auto extract(const Path& path, T default_value) const -> T {
        return extract(path, Json(std::move(default_value))).template get<T>();
    }

    /// Write the value at a path, creating missing intermediate objects.
    /// @throws Exception invalid_path for the root or a non-object parent.
    void update(std::string_view path, Json value);
    void update(const Path& path, Json value);

    // -- Serialization --------------------------------------------------------

    /// All recorded edits, as full paths.
    auto diff() const -> Diff;

    /// The document as text.
    ///
    /// With source text, only the edited values are rewritten. If that
    /// fails for any reason the whole value is printed instead (2-space
    /// indent) and a warning is logged. Always ends with one newline.
    auto to_string() const -> std::string;

    /// Replace the editor used by to_string(). nullptr restores the default.
    void set_editor(std::shared_ptr<const PathEditor> editor);

private:
    explicit Document(std::unique_ptr<detail::DocState> state);

    auto fallback_text() const -> std::string;

    std::unique_ptr<detail::DocState> state_;
};

}  // namespace jsonctc_cpp
