/// @file parser.hpp
/// @brief Parser for JSON with comments and trailing commas (JSONC).
///
/// Produces either a plain value or a concrete syntax tree that records the
/// byte range of every node. The syntax tree is what the text editors use to
/// locate the exact bytes to change.

#pragma once

#include <jsonctc-cpp/error.hpp>
#include <jsonctc-cpp/path.hpp>
#include <jsonctc-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonctc_cpp {

/// Options controlling which extensions to plain JSON are accepted.
struct ParseOptions {
    bool allow_trailing_comma{true};
    bool allow_comments{true};
    /// Empty or comment-only input parses to null instead of failing.
    bool allow_empty_content{false};
};

/// Why a parse failed.
enum class ParseErrorCode : std::uint8_t {
    invalid_symbol,
    invalid_number_format,
    property_name_expected,
    value_expected,
    colon_expected,
    comma_expected,
    close_brace_expected,
    close_bracket_expected,
    end_of_file_expected,
    invalid_comment_token,
    unexpected_end_of_comment,
    unexpected_end_of_string,
    unexpected_end_of_number,
    invalid_unicode,
    invalid_escape_character,
    invalid_character,
};

/// Convert a ParseErrorCode to its string representation.
auto to_string_view(ParseErrorCode code) noexcept -> std::string_view;

/// The location and cause of a parse failure. Lines and columns are 1-based.
struct ParseError {
    ParseErrorCode code;
    std::size_t offset;
    std::size_t length;
    std::size_t line;
    std::size_t column;

    auto operator==(const ParseError& other) const -> bool = default;
};

/// Raised when source text is not valid JSONC. kind() is parse_error.
class ParseException : public Exception {
public:
    explicit ParseException(ParseError detail);

    auto detail() const noexcept -> const ParseError& { return detail_; }

private:
    ParseError detail_;
};

/// The kinds of node in a syntax tree.
enum class NodeType : std::uint8_t {
    object,
    array,
    property,
    string,
    number,
    boolean,
    null,
};

/// A node of the concrete syntax tree.
///
/// Objects have property children; a property has exactly two children,
/// the key (a string node) and the value. Arrays have one child per element.
/// Leaves carry their decoded value.
struct SyntaxNode {
    NodeType type{NodeType::null};
    std::size_t offset{0};
    std::size_t length{0};
    std::optional<std::size_t> colon_offset;  ///< properties only
    Json value;                               ///< leaves only
    std::vector<SyntaxNode> children;

    auto end() const noexcept -> std::size_t { return offset + length; }
};

/// Parse text into a syntax tree.
///
/// Returns nullopt only for empty content with allow_empty_content set.
/// @throws ParseException at the first syntax error.
auto parse_tree(std::string_view text, const ParseOptions& options = {})
    -> std::optional<SyntaxNode>;

/// Parse text into a plain value. Duplicate keys: the last value wins.
/// @throws ParseException at the first syntax error.
auto parse(std::string_view text, const ParseOptions& options = {}) -> Json;

/// Convert any subtree into a plain value.
auto node_value(const SyntaxNode& node) -> Json;

/// Resolve a path against a syntax tree.
///
/// Returns the value node at @p path, or nullptr if it does not exist.
/// Object lookups use the last property with a matching key.
auto find_node_at_location(const SyntaxNode& root, const Path& path) -> const SyntaxNode*;

/// Locate the property node for @p key in an object node, or nullptr.
auto find_property(const SyntaxNode& object, std::string_view key) -> const SyntaxNode*;

}  // namespace jsonctc_cpp
