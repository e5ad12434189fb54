#pragma once

// Internal header: text layout helpers shared by the editors and formatter.

#include <jsonctc-cpp/edit.hpp>
#include <jsonctc-cpp/error.hpp>
#include <jsonctc-cpp/parser.hpp>
#include <jsonctc-cpp/value.hpp>

#include "scanner.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jsonctc_cpp::detail {

inline auto line_start(std::string_view text, std::size_t offset) -> std::size_t {
    while (offset > 0 && !is_line_break(text[offset - 1])) --offset;
    return offset;
}

/// Leading whitespace of the line containing @p offset.
inline auto line_indent(std::string_view text, std::size_t offset) -> std::string {
    auto start = line_start(text, offset);
    auto end = start;
    while (end < text.size() && is_horizontal_space(text[end])) ++end;
    return std::string{text.substr(start, end - start)};
}

/// True if only horizontal whitespace precedes @p offset on its line.
inline auto starts_line(std::string_view text, std::size_t offset) -> bool {
    for (auto i = line_start(text, offset); i < offset; ++i) {
        if (!is_horizontal_space(text[i])) return false;
    }
    return true;
}

inline auto spans_lines(std::string_view text, std::size_t begin, std::size_t end) -> bool {
    for (auto i = begin; i < end && i < text.size(); ++i) {
        if (is_line_break(text[i])) return true;
    }
    return false;
}

inline auto is_blank(std::string_view text) -> bool {
    for (char c : text) {
        if (!is_horizontal_space(c) && !is_line_break(c)) return false;
    }
    return true;
}

/// Position after the line break at @p pos, or @p pos if there is none.
inline auto skip_line_break(std::string_view text, std::size_t pos) -> std::size_t {
    if (pos < text.size() && text[pos] == '\r') {
        ++pos;
        if (pos < text.size() && text[pos] == '\n') ++pos;
    } else if (pos < text.size() && text[pos] == '\n') {
        ++pos;
    }
    return pos;
}

inline auto skip_horizontal_space(std::string_view text, std::size_t pos) -> std::size_t {
    while (pos < text.size() && is_horizontal_space(text[pos])) ++pos;
    return pos;
}

/// The first token at or after @p pos that is not whitespace or a comment.
inline auto next_significant(std::string_view text, std::size_t pos) -> Token {
    auto scanner = Scanner{text.substr(pos), true};
    while (true) {
        auto token = scanner.scan();
        if (!is_comment(token.kind)) {
            token.offset += pos;
            return token;
        }
    }
}

inline auto is_comment_line(std::string_view line) -> bool {
    auto scanner = Scanner{line, true};
    auto found = false;
    while (true) {
        const auto& token = scanner.scan();
        if (token.kind == TokenKind::eof) return found;
        if (!is_comment(token.kind) || token.error != ScanError::none) return false;
        found = true;
    }
}

/// Move a line-start offset up over comment-only lines directly above it.
inline auto absorb_leading_comments(std::string_view text, std::size_t start) -> std::size_t {
    while (start > 0) {
        auto line_end = start - 1;
        if (text[line_end] == '\n' && line_end > 0 && text[line_end - 1] == '\r') --line_end;
        auto previous = line_start(text, line_end);
        if (!is_comment_line(text.substr(previous, line_end - previous))) break;
        start = previous;
    }
    return start;
}

inline auto indent_unit(const FormattingOptions& formatting) -> std::string {
    return formatting.insert_spaces ? std::string(formatting.tab_size, ' ') : std::string{"\t"};
}

/// Serialize a value for insertion into text.
///
/// Multi-line output continues at @p indent on each following line.
inline auto render_value(const Json& value, const FormattingOptions& formatting,
                         std::string_view indent, bool multiline) -> std::string {
    if (!multiline || !is_structured(value) || value.empty()) {
        return value.dump(-1, ' ', false, Json::error_handler_t::replace);
    }
    auto pretty = formatting.insert_spaces
        ? value.dump(static_cast<int>(formatting.tab_size), ' ', false, Json::error_handler_t::replace)
        : value.dump(1, '\t', false, Json::error_handler_t::replace);
    auto result = std::string{};
    result.reserve(pretty.size());
    for (char c : pretty) {
        if (c == '\n') {
            result += formatting.eol;
            result += indent;
        } else {
            result.push_back(c);
        }
    }
    return result;
}

/// Remove a member by its line when it owns one, otherwise the member and
/// the whitespace in front of it.
inline auto remove_by_line(std::string_view text, std::size_t begin, std::size_t end,
                           bool leading_comments) -> TextEdit {
    auto stop = skip_horizontal_space(text, end);
    auto after = skip_line_break(text, stop);
    if (after != stop && starts_line(text, begin)) {
        auto start = line_start(text, begin);
        if (leading_comments) start = absorb_leading_comments(text, start);
        return TextEdit{start, after - start, {}};
    }
    // A comment left behind keeps the member's indentation
    auto tail = text.substr(stop, 2);
    if (starts_line(text, begin) && (tail == "//" || tail == "/*")) {
        return TextEdit{begin, stop - begin, {}};
    }
    auto start = begin;
    while (start > 0 && is_horizontal_space(text[start - 1])) --start;
    return TextEdit{start, end - start, {}};
}

/// Edits removing member @p index (a property or an element) of @p container.
///
/// At most one comma and one line terminator after the member are taken.
/// A last member without a trailing comma gives up the comma in front of it
/// instead, so the container never gains a trailing comma.
inline auto remove_member(std::string_view text, const SyntaxNode& container, std::size_t index,
                          bool leading_comments) -> std::vector<TextEdit> {
    const auto& members = container.children;
    const auto& member = members[index];
    auto begin = member.offset;
    auto end = member.end();

    auto next = next_significant(text, end);
    if (next.kind == TokenKind::comma) {
        auto stop = skip_horizontal_space(text, next.offset + 1);
        auto after = skip_line_break(text, stop);
        auto start = begin;
        if (after != stop && starts_line(text, begin)) {
            start = line_start(text, begin);
            if (leading_comments) start = absorb_leading_comments(text, start);
        }
        return {TextEdit{start, after - start, {}}};
    }

    if (index == 0) return {remove_by_line(text, begin, end, leading_comments)};

    auto comma = next_significant(text, members[index - 1].end());
    if (comma.kind != TokenKind::comma) {
        throw Exception{ErrorKind::edit_failed, "no separator before the member to remove"};
    }
    if (is_blank(text.substr(comma.offset + 1, begin - comma.offset - 1))) {
        return {TextEdit{comma.offset, end - comma.offset, {}}};
    }
    return {TextEdit{comma.offset, 1, {}}, remove_by_line(text, begin, end, leading_comments)};
}

}  // namespace jsonctc_cpp::detail
