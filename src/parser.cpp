#include <jsonctc-cpp/parser.hpp>

#include "syntax/scanner.hpp"

#include <charconv>
#include <cstdint>

namespace jsonctc_cpp {

auto to_string_view(ParseErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ParseErrorCode::invalid_symbol:            return "invalid_symbol";
        case ParseErrorCode::invalid_number_format:     return "invalid_number_format";
        case ParseErrorCode::property_name_expected:    return "property_name_expected";
        case ParseErrorCode::value_expected:            return "value_expected";
        case ParseErrorCode::colon_expected:            return "colon_expected";
        case ParseErrorCode::comma_expected:            return "comma_expected";
        case ParseErrorCode::close_brace_expected:      return "close_brace_expected";
        case ParseErrorCode::close_bracket_expected:    return "close_bracket_expected";
        case ParseErrorCode::end_of_file_expected:      return "end_of_file_expected";
        case ParseErrorCode::invalid_comment_token:     return "invalid_comment_token";
        case ParseErrorCode::unexpected_end_of_comment: return "unexpected_end_of_comment";
        case ParseErrorCode::unexpected_end_of_string:  return "unexpected_end_of_string";
        case ParseErrorCode::unexpected_end_of_number:  return "unexpected_end_of_number";
        case ParseErrorCode::invalid_unicode:           return "invalid_unicode";
        case ParseErrorCode::invalid_escape_character:  return "invalid_escape_character";
        case ParseErrorCode::invalid_character:         return "invalid_character";
    }
    return "unknown";
}

namespace {

auto describe(const ParseError& error) -> std::string {
    return "parse error: " + std::string{to_string_view(error.code)}
         + " at line " + std::to_string(error.line)
         + ", column " + std::to_string(error.column);
}

}  // anonymous namespace

ParseException::ParseException(ParseError detail)
    : Exception{ErrorKind::parse_error, describe(detail)}, detail_{detail} {}

namespace {

using detail::Scanner;
using detail::ScanError;
using detail::TokenKind;

// Nesting beyond this is rejected rather than risking the stack
constexpr auto max_depth = std::size_t{512};

auto to_number(std::string_view text) -> std::optional<Json> {
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    if (text.find_first_of(".eE") == std::string_view::npos) {
        auto i = std::int64_t{0};
        auto [ptr, ec] = std::from_chars(first, last, i);
        if (ec == std::errc{} && ptr == last) return Json(i);
        if (text.front() != '-') {
            auto u = std::uint64_t{0};
            auto [uptr, uec] = std::from_chars(first, last, u);
            if (uec == std::errc{} && uptr == last) return Json(u);
        }
    }
    auto d = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, d);
    if (ec == std::errc{} && ptr == last) return Json(d);
    return std::nullopt;
}

auto scan_error_code(ScanError error) -> ParseErrorCode {
    switch (error) {
        case ScanError::unexpected_end_of_comment: return ParseErrorCode::unexpected_end_of_comment;
        case ScanError::unexpected_end_of_string:  return ParseErrorCode::unexpected_end_of_string;
        case ScanError::unexpected_end_of_number:  return ParseErrorCode::unexpected_end_of_number;
        case ScanError::invalid_unicode:           return ParseErrorCode::invalid_unicode;
        case ScanError::invalid_escape_character:  return ParseErrorCode::invalid_escape_character;
        case ScanError::invalid_character:         return ParseErrorCode::invalid_character;
        case ScanError::none:                      break;
    }
    return ParseErrorCode::invalid_symbol;
}

class TreeParser {
public:
    TreeParser(std::string_view text, const ParseOptions& options)
        : scanner_{text, true}, options_{options} {}

    auto run() -> std::optional<SyntaxNode> {
        advance();
        if (kind() == TokenKind::eof) {
            if (options_.allow_empty_content) return std::nullopt;
            fail(ParseErrorCode::value_expected);
        }
        auto root = parse_value(0);
        if (kind() != TokenKind::eof) fail(ParseErrorCode::end_of_file_expected);
        return root;
    }

private:
    auto kind() const -> TokenKind { return scanner_.token().kind; }

    // Moves to the next significant token, rejecting scan errors and,
    // unless allowed, comments.
    void advance() {
        while (true) {
            const auto& token = scanner_.scan();
            if (token.error != ScanError::none) fail(scan_error_code(token.error));
            if (detail::is_comment(token.kind)) {
                if (!options_.allow_comments) fail(ParseErrorCode::invalid_comment_token);
                continue;
            }
            if (token.kind == TokenKind::unknown) fail(ParseErrorCode::invalid_symbol);
            return;
        }
    }

    [[noreturn]] void fail(ParseErrorCode code) const {
        const auto& token = scanner_.token();
        auto text = scanner_.text();
        auto line = std::size_t{1};
        auto line_start = std::size_t{0};
        for (auto i = std::size_t{0}; i < token.offset && i < text.size(); ++i) {
            if (text[i] == '\n' || (text[i] == '\r' && (i + 1 >= text.size() || text[i + 1] != '\n'))) {
                ++line;
                line_start = i + 1;
            }
        }
        throw ParseException{ParseError{code, token.offset, token.length, line,
                                        token.offset - line_start + 1}};
    }

    auto leaf(NodeType type, Json value) -> SyntaxNode {
        const auto& token = scanner_.token();
        auto node = SyntaxNode{};
        node.type = type;
        node.offset = token.offset;
        node.length = token.length;
        node.value = std::move(value);
        advance();
        return node;
    }

    auto parse_value(std::size_t depth) -> SyntaxNode {
        if (depth > max_depth) fail(ParseErrorCode::invalid_symbol);
        const auto& token = scanner_.token();
        switch (token.kind) {
            case TokenKind::open_brace:    return parse_object(depth);
            case TokenKind::open_bracket:  return parse_array(depth);
            case TokenKind::string:        return leaf(NodeType::string, Json(token.value));
            case TokenKind::true_keyword:  return leaf(NodeType::boolean, Json(true));
            case TokenKind::false_keyword: return leaf(NodeType::boolean, Json(false));
            case TokenKind::null_keyword:  return leaf(NodeType::null, Json(nullptr));
            case TokenKind::number: {
                auto number = to_number(token.value);
                if (!number) fail(ParseErrorCode::invalid_number_format);
                return leaf(NodeType::number, std::move(*number));
            }
            default:
                fail(ParseErrorCode::value_expected);
        }
    }

    auto parse_property(std::size_t depth) -> SyntaxNode {
        auto property = SyntaxNode{};
        property.type = NodeType::property;
        property.offset = scanner_.token().offset;
        property.children.push_back(leaf(NodeType::string, Json(scanner_.token().value)));
        if (kind() != TokenKind::colon) fail(ParseErrorCode::colon_expected);
        property.colon_offset = scanner_.token().offset;
        advance();
        property.children.push_back(parse_value(depth + 1));
        property.length = property.children.back().end() - property.offset;
        return property;
    }

    auto parse_object(std::size_t depth) -> SyntaxNode {
        auto node = SyntaxNode{};
        node.type = NodeType::object;
        node.offset = scanner_.token().offset;
        advance();
        auto need_comma = false;
        auto after_comma = false;
        while (kind() != TokenKind::close_brace) {
            if (kind() == TokenKind::eof) fail(ParseErrorCode::close_brace_expected);
            if (need_comma) {
                if (kind() != TokenKind::comma) fail(ParseErrorCode::comma_expected);
                advance();
                need_comma = false;
                after_comma = true;
                continue;
            }
            if (kind() != TokenKind::string) fail(ParseErrorCode::property_name_expected);
            node.children.push_back(parse_property(depth));
            need_comma = true;
            after_comma = false;
        }
        if (after_comma && !options_.allow_trailing_comma) {
            fail(ParseErrorCode::property_name_expected);
        }
        node.length = scanner_.token().offset + scanner_.token().length - node.offset;
        advance();
        return node;
    }

    auto parse_array(std::size_t depth) -> SyntaxNode {
        auto node = SyntaxNode{};
        node.type = NodeType::array;
        node.offset = scanner_.token().offset;
        advance();
        auto need_comma = false;
        auto after_comma = false;
        while (kind() != TokenKind::close_bracket) {
            if (kind() == TokenKind::eof) fail(ParseErrorCode::close_bracket_expected);
            if (need_comma) {
                if (kind() != TokenKind::comma) fail(ParseErrorCode::comma_expected);
                advance();
                need_comma = false;
                after_comma = true;
                continue;
            }
            if (kind() == TokenKind::comma) fail(ParseErrorCode::value_expected);
            node.children.push_back(parse_value(depth + 1));
            need_comma = true;
            after_comma = false;
        }
        if (after_comma && !options_.allow_trailing_comma) {
            fail(ParseErrorCode::value_expected);
        }
        node.length = scanner_.token().offset + scanner_.token().length - node.offset;
        advance();
        return node;
    }

    Scanner scanner_;
    const ParseOptions& options_;
};

}  // anonymous namespace

auto parse_tree(std::string_view text, const ParseOptions& options)
    -> std::optional<SyntaxNode> {
    return TreeParser{text, options}.run();
}

auto parse(std::string_view text, const ParseOptions& options) -> Json {
    auto tree = parse_tree(text, options);
    if (!tree) return Json(nullptr);
    return node_value(*tree);
}

auto node_value(const SyntaxNode& node) -> Json {
    switch (node.type) {
        case NodeType::object: {
            auto result = Json::object();
            for (const auto& property : node.children) {
                const auto& key = property.children[0].value.get_ref<const std::string&>();
                result[key] = node_value(property.children[1]);
            }
            return result;
        }
        case NodeType::array: {
            auto result = Json::array();
            for (const auto& element : node.children) {
                result.push_back(node_value(element));
            }
            return result;
        }
        case NodeType::property:
            return node_value(node.children[1]);
        case NodeType::string:
        case NodeType::number:
        case NodeType::boolean:
        case NodeType::null:
            return node.value;
    }
    return Json(nullptr);
}

auto find_property(const SyntaxNode& object, std::string_view key) -> const SyntaxNode* {
    if (object.type != NodeType::object) return nullptr;
    const SyntaxNode* found = nullptr;
    for (const auto& property : object.children) {
        if (property.children[0].value.get_ref<const std::string&>() == key) found = &property;
    }
    return found;
}

auto find_node_at_location(const SyntaxNode& root, const Path& path) -> const SyntaxNode* {
    const auto* node = &root;
    for (const auto& element : path) {
        if (node->type == NodeType::object) {
            const auto* property = find_property(*node, to_key(element));
            if (!property) return nullptr;
            node = &property->children[1];
        } else if (node->type == NodeType::array) {
            auto index = as_index(element);
            if (!index || *index >= node->children.size()) return nullptr;
            node = &node->children[*index];
        } else {
            return nullptr;
        }
    }
    return node;
}

}  // namespace jsonctc_cpp
