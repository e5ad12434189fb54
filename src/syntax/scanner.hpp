#pragma once

// Internal header: tokenizer for JSON with comments and trailing commas.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jsonctc_cpp::detail {

enum class TokenKind : std::uint8_t {
    open_brace,
    close_brace,
    open_bracket,
    close_bracket,
    comma,
    colon,
    null_keyword,
    true_keyword,
    false_keyword,
    string,
    number,
    line_comment,
    block_comment,
    line_break,
    trivia,
    unknown,
    eof,
};

enum class ScanError : std::uint8_t {
    none,
    unexpected_end_of_comment,
    unexpected_end_of_string,
    unexpected_end_of_number,
    invalid_unicode,
    invalid_escape_character,
    invalid_character,
};

struct Token {
    TokenKind kind{TokenKind::eof};
    std::size_t offset{0};
    std::size_t length{0};
    ScanError error{ScanError::none};
    std::string value;  // decoded content for strings, raw text otherwise
};

inline auto is_comment(TokenKind kind) noexcept -> bool {
    return kind == TokenKind::line_comment || kind == TokenKind::block_comment;
}

inline auto is_horizontal_space(char c) noexcept -> bool {
    return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

inline auto is_line_break(char c) noexcept -> bool {
    return c == '\n' || c == '\r';
}

inline auto is_digit(char c) noexcept -> bool {
    return c >= '0' && c <= '9';
}

/// Encode a code point as UTF-8.
inline void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// Produces one token per scan() call.
///
/// With ignore_trivia set, whitespace and line breaks are skipped;
/// comments are still reported so the parser can reject them.
class Scanner {
public:
    explicit Scanner(std::string_view text, bool ignore_trivia = false)
        : text_{text}, ignore_trivia_{ignore_trivia} {}

    auto scan() -> const Token& {
        do {
            scan_one();
        } while (ignore_trivia_
                 && (token_.kind == TokenKind::trivia || token_.kind == TokenKind::line_break));
        return token_;
    }

    auto token() const noexcept -> const Token& { return token_; }
    auto position() const noexcept -> std::size_t { return pos_; }
    auto text() const noexcept -> std::string_view { return text_; }

private:
    void scan_one() {
        token_.offset = pos_;
        token_.error = ScanError::none;
        token_.value.clear();

        if (pos_ >= text_.size()) {
            finish(TokenKind::eof);
            return;
        }

        auto c = text_[pos_];

        if (is_horizontal_space(c)) {
            while (pos_ < text_.size() && is_horizontal_space(text_[pos_])) ++pos_;
            finish_raw(TokenKind::trivia);
            return;
        }
        if (is_line_break(c)) {
            ++pos_;
            if (c == '\r' && pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
            finish_raw(TokenKind::line_break);
            return;
        }

        switch (c) {
            case '{': ++pos_; finish_raw(TokenKind::open_brace); return;
            case '}': ++pos_; finish_raw(TokenKind::close_brace); return;
            case '[': ++pos_; finish_raw(TokenKind::open_bracket); return;
            case ']': ++pos_; finish_raw(TokenKind::close_bracket); return;
            case ',': ++pos_; finish_raw(TokenKind::comma); return;
            case ':': ++pos_; finish_raw(TokenKind::colon); return;
            case '"':
                ++pos_;
                scan_string();
                finish(TokenKind::string);
                return;
            case '/':
                if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '/') {
                    pos_ += 2;
                    while (pos_ < text_.size() && !is_line_break(text_[pos_])) ++pos_;
                    finish_raw(TokenKind::line_comment);
                    return;
                }
                if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '*') {
                    scan_block_comment();
                    return;
                }
                ++pos_;
                finish_raw(TokenKind::unknown);
                return;
            case '-':
                ++pos_;
                if (pos_ >= text_.size() || !is_digit(text_[pos_])) {
                    finish_raw(TokenKind::unknown);
                    return;
                }
                scan_number();
                return;
            default:
                break;
        }

        if (is_digit(c)) {
            scan_number();
            return;
        }

        // Keywords and anything else up to the next separator
        while (pos_ < text_.size() && is_unknown_content(text_[pos_])) ++pos_;
        if (pos_ == token_.offset) {
            ++pos_;
            finish_raw(TokenKind::unknown);
            return;
        }
        auto word = text_.substr(token_.offset, pos_ - token_.offset);
        if (word == "true") {
            finish_raw(TokenKind::true_keyword);
        } else if (word == "false") {
            finish_raw(TokenKind::false_keyword);
        } else if (word == "null") {
            finish_raw(TokenKind::null_keyword);
        } else {
            finish_raw(TokenKind::unknown);
        }
    }

    static auto is_unknown_content(char c) noexcept -> bool {
        if (is_horizontal_space(c) || is_line_break(c)) return false;
        switch (c) {
            case '{': case '}': case '[': case ']':
            case '"': case ',': case ':': case '/':
                return false;
            default:
                return true;
        }
    }

    void finish(TokenKind kind) {
        token_.kind = kind;
        token_.length = pos_ - token_.offset;
    }

    void finish_raw(TokenKind kind) {
        finish(kind);
        token_.value.assign(text_.substr(token_.offset, token_.length));
    }

    void scan_block_comment() {
        pos_ += 2;
        auto end = text_.find("*/", pos_);
        if (end == std::string_view::npos) {
            pos_ = text_.size();
            token_.error = ScanError::unexpected_end_of_comment;
        } else {
            pos_ = end + 2;
        }
        finish_raw(TokenKind::block_comment);
    }

    // Called with pos_ on the first digit; a leading zero ends the integer part
    void scan_number() {
        if (text_[pos_] == '0') {
            ++pos_;
        } else {
            while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            if (pos_ < text_.size() && is_digit(text_[pos_])) {
                while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
            } else {
                token_.error = ScanError::unexpected_end_of_number;
                finish_raw(TokenKind::number);
                return;
            }
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            if (pos_ < text_.size() && is_digit(text_[pos_])) {
                while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
            } else {
                token_.error = ScanError::unexpected_end_of_number;
            }
        }
        finish_raw(TokenKind::number);
    }

    void scan_string() {
        auto& out = token_.value;
        while (true) {
            if (pos_ >= text_.size()) {
                token_.error = ScanError::unexpected_end_of_string;
                return;
            }
            auto c = text_[pos_];
            if (c == '"') {
                ++pos_;
                return;
            }
            if (c == '\\') {
                ++pos_;
                if (pos_ >= text_.size()) {
                    token_.error = ScanError::unexpected_end_of_string;
                    return;
                }
                auto esc = text_[pos_++];
                switch (esc) {
                    case '"':  out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/':  out.push_back('/'); break;
                    case 'b':  out.push_back('\b'); break;
                    case 'f':  out.push_back('\f'); break;
                    case 'n':  out.push_back('\n'); break;
                    case 'r':  out.push_back('\r'); break;
                    case 't':  out.push_back('\t'); break;
                    case 'u':  scan_unicode_escape(out); break;
                    default:   token_.error = ScanError::invalid_escape_character; break;
                }
                continue;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                if (is_line_break(c)) {
                    token_.error = ScanError::unexpected_end_of_string;
                    return;
                }
                token_.error = ScanError::invalid_character;
            }
            out.push_back(c);
            ++pos_;
        }
    }

    auto read_hex4() -> long {
        if (pos_ + 4 > text_.size()) return -1;
        auto result = long{0};
        for (auto i = std::size_t{0}; i < 4; ++i) {
            auto c = text_[pos_ + i];
            result <<= 4;
            if (c >= '0' && c <= '9') {
                result += c - '0';
            } else if (c >= 'a' && c <= 'f') {
                result += c - 'a' + 10;
            } else if (c >= 'A' && c <= 'F') {
                result += c - 'A' + 10;
            } else {
                return -1;
            }
        }
        pos_ += 4;
        return result;
    }

    void scan_unicode_escape(std::string& out) {
        auto unit = read_hex4();
        if (unit < 0) {
            token_.error = ScanError::invalid_unicode;
            return;
        }
        auto cp = static_cast<std::uint32_t>(unit);
        // Combine a surrogate pair into one code point
        if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 1 < text_.size()
            && text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
            auto saved = pos_;
            pos_ += 2;
            auto low = read_hex4();
            if (low >= 0xDC00 && low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (static_cast<std::uint32_t>(low) - 0xDC00);
            } else {
                pos_ = saved;
            }
        }
        append_utf8(out, cp);
    }

    std::string_view text_;
    bool ignore_trivia_;
    std::size_t pos_{0};
    Token token_;
};

}  // namespace jsonctc_cpp::detail
