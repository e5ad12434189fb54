#include <jsonctc-cpp/format.hpp>

#include "syntax/layout.hpp"
#include "syntax/scanner.hpp"

namespace jsonctc_cpp {

namespace {

using detail::Scanner;
using detail::ScanError;
using detail::Token;
using detail::TokenKind;

auto repeat(std::string_view text, std::size_t count) -> std::string {
    auto result = std::string{};
    result.reserve(text.size() * count);
    for (auto i = std::size_t{0}; i < count; ++i) result += text;
    return result;
}

class Formatter {
public:
    Formatter(std::string_view text, const FormattingOptions& options)
        : text_{text}, options_{options}, scanner_{text, false},
          unit_{detail::indent_unit(options)} {}

    auto run() -> std::vector<TextEdit> {
        auto first = scan_next();
        if (first.kind == TokenKind::eof) return std::move(edits_);
        add_edit({}, 0, first.offset);

        while (first.kind != TokenKind::eof) {
            auto first_end = first.offset + first.length;
            auto second = scan_next();
            error_ = is_bad(first) || is_bad(second);
            auto content = std::string{};
            auto needs_line_break = false;

            // Comments on the same line as the previous token stay there
            while (line_breaks_ == 0 && detail::is_comment(second.kind)) {
                add_edit(" ", first_end, second.offset);
                first_end = second.offset + second.length;
                needs_line_break = second.kind == TokenKind::line_comment;
                content = needs_line_break ? new_lines() : std::string{};
                second = scan_next();
                error_ = is_bad(first) || is_bad(second);
            }

            if (second.kind == TokenKind::close_brace || second.kind == TokenKind::close_bracket) {
                auto opener = second.kind == TokenKind::close_brace ? TokenKind::open_brace
                                                                    : TokenKind::open_bracket;
                if (first.kind == opener && !needs_line_break) {
                    content = options_.keep_lines && line_breaks_ > 0 ? new_lines() : std::string{};
                } else {
                    if (first.kind != opener && level_ > 0) --level_;
                    content = break_or_space();
                }
            } else {
                switch (first.kind) {
                    case TokenKind::open_brace:
                    case TokenKind::open_bracket:
                        ++level_;
                        content = break_or_space();
                        break;
                    case TokenKind::comma:
                        content = break_or_space();
                        break;
                    case TokenKind::line_comment:
                        content = new_lines();
                        break;
                    case TokenKind::block_comment:
                        if (line_breaks_ > 0) {
                            content = new_lines();
                        } else if (!needs_line_break) {
                            content = " ";
                        }
                        break;
                    case TokenKind::colon:
                        if (!needs_line_break) content = " ";
                        break;
                    case TokenKind::string:
                        if (second.kind == TokenKind::colon) {
                            if (!needs_line_break) content = {};
                            break;
                        }
                        [[fallthrough]];
                    case TokenKind::null_keyword:
                    case TokenKind::true_keyword:
                    case TokenKind::false_keyword:
                    case TokenKind::number:
                    case TokenKind::close_brace:
                    case TokenKind::close_bracket:
                        if (detail::is_comment(second.kind)) {
                            if (!needs_line_break) content = " ";
                        } else if (second.kind != TokenKind::comma && second.kind != TokenKind::eof) {
                            error_ = true;
                        }
                        break;
                    default:
                        error_ = true;
                        break;
                }
                if (line_breaks_ > 0 && detail::is_comment(second.kind)) content = new_lines();
            }

            if (second.kind == TokenKind::eof) {
                if (options_.keep_lines && line_breaks_ > 0) {
                    content = repeat(options_.eol, line_breaks_);
                } else {
                    content = options_.insert_final_newline ? options_.eol : std::string{};
                }
            }
            add_edit(std::move(content), first_end, second.offset);
            first = second;
        }
        return std::move(edits_);
    }

private:
    // Next token that is not whitespace; counts the line breaks skipped
    auto scan_next() -> Token {
        line_breaks_ = 0;
        while (true) {
            auto token = scanner_.scan();
            if (token.kind == TokenKind::trivia) continue;
            if (token.kind == TokenKind::line_break) {
                ++line_breaks_;
                continue;
            }
            return token;
        }
    }

    static auto is_bad(const Token& token) -> bool {
        return token.kind == TokenKind::unknown || token.error != ScanError::none;
    }

    auto new_lines() const -> std::string {
        auto count = options_.keep_lines && line_breaks_ > 1 ? line_breaks_ : std::size_t{1};
        return repeat(options_.eol, count) + repeat(unit_, level_);
    }

    auto break_or_space() const -> std::string {
        if (!options_.keep_lines || line_breaks_ > 0) return new_lines();
        return " ";
    }

    void add_edit(std::string content, std::size_t begin, std::size_t end) {
        if (error_) return;
        if (text_.substr(begin, end - begin) == content) return;
        edits_.push_back(TextEdit{begin, end - begin, std::move(content)});
    }

    std::string_view text_;
    const FormattingOptions& options_;
    Scanner scanner_;
    std::string unit_;
    std::size_t level_{0};
    std::size_t line_breaks_{0};
    bool error_{false};
    std::vector<TextEdit> edits_;
};

}  // anonymous namespace

auto format(std::string_view text, const FormattingOptions& options) -> std::vector<TextEdit> {
    return Formatter{text, options}.run();
}

auto format_text(std::string_view text, const FormattingOptions& options) -> std::string {
    return apply_edits(text, format(text, options));
}

}  // namespace jsonctc_cpp
