/// @file format.hpp
/// @brief Re-indent JSONC text while keeping comments and trailing commas.

#pragma once

#include <jsonctc-cpp/edit.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace jsonctc_cpp {

/// Compute the whitespace edits that format @p text.
///
/// Only whitespace between tokens is changed. Text that does not scan or
/// parse cleanly is formatted around the bad tokens without raising.
auto format(std::string_view text, const FormattingOptions& options = {}) -> std::vector<TextEdit>;

/// Convenience: apply format() to @p text.
auto format_text(std::string_view text, const FormattingOptions& options = {}) -> std::string;

}  // namespace jsonctc_cpp
