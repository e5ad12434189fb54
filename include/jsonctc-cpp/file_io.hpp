/// @file file_io.hpp
/// @brief Reading documents from disk and writing text back atomically.

#pragma once

#include <jsonctc-cpp/document.hpp>
#include <jsonctc-cpp/parser.hpp>
#include <jsonctc-cpp/value.hpp>

#include <concepts>
#include <filesystem>
#include <string>
#include <string_view>

namespace jsonctc_cpp {

/// Anything that can render itself as text, such as a Document.
template <typename T>
concept TextSource = requires(const T& source) {
    { source.to_string() } -> std::convertible_to<std::string>;
};

/// Read a whole file.
/// @throws Exception file_not_found, access_denied or read_error.
auto read_text(const std::filesystem::path& path) -> std::string;

/// Read and parse a file, keeping its text for surgical write-back.
/// @throws Exception as read_text(), or ParseException if it is malformed.
auto read_document(const std::filesystem::path& path, const ParseOptions& options = {})
    -> Document;

/// Write text atomically: a temporary file beside the target is renamed
/// over it. Missing parent directories are created.
/// @throws Exception access_denied or write_error.
void write_file(const std::filesystem::path& path, std::string_view text);

template <TextSource T>
void write_file(const std::filesystem::path& path, const T& source) {
    auto text = std::string{source.to_string()};
    write_file(path, std::string_view{text});
}

struct WriteOptions {
    /// Indent freshly written files; merged files keep their own layout.
    bool pretty{true};
};

/// Write a value to a config file, merging into the existing file if any.
///
/// When the file holds an object (or array) and @p value is one too, the
/// file is edited in place: changed keys are rewritten, missing keys are
/// removed, and comments elsewhere survive. Otherwise the file is replaced.
///
/// @return The path written.
/// @throws Exception for read errors other than a missing file, or
///         ParseException if the existing file is malformed.
auto write_value(const std::filesystem::path& path, const Json& value,
                 const WriteOptions& options = {}) -> std::filesystem::path;

}  // namespace jsonctc_cpp
