/// @file path.hpp
/// @brief Paths addressing a location inside a document.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonctc_cpp {

/// One step of a path: an object key or an array index.
///
/// A string made only of digits (without a leading zero) is also accepted
/// as an array index wherever the container is an array.
using PathElement = std::variant<std::string, std::size_t>;

/// A location in a document. The empty path is the root.
using Path = std::vector<PathElement>;

/// Interpret an element as an array index.
///
/// Native indices are returned as-is; numeral strings ("0", "12") are
/// converted. Anything else yields nullopt.
auto as_index(const PathElement& element) -> std::optional<std::size_t>;

/// The object-key spelling of an element (indices in decimal).
auto to_key(const PathElement& element) -> std::string;

/// Compare two elements, treating an index and its numeral string as equal.
auto elements_equal(const PathElement& a, const PathElement& b) -> bool;

/// Compare two paths element-wise with elements_equal().
auto paths_equal(const Path& a, const Path& b) -> bool;

/// Check whether @p prefix is a (non-strict) prefix of @p path.
auto is_prefix(const Path& prefix, const Path& path) -> bool;

/// Split a dotted path ("a.b.c") into string segments.
///
/// Empty segments are dropped, so "a..b" and ".a.b." both give [a, b].
auto parse_dotted(std::string_view dotted) -> Path;

/// Parse an RFC 6901 JSON Pointer. Numeral segments become indices.
///
/// @throws Exception with ErrorKind::invalid_path if the pointer is
///         non-empty and does not start with '/'.
auto parse_pointer(std::string_view pointer) -> Path;

/// Format a path as an RFC 6901 JSON Pointer.
auto to_pointer(const Path& path) -> std::string;

/// Human-readable form for messages, e.g. "servers[0].port".
auto to_string(const Path& path) -> std::string;

}  // namespace jsonctc_cpp
