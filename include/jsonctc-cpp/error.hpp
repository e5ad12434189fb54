/// @file error.hpp
/// @brief Error types for the jsonctc-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonctc_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    parse_error,        ///< The source text is not valid JSONC.
    invalid_path,       ///< A path does not address a usable location.
    invalid_operation,  ///< An operation is invalid in the current context.
    edit_failed,        ///< A batch of text edits could not be applied.
    file_not_found,     ///< The file to read does not exist.
    access_denied,      ///< The file system refused access.
    read_error,         ///< Reading a file failed for another reason.
    write_error,        ///< Writing a file failed for another reason.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::parse_error:       return "parse_error";
        case ErrorKind::invalid_path:      return "invalid_path";
        case ErrorKind::invalid_operation: return "invalid_operation";
        case ErrorKind::edit_failed:       return "edit_failed";
        case ErrorKind::file_not_found:    return "file_not_found";
        case ErrorKind::access_denied:     return "access_denied";
        case ErrorKind::read_error:        return "read_error";
        case ErrorKind::write_error:       return "write_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception thrown by every fallible library operation.
///
/// what() returns the message; kind() lets callers branch on the
/// category (for example a missing file versus a malformed one).
class Exception : public std::runtime_error {
public:
    Exception(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    auto kind() const noexcept -> ErrorKind { return kind_; }

    /// The error as a value, e.g. for storing or comparing.
    auto error() const -> Error { return Error{kind_, what()}; }

private:
    ErrorKind kind_;
};

}  // namespace jsonctc_cpp
