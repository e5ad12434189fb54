/// @file log.hpp
/// @brief Diagnostic logging hook.
///
/// The library reports events it recovers from (a serialization that had
/// to fall back to plain output, a skipped edit) through one process-wide
/// handler. The default handler writes to stderr.

#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

// ============================================================
// Verbose Logging Configuration
//
// When JSONCTC_CPP_VERBOSE_LOG is non-zero, debug messages are
// passed to the handler as well as warnings and errors.
//
// By default it is DISABLED in release builds and ENABLED in
// debug builds. The setting that counts is the one the library
// itself was compiled with.
//
// To explicitly enable: #define JSONCTC_CPP_VERBOSE_LOG 1
// To explicitly disable: #define JSONCTC_CPP_VERBOSE_LOG 0
// ============================================================

#ifndef JSONCTC_CPP_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSONCTC_CPP_VERBOSE_LOG 0
#  else
#    define JSONCTC_CPP_VERBOSE_LOG 1
#  endif
#endif

namespace jsonctc_cpp {

enum class LogLevel : std::uint8_t {
    debug,
    warning,
    error,
};

constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::debug:   return "debug";
        case LogLevel::warning: return "warning";
        case LogLevel::error:   return "error";
    }
    return "unknown";
}

/// Receives log records. @p component names the emitting part ("serializer").
using LogHandler =
    std::function<void(LogLevel level, std::string_view component, std::string_view message)>;

/// Install a handler. An empty handler restores the stderr default.
void set_log_handler(LogHandler handler);

namespace detail {

void log(LogLevel level, std::string_view component, std::string_view message);

/// Dropped unless the library was built with verbose logging.
void log_debug(std::string_view component, std::string_view message);

inline void log_warning(std::string_view component, std::string_view message) {
    log(LogLevel::warning, component, message);
}

}  // namespace detail

}  // namespace jsonctc_cpp
