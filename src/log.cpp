#include <jsonctc-cpp/log.hpp>

#include <iostream>
#include <mutex>
#include <utility>

namespace jsonctc_cpp {

namespace {

void log_to_stderr(LogLevel level, std::string_view component, std::string_view message) {
    std::cerr << "[jsonctc:" << component << "] ";
    if (level != LogLevel::debug) std::cerr << to_string_view(level) << ": ";
    std::cerr << message << '\n';
}

struct Registry {
    std::mutex mutex;
    LogHandler handler{log_to_stderr};
};

auto registry() -> Registry& {
    static auto instance = Registry{};
    return instance;
}

}  // anonymous namespace

void set_log_handler(LogHandler handler) {
    auto& reg = registry();
    auto lock = std::lock_guard{reg.mutex};
    reg.handler = handler ? std::move(handler) : LogHandler{log_to_stderr};
}

namespace detail {

void log(LogLevel level, std::string_view component, std::string_view message) {
    auto& reg = registry();
    auto handler = LogHandler{};
    {
        auto lock = std::lock_guard{reg.mutex};
        handler = reg.handler;
    }
    handler(level, component, message);
}

void log_debug(std::string_view component, std::string_view message) {
#if JSONCTC_CPP_VERBOSE_LOG
    log(LogLevel::debug, component, message);
#else
    (void)component;
    (void)message;
#endif
}

}  // namespace detail

}  // namespace jsonctc_cpp
