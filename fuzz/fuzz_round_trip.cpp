// Fuzz target for the parse, edit, write-back cycle.
// The input is parsed as a document; the first entries of the root are
// edited and the written text must parse again.

#include <jsonctc-cpp/jsonctc.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace jc = jsonctc_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;
    // The first byte picks the edits, the rest is the document
    const auto selector = data[0];
    const auto text = std::string_view{reinterpret_cast<const char*>(data + 1), size - 1};

    auto doc = std::optional<jc::Document>{};
    try {
        doc = jc::Document::parse(text);
    } catch (const jc::ParseException&) {
        return 0;
    }

    // Fallback warnings are expected; keep the output readable
    static const auto quiet = [] {
        jc::set_log_handler([](jc::LogLevel, std::string_view, std::string_view) {});
        return true;
    }();
    (void)quiet;

    auto root = doc->root();
    auto keys = root.keys();
    for (std::size_t i = 0; i < keys.size() && i < 4; ++i) {
        const auto& key = keys[i];
        auto erase = (selector >> i) & 1;
        if (const auto* index = std::get_if<std::size_t>(&key)) {
            if (erase) {
                root.erase(*index);
            } else {
                root.set(*index, static_cast<int>(i));
            }
        } else {
            const auto& name = std::get<std::string>(key);
            if (erase) {
                root.erase(name);
            } else {
                root.set(name, static_cast<int>(i));
            }
        }
    }
    if ((selector & 0x80) && root.is_object()) root.set(std::string_view{"fuzz"}, true);

    auto written = doc->to_string();
    try {
        (void)jc::parse(written);
    } catch (const jc::ParseException&) {
        __builtin_trap();
    }
    return 0;
}
