// Fuzz target for the JSONC parser and formatter.
// Any input that parses is converted to a syntax tree and formatted as well.

#include <jsonctc-cpp/jsonctc.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    // Formatting never raises, even on malformed text
    auto formatted = jsonctc_cpp::format_text(text);
    (void)formatted;

    try {
        auto tree = jsonctc_cpp::parse_tree(text, jsonctc_cpp::ParseOptions{.allow_empty_content = true});
        if (tree) {
            auto value = jsonctc_cpp::node_value(*tree);
            (void)value;
        }
    } catch (const jsonctc_cpp::ParseException&) {
        // Malformed input is expected
    }
    return 0;
}
