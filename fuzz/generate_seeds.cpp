// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <jsonctc-cpp/jsonctc.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: empty object
    write_seed(dir + "/seed_empty.jsonc", "{}\n");

    // Seed 2: commented config with nested objects
    write_seed(dir + "/seed_config.jsonc",
               "{\n"
               "  // server settings\n"
               "  \"server\": {\"host\": \"localhost\", \"port\": 8080},\n"
               "  \"debug\": false, /* toggled at runtime */\n"
               "}\n");

    // Seed 3: array with comments between elements
    write_seed(dir + "/seed_array.jsonc", "[\n  1, // one\n  \"two\",\n  /* three */ 3.5e2,\n]\n");

    // Seed 4: strings with escapes and surrogate pairs
    write_seed(dir + "/seed_strings.jsonc", R"({"a\"b": "\u00e9\uD83D\uDE00\n", "c": null})");

    // Seed 5: a document built and written by the library itself
    {
        auto doc = jsonctc_cpp::Document{};
        doc.update("a.b.c", jsonctc_cpp::Json::parse("[1, {\"d\": true}]"));
        write_seed(dir + "/seed_generated.json", doc.to_string());
    }

    // The round-trip target reads its first byte as an edit selector
    for (const auto& entry : fs::directory_iterator{dir}) {
        if (entry.path().extension() == ".rt") continue;
        auto in = std::ifstream{entry.path(), std::ios::binary};
        auto body = std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        write_seed(entry.path().string() + ".rt", std::string(1, '\x85') + body);
    }
    return 0;
}
