// basic_usage — demonstrates the core jsonctc-cpp API
//
// Parses a commented config, reads it through nodes and typed accessors,
// edits it, and prints the result with every untouched comment intact.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <jsonctc-cpp/jsonctc.hpp>

#include <cstdio>
#include <string>

namespace jc = jsonctc_cpp;

int main() {
    auto doc = jc::Document::parse(R"({
  // Service identity
  "name": "inventory",
  "server": {
    "host": "0.0.0.0", // listen everywhere
    "port": 8080
  },
  "features": [
    "search",
    "export", /* beta */
    "legacy-sync"
  ]
}
)");

    // -- Typed accessors with defaults ----------------------------------------
    auto port = doc.extract("server.port", 80);
    auto timeout = doc.extract("server.timeout", 30);
    auto name = doc.extract("name", "unnamed");
    std::printf("%s listens on port %d (timeout %ds)\n", name.c_str(), port, timeout);

    // -- Node handles: nested objects and arrays ------------------------------
    auto root = doc.root();
    if (auto features = root.child("features")) {
        std::printf("%zu features\n", features->size());
        features->erase(std::size_t{2});
    }
    if (auto server = root.child("server")) {
        server->set("port", 9090);
    }

    // -- Dotted-path updates create what is missing ---------------------------
    doc.update("server.tls.enabled", true);
    doc.update("owner", "platform-team");

    // -- What changed, as full paths ------------------------------------------
    auto diff = doc.diff();
    for (const auto& [path, value] : diff.changes) {
        std::printf("set    %s = %s\n", jc::to_string(path).c_str(), value.dump().c_str());
    }
    for (const auto& path : diff.deletions) {
        std::printf("delete %s\n", jc::to_string(path).c_str());
    }

    // -- Write back: only the edited bytes change -----------------------------
    std::printf("\n%s", doc.to_string().c_str());

    // -- Plain parsing and formatting -----------------------------------------
    auto compact = std::string{R"({"a":1,/* note */"b":[true,false]})"};
    std::printf("\n%s", jc::format_text(compact).c_str());

    return 0;
}
