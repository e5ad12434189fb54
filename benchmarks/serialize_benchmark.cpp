// jsonctc-cpp benchmarks — measures parse, edit and write-back throughput.

#include <jsonctc-cpp/jsonctc.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace jsonctc_cpp;

// A commented config with n services, each an object inside one array
static auto make_config(std::size_t n) -> std::string {
    auto text = std::string{"{\n  // generated\n  \"name\": \"bench\",\n  \"services\": [\n"};
    for (std::size_t i = 0; i < n; ++i) {
        text += "    {\"id\": " + std::to_string(i) + ", \"port\": " + std::to_string(8000 + i)
              + "}" + (i + 1 < n ? "," : "") + " // service " + std::to_string(i) + "\n";
    }
    text += "  ],\n  \"settings\": {\n";
    for (std::size_t i = 0; i < n; ++i) {
        text += "    \"key" + std::to_string(i) + "\": " + std::to_string(i)
              + (i + 1 < n ? ",\n" : "\n");
    }
    text += "  }\n}\n";
    return text;
}

// =============================================================================
// Parsing
// =============================================================================

static void bm_parse(benchmark::State& state) {
    const auto text = make_config(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto value = parse(text);
        benchmark::DoNotOptimize(value);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse)->Range(8, 512);

static void bm_parse_tree(benchmark::State& state) {
    const auto text = make_config(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto tree = parse_tree(text);
        benchmark::DoNotOptimize(tree);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_tree)->Range(8, 512);

static void bm_document_parse(benchmark::State& state) {
    const auto text = make_config(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto doc = Document::parse(text);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_document_parse)->Range(8, 512);

// =============================================================================
// Write-back
// =============================================================================

static void bm_to_string_unchanged(benchmark::State& state) {
    const auto doc = Document::parse(make_config(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto text = doc.to_string();
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(bm_to_string_unchanged)->Range(8, 512);

static void bm_to_string_one_change(benchmark::State& state) {
    auto doc = Document::parse(make_config(static_cast<std::size_t>(state.range(0))));
    doc.update("settings.key0", 42);
    for (auto _ : state) {
        auto text = doc.to_string();
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(bm_to_string_one_change)->Range(8, 512);

static void bm_to_string_many_changes(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto doc = Document::parse(make_config(n));
    auto settings = *doc.root().child("settings");
    for (std::size_t i = 0; i < n; i += 4) {
        settings.set("key" + std::to_string(i), -1);
    }
    for (auto _ : state) {
        auto text = doc.to_string();
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * (n / 4 + 1)));
}
BENCHMARK(bm_to_string_many_changes)->Range(8, 256);

static void bm_array_element_delete(benchmark::State& state) {
    auto doc = Document::parse(make_config(static_cast<std::size_t>(state.range(0))));
    doc.root().child("services")->erase(std::size_t{0});
    for (auto _ : state) {
        auto text = doc.to_string();
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(bm_array_element_delete)->Range(8, 512);

// =============================================================================
// Accessors and formatting
// =============================================================================

static void bm_extract(benchmark::State& state) {
    const auto doc = Document::parse(make_config(64));
    for (auto _ : state) {
        auto port = doc.extract("services.32.port", -1);
        benchmark::DoNotOptimize(port);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_extract);

static void bm_format(benchmark::State& state) {
    const auto text = make_config(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto edits = format(text);
        benchmark::DoNotOptimize(edits);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_format)->Range(8, 512);
