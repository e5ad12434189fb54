// jsonctc — command-line front end for the jsonctc-cpp library
//
// Usage:
//   jsonctc parse  <file|->                 print the plain JSON value
//   jsonctc format <file|->                 print the re-indented text
//   jsonctc modify <file> <path> <value>    print the text with one value changed
//
// <path> is dotted ("server.port") or a JSON Pointer ("/server/port").
// <value> is parsed as JSON; anything that does not parse is a string.

#include <jsonctc-cpp/jsonctc.hpp>

#include <cstdio>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace jc = jsonctc_cpp;

namespace {

auto usage() -> int {
    std::fprintf(stderr,
                 "usage: jsonctc parse <file|->\n"
                 "       jsonctc format <file|->\n"
                 "       jsonctc modify <file> <path> <value>\n");
    return 2;
}

auto read_input(std::string_view name) -> std::string {
    if (name == "-") {
        return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
    }
    return jc::read_text(std::string{name});
}

auto parse_path(std::string_view text) -> jc::Path {
    if (!text.empty() && text.front() == '/') return jc::parse_pointer(text);
    return jc::parse_dotted(text);
}

auto parse_argument(std::string_view text) -> jc::Json {
    try {
        return jc::parse(text, jc::ParseOptions{.allow_trailing_comma = false, .allow_comments = false});
    } catch (const jc::ParseException&) {
        return jc::Json(std::string{text});
    }
}

auto run(int argc, char** argv) -> int {
    if (argc < 3) return usage();
    auto command = std::string_view{argv[1]};

    if (command == "parse" && argc == 3) {
        auto value = jc::parse(read_input(argv[2]));
        std::printf("%s\n", value.dump(2, ' ', false, jc::Json::error_handler_t::replace).c_str());
        return 0;
    }
    if (command == "format" && argc == 3) {
        std::printf("%s", jc::format_text(read_input(argv[2])).c_str());
        return 0;
    }
    if (command == "modify" && argc == 5) {
        auto doc = jc::Document::parse(read_input(argv[2]));
        doc.update(parse_path(argv[3]), parse_argument(argv[4]));
        std::printf("%s", doc.to_string().c_str());
        return 0;
    }
    return usage();
}

}  // anonymous namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const jc::ParseException& e) {
        const auto& detail = e.detail();
        std::fprintf(stderr, "jsonctc: %s (line %zu, column %zu)\n",
                     std::string{jc::to_string_view(detail.code)}.c_str(), detail.line, detail.column);
        return 1;
    } catch (const jc::Exception& e) {
        std::fprintf(stderr, "jsonctc: %s: %s\n",
                     std::string{jc::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }
}
