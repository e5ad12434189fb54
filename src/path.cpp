#include <jsonctc-cpp/path.hpp>

#include <jsonctc-cpp/error.hpp>
#include <jsonctc-cpp/value.hpp>

#include <algorithm>
#include <charconv>

namespace jsonctc_cpp {

namespace {

// Leading zeros are not indices (except "0" itself)
auto try_parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

}  // anonymous namespace

auto as_index(const PathElement& element) -> std::optional<std::size_t> {
    return std::visit(overload{
        [](const std::string& key) { return try_parse_index(key); },
        [](std::size_t index) -> std::optional<std::size_t> { return index; },
    }, element);
}

auto to_key(const PathElement& element) -> std::string {
    return std::visit(overload{
        [](const std::string& key) { return key; },
        [](std::size_t index) { return std::to_string(index); },
    }, element);
}

auto elements_equal(const PathElement& a, const PathElement& b) -> bool {
    if (a.index() == b.index()) return a == b;
    return to_key(a) == to_key(b);
}

auto paths_equal(const Path& a, const Path& b) -> bool {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), elements_equal);
}

auto is_prefix(const Path& prefix, const Path& path) -> bool {
    return prefix.size() <= path.size()
        && std::equal(prefix.begin(), prefix.end(), path.begin(), elements_equal);
}

auto parse_dotted(std::string_view dotted) -> Path {
    auto result = Path{};
    auto pos = std::size_t{0};
    while (pos <= dotted.size()) {
        auto next = dotted.find('.', pos);
        if (next == std::string_view::npos) next = dotted.size();
        if (next > pos) result.emplace_back(std::string{dotted.substr(pos, next - pos)});
        pos = next + 1;
    }
    return result;
}

auto parse_pointer(std::string_view pointer) -> Path {
    if (pointer.empty()) return {};
    if (pointer[0] != '/') {
        throw Exception{ErrorKind::invalid_path,
                        "JSON Pointer must start with '/' or be empty"};
    }
    auto segments = Path{};
    auto pos = std::size_t{1};
    while (pos <= pointer.size()) {
        auto next = pointer.find('/', pos);
        auto raw = pointer.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                       : next - pos);
        // Unescape: ~1 -> /, ~0 -> ~
        auto segment = std::string{};
        segment.reserve(raw.size());
        for (auto i = std::size_t{0}; i < raw.size(); ++i) {
            if (raw[i] == '~' && i + 1 < raw.size() && (raw[i + 1] == '0' || raw[i + 1] == '1')) {
                segment.push_back(raw[i + 1] == '1' ? '/' : '~');
                ++i;
            } else {
                segment.push_back(raw[i]);
            }
        }
        if (auto index = try_parse_index(segment)) {
            segments.emplace_back(*index);
        } else {
            segments.emplace_back(std::move(segment));
        }
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return segments;
}

auto to_pointer(const Path& path) -> std::string {
    auto result = std::string{};
    for (const auto& element : path) {
        result.push_back('/');
        for (char c : to_key(element)) {
            if (c == '~') {
                result += "~0";
            } else if (c == '/') {
                result += "~1";
            } else {
                result.push_back(c);
            }
        }
    }
    return result;
}

auto to_string(const Path& path) -> std::string {
    auto result = std::string{};
    for (const auto& element : path) {
        std::visit(overload{
            [&](const std::string& key) {
                if (!result.empty()) result.push_back('.');
                result += key;
            },
            [&](std::size_t index) {
                result += '[' + std::to_string(index) + ']';
            },
        }, element);
    }
    return result;
}

}  // namespace jsonctc_cpp
