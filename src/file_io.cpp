#include <jsonctc-cpp/file_io.hpp>

#include <jsonctc-cpp/error.hpp>
#include <jsonctc-cpp/log.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <system_error>

namespace jsonctc_cpp {

namespace {

namespace fs = std::filesystem;

struct FileCloser {
    void operator()(std::FILE* file) const noexcept { std::fclose(file); }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

auto is_access_error(const std::error_code& ec) -> bool {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted
        || ec == std::errc::read_only_file_system;
}

auto errno_code() -> std::error_code {
    return std::error_code{errno, std::generic_category()};
}

auto read_failure(const fs::path& path, const std::error_code& ec) -> Exception {
    auto message = "cannot read '" + path.string() + "': " + ec.message();
    if (ec == std::errc::no_such_file_or_directory) {
        return Exception{ErrorKind::file_not_found, message};
    }
    if (is_access_error(ec)) return Exception{ErrorKind::access_denied, message};
    return Exception{ErrorKind::read_error, message};
}

auto write_failure(const fs::path& path, const std::error_code& ec) -> Exception {
    auto message = "cannot write '" + path.string() + "': " + ec.message();
    if (is_access_error(ec)) return Exception{ErrorKind::access_denied, message};
    return Exception{ErrorKind::write_error, message};
}

void remove_temp(const fs::path& temp) {
    auto ec = std::error_code{};
    fs::remove(temp, ec);
    if (ec) {
        detail::log_warning("file-io",
                            "cannot remove temporary file '" + temp.string() + "': " + ec.message());
    }
}

// Objects merge key by key; everything else goes through Node::set, which
// reconciles arrays element by element.
void merge_object(Node node, const Json& value) {
    for (const auto& key : node.keys()) {
        const auto& name = std::get<std::string>(key);
        if (!value.contains(name)) node.erase(name);
    }
    for (const auto& [key, item] : value.items()) {
        auto child = node.child(key);
        if (child && child->is_object() && item.is_object()) {
            merge_object(*child, item);
        } else {
            node.set(key, item);
        }
    }
}

void merge_array(Node node, const Json& value) {
    auto length = std::max(node.size(), value.size());
    for (std::size_t i = 0; i < length; ++i) {
        if (i < value.size()) {
            node.set(i, value[i]);
        } else {
            node.erase(i);
        }
    }
}

}  // anonymous namespace

auto read_text(const fs::path& path) -> std::string {
    auto file = FilePtr{std::fopen(path.c_str(), "rb")};
    if (!file) throw read_failure(path, errno_code());

    auto text = std::string{};
    char buffer[8192];
    while (true) {
        auto count = std::fread(buffer, 1, sizeof buffer, file.get());
        text.append(buffer, count);
        if (count < sizeof buffer) break;
    }
    if (std::ferror(file.get())) throw read_failure(path, errno_code());
    return text;
}

auto read_document(const fs::path& path, const ParseOptions& options) -> Document {
    return Document::parse(read_text(path), options);
}

void write_file(const fs::path& path, std::string_view text) {
    auto ec = std::error_code{};
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw write_failure(path.parent_path(), ec);
    }

    auto stamp = std::chrono::system_clock::now().time_since_epoch().count();
    auto temp = path;
    temp += ".tmp." + std::to_string(stamp);

    {
        auto file = FilePtr{std::fopen(temp.c_str(), "wb")};
        if (!file) throw write_failure(temp, errno_code());
        auto written = std::fwrite(text.data(), 1, text.size(), file.get());
        auto failed = written != text.size() || std::fflush(file.get()) != 0;
        auto error = errno_code();
        if (std::fclose(file.release()) != 0 && !failed) {
            failed = true;
            error = errno_code();
        }
        if (failed) {
            remove_temp(temp);
            throw write_failure(path, error);
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        remove_temp(temp);
        throw write_failure(path, ec);
    }
}

auto write_value(const fs::path& path, const Json& value, const WriteOptions& options)
    -> fs::path {
    auto existing = std::optional<Document>{};
    try {
        existing = read_document(path);
    } catch (const Exception& e) {
        if (e.kind() != ErrorKind::file_not_found) throw;
    }

    if (existing) {
        auto root = existing->root();
        if (root.is_object() && value.is_object()) {
            merge_object(root, value);
            write_file(path, *existing);
            return path;
        }
        if (root.is_array() && value.is_array()) {
            merge_array(root, value);
            write_file(path, *existing);
            return path;
        }
    }

    auto text = options.pretty ? value.dump(2, ' ', false, Json::error_handler_t::replace)
                               : value.dump(-1, ' ', false, Json::error_handler_t::replace);
    write_file(path, text + "\n");
    return path;
}

}  // namespace jsonctc_cpp
