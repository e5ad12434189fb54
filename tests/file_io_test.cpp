// file_io_test.cpp — Tests for reading and atomically writing config files

#include <jsonctc-cpp/jsonctc.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace jsonctc_cpp;

namespace fs = std::filesystem;

class FileIo : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string{"jsonctc_"} + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        auto ec = std::error_code{};
        fs::remove_all(dir_, ec);
    }

    void put(const fs::path& path, const std::string& text) {
        auto out = std::ofstream{path, std::ios::binary};
        out << text;
    }

    auto temp_files() const -> int {
        auto count = 0;
        for (const auto& entry : fs::directory_iterator{dir_}) {
            if (entry.path().filename().string().find(".tmp.") != std::string::npos) ++count;
        }
        return count;
    }

    fs::path dir_;
};

TEST_F(FileIo, read_text_returns_bytes_unchanged) {
    auto path = dir_ / "a.jsonc";
    put(path, "{\r\n  // c\r\n}");
    EXPECT_EQ(read_text(path), "{\r\n  // c\r\n}");
}

TEST_F(FileIo, missing_file_is_file_not_found) {
    try {
        (void)read_text(dir_ / "missing.json");
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::file_not_found);
    }
}

TEST_F(FileIo, read_document_keeps_comments_for_write_back) {
    auto path = dir_ / "config.jsonc";
    put(path, "{\n  // port\n  \"port\": 80\n}\n");
    auto doc = read_document(path);
    doc.update("port", 81);
    write_file(path, doc);
    EXPECT_EQ(read_text(path), "{\n  // port\n  \"port\": 81\n}\n");
}

TEST_F(FileIo, read_document_reports_parse_errors) {
    auto path = dir_ / "bad.json";
    put(path, "{\"a\": }");
    EXPECT_THROW((void)read_document(path), ParseException);
}

TEST_F(FileIo, write_file_creates_parent_directories) {
    auto path = dir_ / "nested" / "deeper" / "out.json";
    write_file(path, std::string_view{"[]\n"});
    EXPECT_EQ(read_text(path), "[]\n");
    EXPECT_EQ(temp_files(), 0);
}

TEST_F(FileIo, write_file_replaces_existing_content) {
    auto path = dir_ / "out.json";
    put(path, "old content that is longer");
    write_file(path, std::string_view{"new"});
    EXPECT_EQ(read_text(path), "new");
    EXPECT_EQ(temp_files(), 0);
}

TEST_F(FileIo, write_value_creates_a_pretty_file) {
    auto path = dir_ / "fresh.json";
    auto written = write_value(path, Json::parse(R"({"a": [1, 2]})"));
    EXPECT_TRUE(written == path);
    EXPECT_EQ(read_text(path), "{\n  \"a\": [\n    1,\n    2\n  ]\n}\n");
}

TEST_F(FileIo, write_value_compact_option) {
    auto path = dir_ / "compact.json";
    (void)write_value(path, Json::parse(R"({"a": 1})"), WriteOptions{.pretty = false});
    EXPECT_EQ(read_text(path), "{\"a\":1}\n");
}

TEST_F(FileIo, write_value_merges_into_existing_object) {
    auto path = dir_ / "settings.jsonc";
    put(path,
        "{\n"
        "  // theme\n"
        "  \"theme\": \"dark\",\n"
        "  \"legacy\": true,\n"
        "  \"editor\": {\n"
        "    \"tab\": 2 // spaces\n"
        "  }\n"
        "}\n");
    (void)write_value(path, Json::parse(R"({"theme": "light", "editor": {"tab": 2}})"));

    auto text = read_text(path);
    EXPECT_NE(text.find("// theme"), std::string::npos);
    EXPECT_NE(text.find("// spaces"), std::string::npos);
    EXPECT_EQ(text.find("legacy"), std::string::npos);
    EXPECT_EQ(parse(text), Json::parse(R"({"theme": "light", "editor": {"tab": 2}})"));
}

TEST_F(FileIo, write_value_merges_into_existing_array) {
    auto path = dir_ / "list.jsonc";
    put(path, "[\n  1, // one\n  2,\n  3\n]\n");
    (void)write_value(path, Json::parse("[1, 20]"));

    auto text = read_text(path);
    EXPECT_NE(text.find("// one"), std::string::npos);
    EXPECT_EQ(parse(text), Json::parse("[1, 20]"));
}

TEST_F(FileIo, write_value_replaces_a_different_root_type) {
    auto path = dir_ / "swap.json";
    put(path, "// was an array\n[1]\n");
    (void)write_value(path, Json::parse(R"({"a": 1})"));
    EXPECT_EQ(read_text(path), "{\n  \"a\": 1\n}\n");
}

TEST_F(FileIo, write_value_rejects_malformed_existing_file) {
    auto path = dir_ / "broken.json";
    put(path, "{ nope");
    EXPECT_THROW((void)write_value(path, Json::object()), ParseException);
    EXPECT_EQ(read_text(path), "{ nope");
}
