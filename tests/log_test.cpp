#include <jsonctc-cpp/jsonctc.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace jsonctc_cpp;

namespace {

struct Record {
    LogLevel level;
    std::string component;
    std::string message;
};

class Log : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_handler([this](LogLevel level, std::string_view component, std::string_view message) {
            records_.push_back(Record{level, std::string{component}, std::string{message}});
        });
    }

    void TearDown() override { set_log_handler(nullptr); }

    std::vector<Record> records_;
};

class BrokenEditor : public PathEditor {
public:
    auto edit_for_set(std::string_view, const Path&, const Json&) const
        -> std::vector<TextEdit> override {
        return {TextEdit{1000, 0, "x"}};
    }

    auto edit_for_delete(std::string_view, const Path&) const
        -> std::vector<TextEdit> override {
        return {};
    }
};

}  // namespace

TEST(LogLevel, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(LogLevel::debug),   "debug");
    EXPECT_EQ(to_string_view(LogLevel::warning), "warning");
    EXPECT_EQ(to_string_view(LogLevel::error),   "error");
}

TEST_F(Log, handler_receives_records) {
    detail::log(LogLevel::error, "test", "something broke");
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::error);
    EXPECT_EQ(records_[0].component, "test");
    EXPECT_EQ(records_[0].message, "something broke");
}

TEST_F(Log, serializer_fallback_is_a_warning) {
    auto doc = Document::parse("{\n  // c\n  \"a\": 1\n}\n");
    doc.set_editor(std::make_shared<BrokenEditor>());
    doc.update("a", 2);
    auto text = doc.to_string();

    EXPECT_EQ(text, "{\n  \"a\": 2\n}\n");
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::warning);
    EXPECT_EQ(records_[0].component, "serializer");
    EXPECT_NE(records_[0].message.find("outside the text"), std::string::npos);
}

TEST_F(Log, successful_write_back_logs_nothing) {
    auto doc = Document::parse(R"({"a": 1})");
    doc.update("a", 2);
    EXPECT_EQ(doc.to_string(), "{\"a\": 2}\n");
    for (const auto& record : records_) EXPECT_NE(record.level, LogLevel::warning);
}

TEST_F(Log, empty_handler_restores_default) {
    set_log_handler(nullptr);
    detail::log_warning("test", "to stderr");
    EXPECT_TRUE(records_.empty());
}
