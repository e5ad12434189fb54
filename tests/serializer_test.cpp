// serializer_test.cpp — Tests for writing edited documents back as text

#include <jsonctc-cpp/jsonctc.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace jsonctc_cpp;

namespace {

constexpr auto service_text =
    "{\n"
    "  // service name\n"
    "  \"name\": \"svc\",\n"
    "  \"server\": {\n"
    "    \"host\": \"localhost\", // inline\n"
    "    \"port\": 80\n"
    "  }\n"
    "}\n";

class FailingEditor : public PathEditor {
public:
    auto edit_for_set(std::string_view, const Path&, const Json&) const
        -> std::vector<TextEdit> override {
        throw Exception{ErrorKind::edit_failed, "refusing to edit"};
    }

    auto edit_for_delete(std::string_view, const Path&) const
        -> std::vector<TextEdit> override {
        throw Exception{ErrorKind::edit_failed, "refusing to edit"};
    }
};

// Silences the fallback warning for the duration of a test
struct QuietLog {
    QuietLog() { set_log_handler([](LogLevel, std::string_view, std::string_view) {}); }
    ~QuietLog() { set_log_handler(nullptr); }
};

}  // namespace

// -- Unchanged documents ------------------------------------------------------

TEST(Serializer, unchanged_document_round_trips_exactly) {
    auto doc = Document::parse(service_text);
    EXPECT_EQ(doc.to_string(), service_text);
}

TEST(Serializer, unchanged_primitive_root) {
    auto doc = Document::parse("42 // answer");
    EXPECT_EQ(doc.to_string(), "42 // answer\n");
}

// -- Trailing newline ---------------------------------------------------------

TEST(Serializer, adds_missing_final_newline) {
    EXPECT_EQ(Document::parse(R"({"a": 1})").to_string(), "{\"a\": 1}\n");
}

TEST(Serializer, collapses_trailing_blank_lines) {
    EXPECT_EQ(Document::parse("{\"a\": 1}\n\n\n").to_string(), "{\"a\": 1}\n");
}

TEST(Serializer, keeps_crlf_line_endings) {
    auto doc = Document::parse("{\r\n  \"a\": 1\r\n}\r\n");
    doc.root().set("a", 2);
    EXPECT_EQ(doc.to_string(), "{\r\n  \"a\": 2\r\n}\r\n");
}

// -- Surgical edits -----------------------------------------------------------

TEST(Serializer, changed_value_keeps_sibling_comments) {
    auto doc = Document::parse(service_text);
    doc.root().child("server")->set("port", 8080);
    EXPECT_EQ(doc.to_string(),
              "{\n"
              "  // service name\n"
              "  \"name\": \"svc\",\n"
              "  \"server\": {\n"
              "    \"host\": \"localhost\", // inline\n"
              "    \"port\": 8080\n"
              "  }\n"
              "}\n");
}

TEST(Serializer, deleted_property_takes_its_comment_lines) {
    auto doc = Document::parse(
        "{\n"
        "  \"name\": \"x\",\n"
        "  // where\n"
        "  \"city\": \"Paris\",\n"
        "  \"zip\": \"75\"\n"
        "}\n");
    doc.root().erase("city");
    EXPECT_EQ(doc.to_string(), "{\n  \"name\": \"x\",\n  \"zip\": \"75\"\n}\n");
}

TEST(Serializer, deleted_element_keeps_neighbour_comment) {
    auto doc = Document::parse(
        "{\n"
        "  \"list\": [\n"
        "    \"a\",\n"
        "    \"b\", /* keep */\n"
        "    \"c\"\n"
        "  ]\n"
        "}\n");
    doc.root().child("list")->erase(std::size_t{0});
    EXPECT_EQ(doc.to_string(),
              "{\n"
              "  \"list\": [\n"
              "    \"b\", /* keep */\n"
              "    \"c\"\n"
              "  ]\n"
              "}\n");
}

TEST(Serializer, element_update_keeps_trailing_comma) {
    auto doc = Document::parse("{\"list\": [\"a\", /* keep */ \"b\", \"c\",]}\n");
    doc.root().child("list")->set(std::size_t{0}, "z");
    EXPECT_EQ(doc.to_string(), "{\"list\": [\"z\", /* keep */ \"b\", \"c\",]}\n");
}

TEST(Serializer, several_deletions_in_one_array) {
    auto doc = Document::parse("{\"list\": [1, 2, 3, 4]}\n");
    auto list = *doc.root().child("list");
    list.erase(std::size_t{0});
    list.erase(std::size_t{2});
    list.set(std::size_t{3}, 40);
    EXPECT_EQ(doc.to_string(), "{\"list\": [2, 40]}\n");
    EXPECT_EQ(doc.materialize(), Json::parse(R"({"list": [2, 40]})"));
}

TEST(Serializer, new_nested_object_is_indented) {
    auto doc = Document::parse(service_text);
    doc.update("server.tls.enabled", true);
    EXPECT_EQ(doc.to_string(),
              "{\n"
              "  // service name\n"
              "  \"name\": \"svc\",\n"
              "  \"server\": {\n"
              "    \"host\": \"localhost\", // inline\n"
              "    \"port\": 80,\n"
              "    \"tls\": {\n"
              "      \"enabled\": true\n"
              "    }\n"
              "  }\n"
              "}\n");
}

TEST(Serializer, repeated_round_trips_stay_consistent) {
    auto text = std::string{service_text};
    for (int round = 0; round < 3; ++round) {
        auto doc = Document::parse(text);
        doc.update("server.port", 9000 + round);
        doc.update("rounds", round + 1);
        text = doc.to_string();
    }
    auto final_value = parse(text);
    EXPECT_EQ(final_value["server"]["port"], 9002);
    EXPECT_EQ(final_value["rounds"], 3);
    EXPECT_NE(text.find("// service name"), std::string::npos);
    EXPECT_NE(text.find("// inline"), std::string::npos);
    EXPECT_EQ(Document::parse(text).to_string(), text);
}

TEST(Serializer, output_parses_to_the_materialized_value) {
    auto doc = Document::parse(service_text);
    auto root = doc.root();
    root.erase("name");
    root.set("tags", Json::parse(R"(["a", "b"])"));
    root.child("server")->set("host", "example.org");
    EXPECT_EQ(parse(doc.to_string()), doc.materialize());
}

// -- Documents without usable source text -------------------------------------

TEST(Serializer, document_without_source_is_pretty_printed) {
    auto doc = Document{};
    doc.update("a.b", 1);
    EXPECT_EQ(doc.to_string(), "{\n  \"a\": {\n    \"b\": 1\n  }\n}\n");
}

TEST(Serializer, failing_editor_falls_back_to_full_output) {
    auto quiet = QuietLog{};
    auto doc = Document::parse(service_text);
    doc.set_editor(std::make_shared<FailingEditor>());
    doc.update("name", "other");
    auto text = doc.to_string();
    EXPECT_EQ(text.find("//"), std::string::npos);
    EXPECT_EQ(parse(text), doc.materialize());
    EXPECT_EQ(text.back(), '\n');
}

TEST(Serializer, default_editor_can_be_restored) {
    auto doc = Document::parse(service_text);
    doc.set_editor(std::make_shared<FailingEditor>());
    doc.set_editor(nullptr);
    doc.update("name", "other");
    EXPECT_NE(doc.to_string().find("// service name"), std::string::npos);
}

TEST(Serializer, unparseable_source_falls_back_to_full_output) {
    auto quiet = QuietLog{};
    auto doc = Document::from_value(Json::parse(R"({"a": 1})"), std::string{"not json {"});
    doc.root().set("a", 2);
    EXPECT_EQ(doc.to_string(), "{\n  \"a\": 2\n}\n");
}
