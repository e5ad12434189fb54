// parser_test.cpp — Tests for the JSONC parser and syntax tree

#include <jsonctc-cpp/parser.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace jsonctc_cpp;

namespace {

auto parse_error_of(std::string_view text, const ParseOptions& options = {}) -> ParseError {
    try {
        (void)parse(text, options);
    } catch (const ParseException& e) {
        return e.detail();
    }
    ADD_FAILURE() << "expected a parse error for: " << text;
    return ParseError{ParseErrorCode::invalid_symbol, 0, 0, 0, 0};
}

}  // namespace

// =============================================================================
// Plain values
// =============================================================================

TEST(Parse, plain_json) {
    auto value = parse(R"({"a": 1, "b": [true, null, "x"], "c": {"d": 2.5}})");
    EXPECT_EQ(value["a"], 1);
    EXPECT_EQ(value["b"][0], true);
    EXPECT_TRUE(value["b"][1].is_null());
    EXPECT_EQ(value["b"][2], "x");
    EXPECT_DOUBLE_EQ(value["c"]["d"].get<double>(), 2.5);
}

TEST(Parse, comments_and_trailing_commas) {
    auto value = parse(R"(
        // leading
        {
            "a": 1, /* inline */
            "b": [1, 2, 3,],
        }
    )");
    EXPECT_EQ(value, Json::parse(R"({"a": 1, "b": [1, 2, 3]})"));
}

TEST(Parse, keeps_source_key_order) {
    auto value = parse(R"({"z": 1, "a": 2, "m": 3})");
    auto keys = std::vector<std::string>{};
    for (const auto& [key, item] : value.items()) keys.push_back(key);
    EXPECT_EQ(keys, (std::vector<std::string>{"z", "a", "m"}));
}

TEST(Parse, duplicate_keys_last_wins) {
    auto value = parse(R"({"a": 1, "b": 2, "a": 3})");
    EXPECT_EQ(value["a"], 3);
    EXPECT_EQ(value.size(), 2u);
    EXPECT_EQ(value.begin().key(), "a");
}

TEST(Parse, number_types) {
    auto value = parse(R"([42, -7, 18446744073709551615, 1.5, 1e3])");
    EXPECT_TRUE(value[0].is_number_integer());
    EXPECT_EQ(value[1].get<std::int64_t>(), -7);
    EXPECT_TRUE(value[2].is_number_unsigned());
    EXPECT_EQ(value[2].get<std::uint64_t>(), 18446744073709551615ull);
    EXPECT_TRUE(value[3].is_number_float());
    EXPECT_DOUBLE_EQ(value[4].get<double>(), 1000.0);
}

TEST(Parse, primitive_root) {
    EXPECT_EQ(parse("  \"hello\" "), "hello");
    EXPECT_EQ(parse("false"), false);
}

TEST(Parse, empty_content) {
    EXPECT_EQ(parse_error_of("").code, ParseErrorCode::value_expected);
    EXPECT_TRUE(parse("", ParseOptions{.allow_empty_content = true}).is_null());
    EXPECT_TRUE(parse("// only a comment\n", ParseOptions{.allow_empty_content = true}).is_null());
}

// =============================================================================
// Errors
// =============================================================================

TEST(ParseErrors, codes) {
    EXPECT_EQ(parse_error_of(R"({"a" 1})").code, ParseErrorCode::colon_expected);
    EXPECT_EQ(parse_error_of(R"({"a": 1 "b": 2})").code, ParseErrorCode::comma_expected);
    EXPECT_EQ(parse_error_of(R"({1: 2})").code, ParseErrorCode::property_name_expected);
    EXPECT_EQ(parse_error_of(R"({"a": })").code, ParseErrorCode::value_expected);
    EXPECT_EQ(parse_error_of(R"({"a": 1)").code, ParseErrorCode::close_brace_expected);
    EXPECT_EQ(parse_error_of(R"([1, 2)").code, ParseErrorCode::close_bracket_expected);
    EXPECT_EQ(parse_error_of(R"({} {})").code, ParseErrorCode::end_of_file_expected);
    EXPECT_EQ(parse_error_of(R"([tru])").code, ParseErrorCode::invalid_symbol);
    EXPECT_EQ(parse_error_of(R"(["abc)").code, ParseErrorCode::unexpected_end_of_string);
    EXPECT_EQ(parse_error_of(R"([1.])").code, ParseErrorCode::unexpected_end_of_number);
    EXPECT_EQ(parse_error_of("[1] /* open").code, ParseErrorCode::unexpected_end_of_comment);
}

TEST(ParseErrors, options_can_forbid_extensions) {
    auto strict = ParseOptions{.allow_trailing_comma = false, .allow_comments = false};
    EXPECT_EQ(parse_error_of("[1, 2,]", strict).code, ParseErrorCode::value_expected);
    EXPECT_EQ(parse_error_of(R"({"a": 1,})", strict).code, ParseErrorCode::property_name_expected);
    EXPECT_EQ(parse_error_of("// c\n[]", strict).code, ParseErrorCode::invalid_comment_token);
}

TEST(ParseErrors, report_line_and_column) {
    auto error = parse_error_of("{\n  \"a\": 1,\n  \"b\" 2\n}");
    EXPECT_EQ(error.code, ParseErrorCode::colon_expected);
    EXPECT_EQ(error.line, 3u);
    EXPECT_EQ(error.column, 7u);
    EXPECT_EQ(error.length, 1u);
}

TEST(ParseErrors, exception_kind_is_parse_error) {
    try {
        (void)parse("[");
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::parse_error);
    }
}

// =============================================================================
// Syntax tree
// =============================================================================

TEST(ParseTree, records_offsets) {
    auto text = std::string_view{R"({"a": [10, "x"]})"};
    auto tree = parse_tree(text);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->type, NodeType::object);
    EXPECT_EQ(tree->offset, 0u);
    EXPECT_EQ(tree->length, text.size());

    ASSERT_EQ(tree->children.size(), 1u);
    const auto& property = tree->children[0];
    EXPECT_EQ(property.type, NodeType::property);
    ASSERT_EQ(property.children.size(), 2u);
    EXPECT_EQ(property.children[0].value, "a");
    EXPECT_EQ(property.colon_offset, std::size_t{4});

    const auto& array = property.children[1];
    EXPECT_EQ(array.type, NodeType::array);
    EXPECT_EQ(text.substr(array.offset, array.length), R"([10, "x"])");
    EXPECT_EQ(text.substr(array.children[1].offset, array.children[1].length), R"("x")");
}

TEST(ParseTree, empty_content_is_nullopt) {
    EXPECT_FALSE(parse_tree("  ", ParseOptions{.allow_empty_content = true}).has_value());
}

TEST(ParseTree, node_value_of_subtree) {
    auto tree = parse_tree(R"({"a": {"b": [1, 2]}})");
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(node_value(tree->children[0].children[1]), Json::parse(R"({"b": [1, 2]})"));
}

TEST(FindNode, resolves_keys_indices_and_numeral_strings) {
    auto text = std::string_view{R"({"list": [{"x": 1}, {"x": 2}], "0": "zero"})"};
    auto tree = parse_tree(text);
    ASSERT_TRUE(tree.has_value());

    const auto* by_index = find_node_at_location(*tree, Path{std::string{"list"}, std::size_t{1}, std::string{"x"}});
    ASSERT_NE(by_index, nullptr);
    EXPECT_EQ(by_index->value, 2);

    const auto* by_numeral = find_node_at_location(*tree, Path{std::string{"list"}, std::string{"1"}, std::string{"x"}});
    EXPECT_EQ(by_numeral, by_index);

    const auto* object_key = find_node_at_location(*tree, Path{std::size_t{0}});
    ASSERT_NE(object_key, nullptr);
    EXPECT_EQ(object_key->value, "zero");
}

TEST(FindNode, missing_paths_are_null) {
    auto tree = parse_tree(R"({"a": [1]})");
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(find_node_at_location(*tree, Path{std::string{"b"}}), nullptr);
    EXPECT_EQ(find_node_at_location(*tree, Path{std::string{"a"}, std::size_t{3}}), nullptr);
    EXPECT_EQ(find_node_at_location(*tree, Path{std::string{"a"}, std::string{"x"}}), nullptr);
    EXPECT_EQ(find_node_at_location(*tree, Path{std::string{"a"}, std::size_t{0}, std::string{"y"}}), nullptr);
}

TEST(FindNode, root_for_empty_path) {
    auto tree = parse_tree("[1]");
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(find_node_at_location(*tree, Path{}), &*tree);
}

TEST(FindNode, duplicate_keys_resolve_to_last) {
    auto text = std::string_view{R"({"a": 1, "a": 2})"};
    auto tree = parse_tree(text);
    ASSERT_TRUE(tree.has_value());
    const auto* node = find_node_at_location(*tree, Path{std::string{"a"}});
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->value, 2);
}
