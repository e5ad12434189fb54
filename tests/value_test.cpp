#include <jsonctc-cpp/value.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>

using namespace jsonctc_cpp;

TEST(ValueKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ValueKind::null),    "null");
    EXPECT_EQ(to_string_view(ValueKind::boolean), "boolean");
    EXPECT_EQ(to_string_view(ValueKind::number),  "number");
    EXPECT_EQ(to_string_view(ValueKind::string),  "string");
    EXPECT_EQ(to_string_view(ValueKind::array),   "array");
    EXPECT_EQ(to_string_view(ValueKind::object),  "object");
}

TEST(ValueKind, numbers_share_one_kind) {
    EXPECT_EQ(kind_of(Json(std::int64_t{-1})), ValueKind::number);
    EXPECT_EQ(kind_of(Json(std::uint64_t{1})), ValueKind::number);
    EXPECT_EQ(kind_of(Json(1.5)), ValueKind::number);
}

TEST(ValueKind, classifies_each_type) {
    EXPECT_EQ(kind_of(Json(nullptr)), ValueKind::null);
    EXPECT_EQ(kind_of(Json(true)), ValueKind::boolean);
    EXPECT_EQ(kind_of(Json("x")), ValueKind::string);
    EXPECT_EQ(kind_of(Json::array()), ValueKind::array);
    EXPECT_EQ(kind_of(Json::object()), ValueKind::object);
}

TEST(Value, is_structured) {
    EXPECT_TRUE(is_structured(Json::array()));
    EXPECT_TRUE(is_structured(Json::object()));
    EXPECT_FALSE(is_structured(Json("[]")));
    EXPECT_FALSE(is_structured(Json(nullptr)));
}

TEST(Value, objects_keep_insertion_order) {
    auto value = Json::object();
    value["z"] = 1;
    value["a"] = 2;
    EXPECT_EQ(value.dump(), R"({"z":1,"a":2})");
}

TEST(Value, overload_visitor) {
    auto describe = [](const std::variant<std::string, std::size_t>& element) {
        return std::visit(overload{
            [](const std::string& key) { return "key " + key; },
            [](std::size_t index) { return "index " + std::to_string(index); },
        }, element);
    };
    EXPECT_EQ(describe(std::string{"port"}), "key port");
    EXPECT_EQ(describe(std::size_t{3}), "index 3");
}
