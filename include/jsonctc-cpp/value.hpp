/// @file value.hpp
/// @brief The plain data value type and helpers for inspecting it.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>

namespace jsonctc_cpp {

/// A plain data value: null, boolean, number, string, array or object.
///
/// Objects keep insertion order, so a document materialized from source
/// text lists its keys in the order the text does.
using Json = nlohmann::ordered_json;

/// The runtime type tags used when comparing values.
///
/// Integer, unsigned and floating-point numbers share one tag.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:    return "null";
        case ValueKind::boolean: return "boolean";
        case ValueKind::number:  return "number";
        case ValueKind::string:  return "string";
        case ValueKind::array:   return "array";
        case ValueKind::object:  return "object";
    }
    return "unknown";
}

/// Classify a value.
inline auto kind_of(const Json& value) noexcept -> ValueKind {
    switch (value.type()) {
        case Json::value_t::boolean:         return ValueKind::boolean;
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:    return ValueKind::number;
        case Json::value_t::string:          return ValueKind::string;
        case Json::value_t::array:           return ValueKind::array;
        case Json::value_t::object:          return ValueKind::object;
        case Json::value_t::null:
        case Json::value_t::binary:
        case Json::value_t::discarded:       return ValueKind::null;
    }
    return ValueKind::null;
}

/// Check if a value is an object or an array.
inline auto is_structured(const Json& value) noexcept -> bool {
    return value.is_object() || value.is_array();
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& key) { ... },
///     [](std::size_t index) { ... },
/// }, element);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonctc_cpp
