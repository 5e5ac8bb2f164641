#ifndef JSONBCPP_TYPE_HPP
#define JSONBCPP_TYPE_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace jsonbcpp {

    // Element type stored in the low nibble of the first header byte.
    enum class Type : uint8_t {
        Null = 0,
        True = 1,
        False = 2,
        Int = 3,         // canonical RFC 8259 integer
        Int5 = 4,        // JSON5 integer (hex, leading '+')
        Float = 5,       // canonical RFC 8259 float
        Float5 = 6,      // JSON5 float (Infinity, NaN, leading/trailing '.')
        Text = 7,        // string without escapes
        TextJ = 8,       // string with RFC 8259 escapes
        Text5 = 9,       // string with JSON5 escapes
        TextRaw = 10,    // raw UTF-8 that needs escaping on output
        Array = 11,
        Object = 12,
        Reserved13 = 13,
        Reserved14 = 14,
        Reserved15 = 15
    };

    std::optional<Type> type_from_raw(uint8_t raw);
    std::string_view to_string(Type type);

    constexpr bool is_text(Type type) {
        return type == Type::Text || type == Type::TextJ || type == Type::Text5 || type == Type::TextRaw;
    }

    constexpr bool is_numeric(Type type) {
        return type == Type::Int || type == Type::Int5 || type == Type::Float || type == Type::Float5;
    }

    constexpr bool is_container(Type type) {
        return type == Type::Array || type == Type::Object;
    }

    constexpr bool is_reserved(Type type) {
        return type == Type::Reserved13 || type == Type::Reserved14 || type == Type::Reserved15;
    }

} // namespace jsonbcpp

#endif // JSONBCPP_TYPE_HPP
