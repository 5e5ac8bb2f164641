#ifndef JSONBCPP_NUMBER_HPP
#define JSONBCPP_NUMBER_HPP

#include <cstdint>
#include <string_view>

#include "value.hpp"

namespace jsonbcpp {

    // RFC 8259 number grammar: optional '-', then '0' or a nonzero digit
    // followed by digits, optional fraction, optional exponent. With
    // integer_only the fraction and exponent are rejected.
    bool is_canonical_number(std::string_view text, bool integer_only = false);

    // True/False only.
    bool to_bool(const Value& value);

    // Int and Int5 (decimal or 0x-prefixed hex, optional sign).
    int64_t to_int64(const Value& value);

    // Any numeric type. Float5 also accepts a leading '+', a bare leading or
    // trailing '.', Infinity and NaN.
    double to_double(const Value& value);

} // namespace jsonbcpp

#endif // JSONBCPP_NUMBER_HPP
