#ifndef JSONBCPP_TEXT_HPP
#define JSONBCPP_TEXT_HPP

#include <string>

#include "value.hpp"

namespace jsonbcpp {

    // Native UTF-8 string for a Text/TextJ/Text5/TextRaw value, with escapes
    // resolved. Throws decode_error(InvalidUTF8) on malformed text or
    // escapes and decode_error(UnhandledType) for any other type.
    std::string decode_string(const Value& value);

    // Object key conversion; same rules as decode_string.
    std::string decode_key(const Value& key);

} // namespace jsonbcpp

#endif // JSONBCPP_TEXT_HPP
