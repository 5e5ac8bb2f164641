#ifndef JSONBCPP_JSON_HPP
#define JSONBCPP_JSON_HPP

#include "value.hpp"
#include <string>

namespace jsonbcpp::jsonb_json {

    // Renders a decoded value as JSON text, the way SQLite's json() does:
    // JSON5 numbers become canonical, text escapes are re-encoded, duplicate
    // object keys keep the last value. Throws decode_error on malformed input,
    // UnhandledType for reserved element types and NestingTooDeep past
    // config::max_depth levels.
    std::string to_json_string(const Value& value, bool pretty = false);

} // namespace jsonbcpp::jsonb_json

#endif // JSONBCPP_JSON_HPP
