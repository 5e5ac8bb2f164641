#ifndef JSONBCPP_UTILS_UTF8_HPP
#define JSONBCPP_UTILS_UTF8_HPP

#include <string>
#include <string_view>

namespace jsonbcpp::utils {

    // Well-formed UTF-8 per RFC 3629: no overlongs, no surrogates, <= U+10FFFF.
    bool is_valid_utf8(std::string_view text);

    // Appends the UTF-8 encoding of `cp`. Returns false for surrogates and
    // values above U+10FFFF, leaving `out` untouched.
    bool append_utf8(std::string& out, char32_t cp);

} // namespace jsonbcpp::utils

#endif // JSONBCPP_UTILS_UTF8_HPP
