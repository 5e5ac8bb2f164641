#include "text.hpp"
#include "exception.hpp"
#include "utils/utf8.hpp"
#include <optional>
#include <string_view>

namespace jsonbcpp {

    namespace {

        [[noreturn]] void invalid_text(const Value& value, const std::string& message) {
            throw_decode_error(ErrorKind::InvalidUTF8, message, "DecodeString", value.start_index());
        }

        std::optional<unsigned> hex_digit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return std::nullopt;
        }

        // Reads `count` hex digits at text[pos].
        std::optional<char32_t> read_hex(std::string_view text, size_t pos, size_t count) {
            if (text.size() - pos < count) {
                return std::nullopt;
            }
            char32_t cp = 0;
            for (size_t i = 0; i < count; ++i) {
                auto digit = hex_digit(text[pos + i]);
                if (!digit) {
                    return std::nullopt;
                }
                cp = (cp << 4) | *digit;
            }
            return cp;
        }

        bool is_line_separator(std::string_view text, size_t pos) {
            // U+2028 / U+2029
            return text.size() - pos >= 3 && text[pos] == '\xE2' && text[pos + 1] == '\x80' &&
                   (text[pos + 2] == '\xA8' || text[pos + 2] == '\xA9');
        }

        std::string unescape(const Value& value, std::string_view text, bool json5) {
            std::string out;
            out.reserve(text.size());

            size_t i = 0;
            while (i < text.size()) {
                char c = text[i];
                if (c != '\\') {
                    out.push_back(c);
                    ++i;
                    continue;
                }
                if (i + 1 >= text.size()) {
                    invalid_text(value, "dangling backslash at end of string");
                }

                char e = text[i + 1];
                i += 2;
                switch (e) {
                    case '"': out.push_back('"'); continue;
                    case '\\': out.push_back('\\'); continue;
                    case '/': out.push_back('/'); continue;
                    case 'b': out.push_back('\b'); continue;
                    case 'f': out.push_back('\f'); continue;
                    case 'n': out.push_back('\n'); continue;
                    case 'r': out.push_back('\r'); continue;
                    case 't': out.push_back('\t'); continue;
                    case 'u': {
                        auto cp = read_hex(text, i, 4);
                        if (!cp) {
                            invalid_text(value, "malformed \\u escape");
                        }
                        i += 4;
                        if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                            std::optional<char32_t> low;
                            if (text.size() - i >= 6 && text[i] == '\\' && text[i + 1] == 'u') {
                                low = read_hex(text, i + 2, 4);
                            }
                            if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                                invalid_text(value, "unpaired high surrogate in \\u escape");
                            }
                            i += 6;
                            *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                        }
                        if (!utils::append_utf8(out, *cp)) {
                            invalid_text(value, "\\u escape is not a scalar value");
                        }
                        continue;
                    }
                    default:
                        break;
                }

                if (json5) {
                    switch (e) {
                        case '\'': out.push_back('\''); continue;
                        case 'v': out.push_back('\v'); continue;
                        case '0': out.push_back('\0'); continue;
                        case 'x': {
                            auto cp = read_hex(text, i, 2);
                            if (!cp) {
                                invalid_text(value, "malformed \\x escape");
                            }
                            i += 2;
                            if (!utils::append_utf8(out, *cp)) {
                                invalid_text(value, "\\x escape is not a scalar value");
                            }
                            continue;
                        }
                        case '\n':
                            continue;
                        case '\r':
                            if (i < text.size() && text[i] == '\n') {
                                ++i;
                            }
                            continue;
                        default:
                            if (is_line_separator(text, i - 1)) {
                                i += 2;
                                continue;
                            }
                            break;
                    }
                }

                invalid_text(value, std::string("invalid escape sequence '\\") + e + "'");
            }
            return out;
        }

    } // namespace

    std::string decode_string(const Value& value) {
        const Type type = value.type();
        if (!is_text(type)) {
            throw_decode_error(ErrorKind::UnhandledType,
                               "cannot decode " + std::string(to_string(type)) + " as a string", "DecodeString",
                               value.start_index(), static_cast<uint8_t>(type));
        }

        std::string_view text = value.payload().as_string_view();
        if (!utils::is_valid_utf8(text)) {
            invalid_text(value, "string payload is not valid UTF-8");
        }

        switch (type) {
            case Type::TextJ:
                return unescape(value, text, false);
            case Type::Text5:
                return unescape(value, text, true);
            default:
                return std::string(text);
        }
    }

    std::string decode_key(const Value& key) {
        return decode_string(key);
    }

} // namespace jsonbcpp
