#include "number.hpp"
#include "exception.hpp"
#include <charconv>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace jsonbcpp {

    namespace {

        [[noreturn]] void unhandled(const Value& value, std::string_view wanted) {
            throw_decode_error(ErrorKind::UnhandledType,
                               "cannot convert " + std::string(to_string(value.type())) + " to " + std::string(wanted),
                               "ConvertNumber", value.start_index(), static_cast<uint8_t>(value.type()));
        }

        [[noreturn]] void invalid_number(const Value& value) {
            throw_decode_error(ErrorKind::InvalidNumber,
                               "malformed " + std::string(to_string(value.type())) + " payload \"" +
                                   std::string(value.payload().as_string_view()) + "\"",
                               "ConvertNumber", value.start_index());
        }

        struct Signed {
            bool negative;
            std::string_view digits;
        };

        Signed split_sign(std::string_view text) {
            if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
                return {text.front() == '-', text.substr(1)};
            }
            return {false, text};
        }

        bool is_hex_prefixed(std::string_view digits) {
            return digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X');
        }

        // Unsigned decimal or hex literal, whole string consumed.
        bool parse_magnitude(std::string_view digits, int base, uint64_t& out) {
            if (digits.empty()) {
                return false;
            }
            const char* first = digits.data();
            const char* last = digits.data() + digits.size();
            auto [ptr, ec] = std::from_chars(first, last, out, base);
            return ec == std::errc() && ptr == last;
        }

        bool apply_sign(bool negative, uint64_t magnitude, int64_t& out) {
            constexpr uint64_t max_positive = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            if (!negative) {
                if (magnitude > max_positive) {
                    return false;
                }
                out = static_cast<int64_t>(magnitude);
                return true;
            }
            if (magnitude > max_positive + 1) {
                return false;
            }
            out = magnitude == max_positive + 1 ? std::numeric_limits<int64_t>::min()
                                                : -static_cast<int64_t>(magnitude);
            return true;
        }

        int64_t parse_int(const Value& value) {
            std::string_view text = value.payload().as_string_view();
            const bool json5 = value.type() == Type::Int5;
            if (!json5 && !is_canonical_number(text, true)) {
                invalid_number(value);
            }
            auto [negative, digits] = split_sign(text);

            uint64_t magnitude = 0;
            bool ok = json5 && is_hex_prefixed(digits)
                ? parse_magnitude(digits.substr(2), 16, magnitude)
                : parse_magnitude(digits, 10, magnitude);
            int64_t result = 0;
            if (!ok || !apply_sign(negative, magnitude, result)) {
                invalid_number(value);
            }
            return result;
        }

        double parse_float(const Value& value) {
            std::string_view text = value.payload().as_string_view();
            if (value.type() == Type::Float && !is_canonical_number(text)) {
                invalid_number(value);
            }
            auto [negative, digits] = split_sign(text);

            double magnitude = 0.0;
            if (value.type() == Type::Float5) {
                if (digits == "Infinity" || digits == "Inf") {
                    return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
                }
                if (digits == "NaN") {
                    return std::numeric_limits<double>::quiet_NaN();
                }
                if (is_hex_prefixed(digits)) {
                    uint64_t bits = 0;
                    if (!parse_magnitude(digits.substr(2), 16, bits)) {
                        invalid_number(value);
                    }
                    magnitude = static_cast<double>(bits);
                    return negative ? -magnitude : magnitude;
                }
            }

            if (digits.empty() || digits.front() == '-' || digits.front() == '+') {
                invalid_number(value);
            }
            const char* last = digits.data() + digits.size();
            auto [ptr, ec] = std::from_chars(digits.data(), last, magnitude, std::chars_format::general);
            if (ptr != last || (ec != std::errc() && ec != std::errc::result_out_of_range)) {
                invalid_number(value);
            }
            if (ec == std::errc::result_out_of_range) {
                // saturate like strtod: 1e999 -> inf, 1e-999 -> 0
                size_t exp = digits.find_first_of("eE");
                bool underflow = exp != std::string_view::npos && exp + 1 < digits.size() && digits[exp + 1] == '-';
                magnitude = underflow ? 0.0 : std::numeric_limits<double>::infinity();
            }
            return negative ? -magnitude : magnitude;
        }

    } // namespace

    bool is_canonical_number(std::string_view text, bool integer_only) {
        size_t i = 0;
        auto digit = [&text](size_t at) { return at < text.size() && text[at] >= '0' && text[at] <= '9'; };
        auto skip_digits = [&]() {
            const size_t first = i;
            while (digit(i)) {
                ++i;
            }
            return i > first;
        };

        if (i < text.size() && text[i] == '-') {
            ++i;
        }
        if (!digit(i)) {
            return false;
        }
        if (text[i] == '0') {
            ++i;
        } else {
            skip_digits();
        }
        if (integer_only) {
            return i == text.size();
        }
        if (i < text.size() && text[i] == '.') {
            ++i;
            if (!skip_digits()) {
                return false;
            }
        }
        if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
            ++i;
            if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
                ++i;
            }
            if (!skip_digits()) {
                return false;
            }
        }
        return i == text.size();
    }

    bool to_bool(const Value& value) {
        switch (value.type()) {
            case Type::True:
                return true;
            case Type::False:
                return false;
            default:
                unhandled(value, "bool");
        }
    }

    int64_t to_int64(const Value& value) {
        switch (value.type()) {
            case Type::Int:
            case Type::Int5:
                return parse_int(value);
            default:
                unhandled(value, "int64");
        }
    }

    double to_double(const Value& value) {
        switch (value.type()) {
            case Type::Int:
            case Type::Int5:
                return static_cast<double>(parse_int(value));
            case Type::Float:
            case Type::Float5:
                return parse_float(value);
            default:
                unhandled(value, "double");
        }
    }

} // namespace jsonbcpp
