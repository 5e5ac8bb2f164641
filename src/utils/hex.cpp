#include "utils/hex.hpp"
#include "exception.hpp"

namespace jsonbcpp::utils {

// Helper to convert a hex character to its integer value
static unsigned char hex_char_to_int(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    throw jsonbcpp::exception(std::string("Invalid hex character '") + c + "'");
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::vector<std::byte> hex_decode(std::string_view hex_string) {
    std::string digits;
    digits.reserve(hex_string.length());
    for (char c : hex_string) {
        if (!is_space(c)) {
            digits.push_back(c);
        }
    }

    if (digits.length() % 2 != 0) {
        throw jsonbcpp::exception("Hex string length must be even.");
    }

    std::vector<std::byte> bytes;
    bytes.reserve(digits.length() / 2);

    for (size_t i = 0; i < digits.length(); i += 2) {
        unsigned char high_nibble = hex_char_to_int(digits[i]);
        unsigned char low_nibble = hex_char_to_int(digits[i+1]);
        bytes.push_back(static_cast<std::byte>((high_nibble << 4) | low_nibble));
    }
    return bytes;
}

std::string hex_encode(std::span<const std::byte> bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::byte b : bytes) {
        auto v = std::to_integer<unsigned char>(b);
        out.push_back(digits[v >> 4]);
        out.push_back(digits[v & 0x0F]);
    }
    return out;
}

} // namespace jsonbcpp::utils
