#ifndef JSONBCPP_UTILS_HEX_HPP
#define JSONBCPP_UTILS_HEX_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstddef> // For std::byte
#include <span>

namespace jsonbcpp::utils {

// Decodes a hex string into a vector of bytes. ASCII whitespace between
// digit pairs is skipped so blobs can be pasted from sqlite3's hex() output
// or written grouped in tests.
// Throws jsonbcpp::exception if the input string is not a valid hex string.
std::vector<std::byte> hex_decode(std::string_view hex_string);

// Lower-case hex, two digits per byte.
std::string hex_encode(std::span<const std::byte> bytes);

} // namespace jsonbcpp::utils

#endif // JSONBCPP_UTILS_HEX_HPP
