#ifndef JSONBCPP_HASH_HPP
#define JSONBCPP_HASH_HPP

#include <cstdint>
#include <string_view>

namespace jsonbcpp::utils {

    uint32_t djb2_hash(std::string_view key);

} // namespace jsonbcpp::utils

#endif // JSONBCPP_HASH_HPP
