#ifndef JSONBCPP_CONFIG_HPP
#define JSONBCPP_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace jsonbcpp::config {
    constexpr uint8_t inline_size_max = 11;   // size classes 0..11 are the payload size
    constexpr uint8_t size_class_u8 = 12;     // first class with a trailing size field
    constexpr size_t max_depth = 1000;        // rendering recursion limit, as SQLite's JSON_MAX_DEPTH
}

#endif // JSONBCPP_CONFIG_HPP
