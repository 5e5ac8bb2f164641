#ifndef JSONBCPP_UTILS_ENDIAN_HPP
#define JSONBCPP_UTILS_ENDIAN_HPP

#include <cstdint>
#include "bytes_view.hpp"

namespace jsonbcpp::utils {

    // Unsigned integer stored in `range` (at most 8 bytes). Independent of the
    // host byte order. An empty range is 0.
    uint64_t bytes_to_uint(const BytesView& range, bool big_endian);

} // namespace jsonbcpp::utils

#endif // JSONBCPP_UTILS_ENDIAN_HPP
