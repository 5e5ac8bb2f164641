#include "utils/endian.hpp"
#include "exception.hpp"
#include <string>

namespace jsonbcpp::utils {

    uint64_t bytes_to_uint(const BytesView& range, bool big_endian) {
        if (range.size() > sizeof(uint64_t)) {
            throw jsonbcpp::exception("bytes_to_uint: " + std::to_string(range.size()) + " bytes do not fit in 64 bits");
        }
        auto bytes = range.bytes();
        uint64_t value = 0;
        if (big_endian) {
            for (std::byte b : bytes) {
                value = (value << 8) | std::to_integer<uint64_t>(b);
            }
        } else {
            for (size_t i = bytes.size(); i > 0; --i) {
                value = (value << 8) | std::to_integer<uint64_t>(bytes[i - 1]);
            }
        }
        return value;
    }

} // namespace jsonbcpp::utils
