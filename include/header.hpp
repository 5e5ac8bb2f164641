#ifndef JSONBCPP_HEADER_HPP
#define JSONBCPP_HEADER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

#include "bytes_view.hpp"
#include "type.hpp"

namespace jsonbcpp {

    // One decoded element header. payload never includes the header bytes.
    struct Header {
        Type type;
        size_t header_size;
        BytesView payload;
    };

    // Number of big-endian size bytes that follow the first byte for a size
    // class (0 for 0..11, then 1/2/4/8). nullopt if the class is undefined.
    std::optional<size_t> size_bytes_for_class(uint8_t size_class);

    // Decodes the header starting at buffer.start_index(). Throws
    // decode_error(InvalidHeader) when the buffer is empty, the size field is
    // cut short, or the declared payload runs past buffer.end_index().
    Header decode_header(const BytesView& buffer);

} // namespace jsonbcpp

#endif // JSONBCPP_HEADER_HPP
