#include "header.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "utils/endian.hpp"
#include <string>

namespace jsonbcpp {

    namespace {
        constexpr uint8_t TYPE_MASK = 0x0F;  // 4 LSB
        constexpr uint8_t SIZE_SHIFT = 4;    // 4 MSB

        [[noreturn]] void fail(ErrorKind kind, const std::string& message, size_t offset, uint8_t detail = 0) {
            throw_decode_error(kind, message, "DecodeHeader", offset, detail);
        }
    }

    std::optional<size_t> size_bytes_for_class(uint8_t size_class) {
        if (size_class <= config::inline_size_max) {
            return 0;
        }
        if (size_class > 15) {
            return std::nullopt;
        }
        // 12 -> 1, 13 -> 2, 14 -> 4, 15 -> 8
        return size_t{1} << (size_class - config::size_class_u8);
    }

    Header decode_header(const BytesView& buffer) {
        if (buffer.empty()) {
            fail(ErrorKind::InvalidHeader, "empty buffer where a header was expected", buffer.start_index());
        }

        const size_t index = buffer.start_index();
        const auto first_byte = std::to_integer<uint8_t>(buffer[index]);

        const uint8_t raw_type = first_byte & TYPE_MASK;
        auto type = type_from_raw(raw_type);
        if (!type) {
            fail(ErrorKind::UnknownType, "unknown element type " + std::to_string(raw_type), index, raw_type);
        }

        const uint8_t size_class = first_byte >> SIZE_SHIFT;
        auto size_bytes = size_bytes_for_class(size_class);
        if (!size_bytes) {
            fail(ErrorKind::InvalidSizeType, "invalid size class " + std::to_string(size_class), index, size_class);
        }

        // Compare against the remaining length rather than computing
        // start + length, which can wrap for 8-byte size fields.
        const size_t available = buffer.end_index() - index - 1;
        if (*size_bytes > available) {
            fail(ErrorKind::InvalidHeader,
                 "size field needs " + std::to_string(*size_bytes) + " bytes, " + std::to_string(available) + " left",
                 index);
        }

        const size_t payload_start = index + 1 + *size_bytes;
        const uint64_t payload_size = *size_bytes == 0
            ? size_class
            : utils::bytes_to_uint(buffer.slice(index + 1, payload_start), true);

        if (payload_size > buffer.end_index() - payload_start) {
            fail(ErrorKind::InvalidHeader,
                 "payload of " + std::to_string(payload_size) + " bytes runs past end of buffer at " +
                     std::to_string(buffer.end_index()),
                 index);
        }

        const size_t payload_end = payload_start + static_cast<size_t>(payload_size);
        return Header{*type, 1 + *size_bytes, buffer.slice(payload_start, payload_end)};
    }

} // namespace jsonbcpp
