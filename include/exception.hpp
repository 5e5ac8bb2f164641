#ifndef JSONBCPP_EXCEPTION_HPP
#define JSONBCPP_EXCEPTION_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jsonbcpp {

    class exception : public std::runtime_error {
    public:
        explicit exception(const std::string& what) : std::runtime_error(what) {}
    };

    enum class ErrorKind : uint8_t {
        InvalidHeader,
        UnknownType,
        InvalidSizeType,
        InvalidUTF8,
        UnhandledType,
        InvalidNumber,
        NestingTooDeep
    };

    std::string_view to_string(ErrorKind kind);

    // Raised for malformed input. detail() holds the raw type tag for
    // UnknownType/UnhandledType and the size class for InvalidSizeType.
    class decode_error : public exception {
    public:
        decode_error(ErrorKind kind, const std::string& what, uint8_t detail = 0)
            : exception(what), m_kind(kind), m_detail(detail) {}

        ErrorKind kind() const noexcept { return m_kind; }
        uint8_t detail() const noexcept { return m_detail; }

    private:
        ErrorKind m_kind;
        uint8_t m_detail;
    };

    // Logs the failure at Warn against `operation` and `offset`, counts it
    // with the installed metrics, then throws decode_error.
    [[noreturn]] void throw_decode_error(ErrorKind kind, const std::string& message, std::string_view operation,
                                         size_t offset, uint8_t detail = 0);

} // namespace jsonbcpp

#endif // JSONBCPP_EXCEPTION_HPP
