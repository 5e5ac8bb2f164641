#include "exception.hpp"
#include "observability.hpp"

namespace jsonbcpp {

    std::string_view to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidHeader: return "invalid header";
            case ErrorKind::UnknownType: return "unknown type";
            case ErrorKind::InvalidSizeType: return "invalid size type";
            case ErrorKind::InvalidUTF8: return "invalid UTF-8";
            case ErrorKind::UnhandledType: return "unhandled type";
            case ErrorKind::InvalidNumber: return "invalid number";
            case ErrorKind::NestingTooDeep: return "nesting too deep";
        }
        return "unknown error";
    }

    void throw_decode_error(ErrorKind kind, const std::string& message, std::string_view operation,
                            size_t offset, uint8_t detail) {
        log_if_enabled(LogLevel::Warn, message, operation, std::chrono::microseconds(0), offset);
        metrics_if_enabled([kind](IMetrics& m) { m.record_error(kind); });
        throw decode_error(kind, message, detail);
    }

} // namespace jsonbcpp
