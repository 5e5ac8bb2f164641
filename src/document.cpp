#include "document.hpp"
#include "observability.hpp"
#include "utils/hex.hpp"
#include <chrono>
#include <utility>

namespace jsonbcpp {

Document::Document(std::vector<std::byte> bytes) : m_bytes(std::move(bytes)) {}

Document Document::from_hex(std::string_view hex) {
  return Document(utils::hex_decode(hex));
}

Value Document::root() const {
  log_if_enabled(LogLevel::Debug, "root called.", "DocumentRoot",
                 std::chrono::microseconds(0), 0);
  try {
    Value value = Value::from(std::span<const std::byte>(m_bytes));
    metrics_if_enabled([&](IMetrics &m) {
      m.record_bytes_decoded(m_bytes.size());
      m.increment_operation_count("DocumentRoot", "ok");
    });
    return value;
  } catch (const decode_error &) {
    metrics_if_enabled([](IMetrics &m) {
      m.increment_operation_count("DocumentRoot", "error");
    });
    throw;
  }
}

} // namespace jsonbcpp
