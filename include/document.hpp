#ifndef JSONBCPP_DOCUMENT_HPP
#define JSONBCPP_DOCUMENT_HPP

#include <cstddef>
#include <string_view>
#include <vector>

#include "bytes_view.hpp"
#include "exception.hpp"
#include "iterator.hpp"
#include "object.hpp"
#include "value.hpp"


namespace jsonbcpp {

// Owns a JSONB blob. Values returned by root() borrow the document's bytes
// and stay valid while the document lives (moves included).
class Document {
public:
  Document() = default;
  explicit Document(std::vector<std::byte> bytes);

  static Document from_hex(std::string_view hex);

  Value root() const;

  const std::vector<std::byte> &bytes() const { return m_bytes; }
  size_t size() const { return m_bytes.size(); }

private:
  std::vector<std::byte> m_bytes;
};

} // namespace jsonbcpp

#endif // JSONBCPP_DOCUMENT_HPP
