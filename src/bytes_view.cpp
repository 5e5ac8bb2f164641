#include "bytes_view.hpp"
#include "exception.hpp"
#include <string>

namespace jsonbcpp {

    BytesView::BytesView(std::span<const std::byte> buffer)
        : m_buffer(buffer), m_start(0), m_end(buffer.size()) {}

    BytesView::BytesView(std::span<const std::byte> buffer, size_t start, size_t end)
        : m_buffer(buffer), m_start(start), m_end(end) {
        if (start > end || end > buffer.size()) {
            throw jsonbcpp::exception("BytesView range [" + std::to_string(start) + ", " + std::to_string(end) +
                                      ") outside buffer of " + std::to_string(buffer.size()) + " bytes");
        }
    }

    std::byte BytesView::operator[](size_t index) const {
        if (index < m_start || index >= m_end) {
            throw jsonbcpp::exception("BytesView index " + std::to_string(index) + " out of range");
        }
        return m_buffer[index];
    }

    BytesView BytesView::slice(size_t start, size_t end) const {
        if (start < m_start || start > end || end > m_end) {
            throw jsonbcpp::exception("BytesView slice [" + std::to_string(start) + ", " + std::to_string(end) +
                                      ") outside [" + std::to_string(m_start) + ", " + std::to_string(m_end) + ")");
        }
        BytesView view;
        view.m_buffer = m_buffer;
        view.m_start = start;
        view.m_end = end;
        return view;
    }

    std::string_view BytesView::as_string_view() const {
        if (empty()) {
            return {};
        }
        return std::string_view(reinterpret_cast<const char*>(m_buffer.data() + m_start), size());
    }

    bool BytesView::operator==(const BytesView& other) const {
        return m_buffer.data() == other.m_buffer.data() && m_buffer.size() == other.m_buffer.size() &&
               m_start == other.m_start && m_end == other.m_end;
    }

} // namespace jsonbcpp
