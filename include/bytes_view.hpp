#ifndef JSONBCPP_BYTES_VIEW_HPP
#define JSONBCPP_BYTES_VIEW_HPP

#include <cstddef>
#include <span>
#include <string_view>

namespace jsonbcpp {

    // Read-only [start, end) window over a borrowed byte buffer. Indices are
    // absolute positions in the backing buffer, so sub-views of the same
    // buffer can be compared and chained without rebasing. The backing buffer
    // must outlive every view taken from it.
    class BytesView {
    public:
        BytesView() = default;
        explicit BytesView(std::span<const std::byte> buffer);
        BytesView(std::span<const std::byte> buffer, size_t start, size_t end);

        size_t start_index() const { return m_start; }
        size_t end_index() const { return m_end; }
        size_t size() const { return m_end - m_start; }
        bool empty() const { return m_start == m_end; }

        // index is absolute: start_index() <= index < end_index()
        std::byte operator[](size_t index) const;

        BytesView slice(size_t start, size_t end) const;
        BytesView suffix(size_t start) const { return slice(start, m_end); }

        std::span<const std::byte> bytes() const { return m_buffer.subspan(m_start, size()); }
        std::span<const std::byte> backing() const { return m_buffer; }
        std::string_view as_string_view() const;

        bool operator==(const BytesView& other) const;
        bool operator!=(const BytesView& other) const { return !(*this == other); }

    private:
        std::span<const std::byte> m_buffer;
        size_t m_start = 0;
        size_t m_end = 0;
    };

} // namespace jsonbcpp

#endif // JSONBCPP_BYTES_VIEW_HPP
