#ifndef JSONBCPP_ITERATOR_HPP
#define JSONBCPP_ITERATOR_HPP

#include "bytes_view.hpp"
#include "value.hpp"
#include <cstddef>
#include <iterator>

namespace jsonbcpp {

    // Walks the children of an array payload, decoding one header per step.
    // A malformed child throws from begin() or operator++.
    class ElementIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Value;
        using difference_type = std::ptrdiff_t;
        using pointer = const Value*;
        using reference = const Value&;

        ElementIterator() = default;
        explicit ElementIterator(const BytesView& payload);

        ElementIterator& operator++();
        ElementIterator operator++(int);

        const Value& operator*() const { return m_current; }
        const Value* operator->() const { return &m_current; }

        bool operator==(const ElementIterator& other) const;
        bool operator!=(const ElementIterator& other) const { return !(*this == other); }

    private:
        void decode_current();

        BytesView m_payload;
        size_t m_index = 0;
        bool m_at_end = true;
        Value m_current;
    };

    struct Member {
        Value key;
        Value value;
    };

    // Walks the key/value pairs of an object payload. Keys are left encoded.
    class MemberIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Member;
        using difference_type = std::ptrdiff_t;
        using pointer = const Member*;
        using reference = const Member&;

        MemberIterator() = default;
        explicit MemberIterator(const BytesView& payload);

        MemberIterator& operator++();
        MemberIterator operator++(int);

        const Member& operator*() const { return m_current; }
        const Member* operator->() const { return &m_current; }

        bool operator==(const MemberIterator& other) const;
        bool operator!=(const MemberIterator& other) const { return !(*this == other); }

    private:
        void decode_current();

        BytesView m_payload;
        size_t m_index = 0;
        bool m_at_end = true;
        Member m_current;
    };

    class Elements {
    public:
        explicit Elements(const BytesView& payload) : m_payload(payload) {}
        ElementIterator begin() const { return ElementIterator(m_payload); }
        ElementIterator end() const { return ElementIterator(); }

    private:
        BytesView m_payload;
    };

    class Members {
    public:
        explicit Members(const BytesView& payload) : m_payload(payload) {}
        MemberIterator begin() const { return MemberIterator(m_payload); }
        MemberIterator end() const { return MemberIterator(); }

    private:
        BytesView m_payload;
    };

} // namespace jsonbcpp

#endif // JSONBCPP_ITERATOR_HPP
