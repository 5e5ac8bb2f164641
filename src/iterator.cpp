#include "iterator.hpp"

namespace jsonbcpp {

    ElementIterator::ElementIterator(const BytesView& payload)
        : m_payload(payload), m_index(payload.start_index()), m_at_end(false) {
        decode_current();
    }

    ElementIterator& ElementIterator::operator++() {
        m_index = m_current.end_index();
        decode_current();
        return *this;
    }

    ElementIterator ElementIterator::operator++(int) {
        ElementIterator previous = *this;
        ++(*this);
        return previous;
    }

    bool ElementIterator::operator==(const ElementIterator& other) const {
        if (m_at_end || other.m_at_end) {
            return m_at_end == other.m_at_end;
        }
        return m_payload == other.m_payload && m_index == other.m_index;
    }

    void ElementIterator::decode_current() {
        if (m_index >= m_payload.end_index()) {
            m_at_end = true;
            m_current = Value::null();
            return;
        }
        m_current = Value::from(m_payload.suffix(m_index));
    }

    MemberIterator::MemberIterator(const BytesView& payload)
        : m_payload(payload), m_index(payload.start_index()), m_at_end(false) {
        decode_current();
    }

    MemberIterator& MemberIterator::operator++() {
        m_index = m_current.value.end_index();
        decode_current();
        return *this;
    }

    MemberIterator MemberIterator::operator++(int) {
        MemberIterator previous = *this;
        ++(*this);
        return previous;
    }

    bool MemberIterator::operator==(const MemberIterator& other) const {
        if (m_at_end || other.m_at_end) {
            return m_at_end == other.m_at_end;
        }
        return m_payload == other.m_payload && m_index == other.m_index;
    }

    void MemberIterator::decode_current() {
        // A single trailing byte cannot hold a key and a value; stop there.
        if (m_index + 1 >= m_payload.end_index()) {
            m_at_end = true;
            m_current = Member{};
            return;
        }
        // A key with nothing after it fails in the value's header decode.
        Value key = Value::from(m_payload.suffix(m_index));
        Value value = Value::from(m_payload.suffix(key.end_index()));
        m_current = Member{key, value};
    }

} // namespace jsonbcpp
