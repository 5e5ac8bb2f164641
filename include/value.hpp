#ifndef JSONBCPP_VALUE_HPP
#define JSONBCPP_VALUE_HPP

#include <cstdint>
#include <cstddef>
#include <span>
#include <vector>

#include "bytes_view.hpp"
#include "type.hpp"

namespace jsonbcpp {

    class Object;
    class Elements;
    class Members;

    // A decoded element: its type and a view of its payload in the caller's
    // buffer. Containers are not expanded until elements()/members() or
    // array()/object() is called, and nothing is cached between calls.
    class Value {
    public:
        Value() = default;

        static Value from(const BytesView& buffer);
        static Value from(std::span<const std::byte> bytes);
        static Value null() { return Value(); }

        Type type() const { return m_type; }
        const BytesView& payload() const { return m_payload; }

        bool empty() const { return m_payload.empty(); }
        size_t start_index() const { return m_payload.start_index(); }
        size_t end_index() const { return m_payload.end_index(); }

        // Lazy traversal. Empty unless the value is an array/object.
        Elements elements() const;
        Members members() const;

        // Eager traversal. Empty unless the value is an array/object; the
        // first malformed child throws and nothing is returned.
        std::vector<Value> array() const;
        Object object() const;

        bool operator==(const Value& other) const;
        bool operator!=(const Value& other) const { return !(*this == other); }

    private:
        Value(Type type, BytesView payload) : m_type(type), m_payload(payload) {}

        Type m_type = Type::Null;
        BytesView m_payload;
    };

    using Array = std::vector<Value>;

} // namespace jsonbcpp

#endif // JSONBCPP_VALUE_HPP
