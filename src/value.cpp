#include "value.hpp"
#include "header.hpp"
#include "iterator.hpp"
#include "object.hpp"
#include "text.hpp"

namespace jsonbcpp {

    Value Value::from(const BytesView& buffer) {
        Header header = decode_header(buffer);
        return Value(header.type, header.payload);
    }

    Value Value::from(std::span<const std::byte> bytes) {
        return from(BytesView(bytes));
    }

    Elements Value::elements() const {
        if (m_type != Type::Array) {
            return Elements(BytesView());
        }
        return Elements(m_payload);
    }

    Members Value::members() const {
        if (m_type != Type::Object) {
            return Members(BytesView());
        }
        return Members(m_payload);
    }

    Array Value::array() const {
        Array values;
        for (const Value& value : elements()) {
            values.push_back(value);
        }
        return values;
    }

    Object Value::object() const {
        Object values;
        for (const Member& member : members()) {
            values.insert_or_assign(decode_key(member.key), member.value);
        }
        return values;
    }

    bool Value::operator==(const Value& other) const {
        return m_type == other.m_type && m_payload == other.m_payload;
    }

} // namespace jsonbcpp
