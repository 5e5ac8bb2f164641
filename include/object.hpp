#ifndef JSONBCPP_OBJECT_HPP
#define JSONBCPP_OBJECT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utils/hash.hpp"
#include "value.hpp"

namespace jsonbcpp {

    // Decoded object members in first-insertion order. Assigning an existing
    // key replaces its value and keeps its position.
    class Object {
    public:
        using value_type = std::pair<std::string, Value>;
        using const_iterator = std::vector<value_type>::const_iterator;

        void insert_or_assign(std::string key, const Value& value);

        const Value* find(std::string_view key) const;
        bool contains(std::string_view key) const { return find(key) != nullptr; }
        const Value& at(std::string_view key) const;

        size_t size() const { return m_entries.size(); }
        bool empty() const { return m_entries.empty(); }

        const_iterator begin() const { return m_entries.begin(); }
        const_iterator end() const { return m_entries.end(); }

        bool operator==(const Object& other) const { return m_entries == other.m_entries; }
        bool operator!=(const Object& other) const { return !(*this == other); }

    private:
        struct KeyHash {
            size_t operator()(const std::string& key) const { return utils::djb2_hash(key); }
        };

        std::vector<value_type> m_entries;
        std::unordered_map<std::string, size_t, KeyHash> m_index;
    };

} // namespace jsonbcpp

#endif // JSONBCPP_OBJECT_HPP
