#include "object.hpp"
#include "exception.hpp"

namespace jsonbcpp {

void Object::insert_or_assign(std::string key, const Value &value) {
  auto it = m_index.find(key);
  if (it != m_index.end()) {
    m_entries[it->second].second = value;
    return;
  }
  m_index.emplace(key, m_entries.size());
  m_entries.emplace_back(std::move(key), value);
}

const Value *Object::find(std::string_view key) const {
  auto it = m_index.find(std::string(key));
  if (it == m_index.end()) {
    return nullptr;
  }
  return &m_entries[it->second].second;
}

const Value &Object::at(std::string_view key) const {
  const Value *value = find(key);
  if (!value) {
    throw jsonbcpp::exception("Object has no member \"" + std::string(key) + "\"");
  }
  return *value;
}

} // namespace jsonbcpp
