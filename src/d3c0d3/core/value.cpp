#include "value.hpp"

#include <algorithm>
#include <stdexcept>

namespace d3c0d3 {

namespace {

value::mapping_type::iterator find_entry(value::mapping_type& entries, std::string_view key) {
  return std::find_if(entries.begin(), entries.end(), [key](const value::mapping_entry& entry) {
    return entry.first == key;
  });
}

} // namespace

value::value(mapping_type v) : data_(mapping_type{}) {
  for (auto& entry : v) {
    set(std::move(entry.first), std::move(entry.second));
  }
}

value value::sequence(std::initializer_list<value> items) { return value(sequence_type(items)); }

value value::mapping(std::initializer_list<mapping_entry> entries) { return value(mapping_type(entries)); }

size_t value::size() const noexcept {
  if (const auto* items = if_sequence()) {
    return items->size();
  }
  if (const auto* entries = if_mapping()) {
    return entries->size();
  }
  return 0;
}

const value* value::find(std::string_view key) const noexcept {
  const auto* entries = if_mapping();
  if (!entries) {
    return nullptr;
  }

  for (const auto& entry : *entries) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

const value& value::at(size_t index) const {
  const auto* items = if_sequence();
  if (!items) {
    throw std::out_of_range(std::string("value::at called on ") + kind_name(type()) + " value");
  }
  return items->at(index);
}

void value::set(std::string key, value item) {
  if (is_null()) {
    data_ = mapping_type{};
  }

  auto* entries = std::get_if<mapping_type>(&data_);
  if (!entries) {
    throw std::logic_error(std::string("value::set called on ") + kind_name(type()) + " value");
  }

  auto existing = find_entry(*entries, key);
  if (existing != entries->end()) {
    existing->second = std::move(item);
    return;
  }
  entries->emplace_back(std::move(key), std::move(item));
}

void value::push_back(value item) {
  if (is_null()) {
    data_ = sequence_type{};
  }

  auto* items = std::get_if<sequence_type>(&data_);
  if (!items) {
    throw std::logic_error(std::string("value::push_back called on ") + kind_name(type()) + " value");
  }
  items->push_back(std::move(item));
}

bool operator==(const value& left, const value& right) { return left.data_ == right.data_; }

const char* kind_name(value::kind kind) {
  switch (kind) {
  case value::kind::null:
    return "null";
  case value::kind::boolean:
    return "boolean";
  case value::kind::integer:
    return "integer";
  case value::kind::floating:
    return "floating";
  case value::kind::string:
    return "string";
  case value::kind::sequence:
    return "sequence";
  case value::kind::mapping:
    return "mapping";
  }
  return "unknown";
}

} // namespace d3c0d3
