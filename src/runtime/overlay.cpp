#include <pledge/runtime/overlay.hpp>

#include <iterator>
#include <utility>

namespace pledge::runtime {

overlay::overlay(reader_t reader) : reader_(std::move(reader)) {}

overlay overlay::layered_on(const overlay& parent) {
  return overlay{[&parent](const pledge::schema::bytes_view_t& key) {
    return parent.get(key);
  }};
}

std::optional<pledge::schema::bytes_t> overlay::get(
    const pledge::schema::bytes_view_t& key) const {
  auto found = writes_.find(pledge::schema::make_bytes(key));
  if (found != std::end(writes_)) {
    return found->second;
  }
  if (!reader_) {
    return std::nullopt;
  }
  return reader_(key);
}

void overlay::put(const pledge::schema::bytes_view_t& key,
                  pledge::schema::bytes_t value) {
  writes_.insert_or_assign(pledge::schema::make_bytes(key), std::move(value));
}

void overlay::merge_into(overlay& parent) const {
  for (const auto& [key, value] : writes_) {
    parent.writes_.insert_or_assign(key, value);
  }
}

std::vector<pledge::storage::key_value_entry_t> overlay::entries() const {
  return {std::begin(writes_), std::end(writes_)};
}

bool overlay::empty() const {
  return writes_.empty();
}

void overlay::clear() {
  writes_.clear();
}

}  // namespace pledge::runtime
