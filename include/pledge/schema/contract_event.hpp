#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Schema type: contract event.
// Structured emission from a contract entry point; indexed attributes are
// what off-chain reconciliation keys on.
namespace pledge::schema {

template <uint16_t Version>
struct contract_event_attribute;

template <>
struct contract_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using contract_event_attribute_t = contract_event_attribute<1>;

inline contract_event_attribute_t make_attribute(std::string key,
                                                 std::string value,
                                                 const bool index = false) {
  return contract_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

template <uint16_t Version>
struct contract_event;

template <>
struct contract_event<1> final {
  uint16_t version{1};
  std::string contract;
  std::string type;
  std::vector<contract_event_attribute_t> attributes;
};

using contract_event_t = contract_event<1>;

}  // namespace pledge::schema
