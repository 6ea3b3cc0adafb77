#pragma once
#include <pledge/schema/primitives.hpp>
#include <string>

// Schema type: deposit.
// Escrow call; memo is carried into the deposit event only.
namespace pledge::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  address_t from{};
  project_id_t project_id{};
  amount_t amount{};
  std::string memo;
};

using deposit_t = deposit<1>;

}  // namespace pledge::schema
