#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct transfer_token;

template <>
struct transfer_token<1> final {
  uint16_t version{1};
  address_t from{};
  address_t to{};
  amount_t amount{};
};

using transfer_token_t = transfer_token<1>;

}  // namespace pledge::schema
