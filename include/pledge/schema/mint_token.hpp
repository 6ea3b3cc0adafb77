#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct mint_token;

template <>
struct mint_token<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t amount{};
};

using mint_token_t = mint_token<1>;

}  // namespace pledge::schema
