#pragma once
#include <pledge/schema/primitives.hpp>
#include <string>

namespace pledge::schema {

template <uint16_t Version>
struct initialize_token;

template <>
struct initialize_token<1> final {
  uint16_t version{1};
  address_t admin{};
  uint32_t decimals{7};
  std::string name;
  std::string symbol;
};

using initialize_token_t = initialize_token<1>;

}  // namespace pledge::schema
