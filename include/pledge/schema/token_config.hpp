#pragma once
#include <pledge/schema/primitives.hpp>
#include <string>

namespace pledge::schema {

template <uint16_t Version>
struct token_config;

template <>
struct token_config<1> final {
  uint16_t version{1};
  address_t admin{};
  uint32_t decimals{7};
  std::string name;
  std::string symbol;
};

using token_config_t = token_config<1>;

}  // namespace pledge::schema
