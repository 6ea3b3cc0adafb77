#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct milestone_config;

template <>
struct milestone_config<1> final {
  uint16_t version{1};
  address_t admin{};
  ed25519_signer_id attestation_key{};
};

using milestone_config_t = milestone_config<1>;

}  // namespace pledge::schema
