#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct escrow_config;

template <>
struct escrow_config<1> final {
  uint16_t version{1};
  address_t token{};
  ed25519_signer_id attestation_pubkey{};
};

using escrow_config_t = escrow_config<1>;

}  // namespace pledge::schema
