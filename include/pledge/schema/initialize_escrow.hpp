#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct initialize_escrow;

template <>
struct initialize_escrow<1> final {
  uint16_t version{1};
  address_t token{};
  ed25519_signer_id attestation_pubkey{};
};

using initialize_escrow_t = initialize_escrow<1>;

}  // namespace pledge::schema
