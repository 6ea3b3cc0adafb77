#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct initialize_milestones;

template <>
struct initialize_milestones<1> final {
  uint16_t version{1};
  address_t admin{};
  ed25519_signer_id attestation_key{};
};

using initialize_milestones_t = initialize_milestones<1>;

}  // namespace pledge::schema
