#pragma once
#include <pledge/schema/primitives.hpp>

// Schema type: claim.
// Accounting-only withdrawal; no tokens move.
namespace pledge::schema {

template <uint16_t Version>
struct claim;

template <>
struct claim<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  amount_t amount{};
  bytes_t attestation;
};

using claim_t = claim<1>;

}  // namespace pledge::schema
