#pragma once
#include <pledge/schema/primitives.hpp>

// Schema type: submit milestone proof.
// Recipient call; proof_reference is the hash of off-chain evidence.
namespace pledge::schema {

template <uint16_t Version>
struct submit_milestone_proof;

template <>
struct submit_milestone_proof<1> final {
  uint16_t version{1};
  milestone_id_t milestone_id{};
  hash32_t proof_reference{};
};

using submit_milestone_proof_t = submit_milestone_proof<1>;

}  // namespace pledge::schema
