#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>

// Schema type: milestone state.
// Funding tranche of a project. released is one-way and released_at is
// non-zero exactly when released is set.
namespace pledge::schema {

template <uint16_t Version>
struct milestone_state;

template <>
struct milestone_state<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  milestone_id_t milestone_id{};
  amount_t amount{};
  bool proof_required{};
  bool proof_submitted{};
  std::optional<hash32_t> proof_reference;
  bool released{};
  timestamp_seconds_t released_at{};
  address_t recipient{};
};

using milestone_state_t = milestone_state<1>;

}  // namespace pledge::schema
