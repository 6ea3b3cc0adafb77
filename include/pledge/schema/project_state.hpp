#pragma once
#include <pledge/schema/primitives.hpp>
#include <string>

// Schema type: project state.
// Registry record: project identity, owning principal and off-chain metadata
// pointer. Only metadata_uri changes after registration.
namespace pledge::schema {

template <uint16_t Version>
struct project_state;

template <>
struct project_state<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  address_t owner{};
  std::string metadata_uri;
  timestamp_seconds_t registered_at{};
};

using project_state_t = project_state<1>;

}  // namespace pledge::schema
