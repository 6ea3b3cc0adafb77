#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

template <uint16_t Version>
struct release_milestone;

template <>
struct release_milestone<1> final {
  uint16_t version{1};
  milestone_id_t milestone_id{};
  bytes_t attestation;
};

using release_milestone_t = release_milestone<1>;

}  // namespace pledge::schema
