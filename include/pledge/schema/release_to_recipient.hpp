#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>

namespace pledge::schema {

template <uint16_t Version>
struct release_to_recipient;

template <>
struct release_to_recipient<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  address_t recipient{};
  amount_t amount{};
  /// Set when the release pays out a milestone; the escrow then refuses a
  /// second release for the same milestone.
  std::optional<milestone_id_t> milestone_id;
  bytes_t attestation;
};

using release_to_recipient_t = release_to_recipient<1>;

}  // namespace pledge::schema
