#pragma once
#include <pledge/schema/primitives.hpp>

// Schema type: milestone payment.
// Escrow side record of a release made on behalf of a milestone. Written
// once; a milestone is paid out of escrow at most once.
namespace pledge::schema {

template <uint16_t Version>
struct milestone_payment;

template <>
struct milestone_payment<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  milestone_id_t milestone_id{};
  address_t recipient{};
  amount_t amount{};
  timestamp_seconds_t paid_at{};
};

using milestone_payment_t = milestone_payment<1>;

}  // namespace pledge::schema
