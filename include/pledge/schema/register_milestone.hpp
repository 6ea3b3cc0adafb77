#pragma once
#include <pledge/schema/primitives.hpp>

// Schema type: register milestone.
// Admin-only; creates a milestone and folds it into the project summary.
namespace pledge::schema {

template <uint16_t Version>
struct register_milestone;

template <>
struct register_milestone<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  milestone_id_t milestone_id{};
  amount_t amount{};
  bool proof_required{};
  address_t recipient{};
};

using register_milestone_t = register_milestone<1>;

}  // namespace pledge::schema
