#pragma once
#include <pledge/schema/primitives.hpp>

// Schema type: project milestones summary.
// Running aggregate over a project's milestones, maintained incrementally by
// register/release.
namespace pledge::schema {

template <uint16_t Version>
struct project_milestones;

template <>
struct project_milestones<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  uint32_t total_milestones{};
  uint32_t released_milestones{};
  amount_t total_amount{};
  amount_t released_amount{};
};

using project_milestones_t = project_milestones<1>;

}  // namespace pledge::schema
