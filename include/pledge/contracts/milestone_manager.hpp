#pragma once
#include <pledge/runtime/context.hpp>
#include <pledge/schema/contract_error_code.hpp>
#include <pledge/schema/initialize_milestones.hpp>
#include <pledge/schema/milestone_config.hpp>
#include <pledge/schema/milestone_state.hpp>
#include <pledge/schema/project_milestones.hpp>
#include <pledge/schema/register_milestone.hpp>
#include <pledge/schema/release_milestone.hpp>
#include <pledge/schema/submit_milestone_proof.hpp>
#include <optional>

namespace pledge::contracts {

/// Milestone approval state per project. Tracks approval only; funds move
/// through the escrow.
class milestone_manager final {
 public:
  explicit milestone_manager(pledge::runtime::context& context);

  pledge::schema::contract_error_code initialize(
      const pledge::schema::initialize_milestones_t& op);
  pledge::schema::contract_error_code register_milestone(
      const pledge::schema::register_milestone_t& op);
  pledge::schema::contract_error_code submit_proof(
      const pledge::schema::submit_milestone_proof_t& op);
  pledge::schema::contract_error_code release_milestone(
      const pledge::schema::release_milestone_t& op);

  std::optional<pledge::schema::milestone_state_t> get_milestone(
      const pledge::schema::milestone_id_t& milestone_id) const;
  std::optional<pledge::schema::project_milestones_t> get_project_milestones(
      const pledge::schema::project_id_t& project_id) const;
  pledge::schema::amount_t get_project_released_amount(
      const pledge::schema::project_id_t& project_id) const;

  /// Exists, not released, and proof submitted when proof is required.
  bool can_release_milestone(
      const pledge::schema::milestone_id_t& milestone_id) const;

  std::optional<pledge::schema::milestone_config_t> get_config() const;

 private:
  pledge::runtime::context& context_;
};

}  // namespace pledge::contracts
