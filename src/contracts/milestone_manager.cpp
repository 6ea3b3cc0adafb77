#include <pledge/common/checked.hpp>
#include <pledge/contracts/attestation.hpp>
#include <pledge/contracts/milestone_manager.hpp>
#include <spdlog/spdlog.h>

#include <string>

using namespace pledge::schema;

namespace pledge::contracts {

namespace {

constexpr auto kConfigKey = std::string_view{"CONFIG"};
constexpr auto kMilestoneKind = std::string_view{"MILESTONE"};
constexpr auto kProjectMilestonesKind = std::string_view{"PROJECT_MILESTONES"};

}  // namespace

milestone_manager::milestone_manager(pledge::runtime::context& context)
    : context_(context) {}

contract_error_code milestone_manager::initialize(
    const initialize_milestones_t& op) {
  if (get_config()) {
    return contract_error_code::already_initialized;
  }
  context_.put_instance(kConfigKey,
                        milestone_config_t{.admin = op.admin,
                                           .attestation_key =
                                               op.attestation_key});
  spdlog::info("Milestone manager initialized with admin {}",
               to_string(op.admin));
  return contract_error_code::ok;
}

contract_error_code milestone_manager::register_milestone(
    const register_milestone_t& op) {
  auto config = get_config();
  if (!config) {
    return contract_error_code::not_initialized;
  }
  if (!context_.is_authorized(config->admin)) {
    return contract_error_code::unauthorized;
  }
  if (op.amount <= 0) {
    return contract_error_code::invalid_amount;
  }
  if (context_.has_persistent(kMilestoneKind, op.milestone_id)) {
    return contract_error_code::already_exists;
  }

  auto summary = get_project_milestones(op.project_id)
                     .value_or(project_milestones_t{.project_id =
                                                        op.project_id});
  auto total_amount =
      pledge::common::checked_add(summary.total_amount, op.amount);
  auto total_milestones =
      pledge::common::checked_add(summary.total_milestones, uint32_t{1});
  if (!total_amount || !total_milestones) {
    return contract_error_code::amount_overflow;
  }
  summary.total_amount = *total_amount;
  summary.total_milestones = *total_milestones;

  context_.put_persistent(
      kMilestoneKind, op.milestone_id,
      milestone_state_t{.project_id = op.project_id,
                        .milestone_id = op.milestone_id,
                        .amount = op.amount,
                        .proof_required = op.proof_required,
                        .recipient = op.recipient});
  context_.put_persistent(kProjectMilestonesKind, op.project_id, summary);
  context_.emit("milestone_registered",
                {make_attribute("project_id", to_hex(op.project_id), true),
                 make_attribute("milestone_id", to_hex(op.milestone_id), true),
                 make_attribute("amount", std::to_string(op.amount)),
                 make_attribute("recipient", to_string(op.recipient))});
  return contract_error_code::ok;
}

contract_error_code milestone_manager::submit_proof(
    const submit_milestone_proof_t& op) {
  auto milestone = get_milestone(op.milestone_id);
  if (!milestone) {
    return contract_error_code::not_found;
  }
  if (milestone->released) {
    return contract_error_code::already_released;
  }
  if (!context_.is_authorized(milestone->recipient)) {
    return contract_error_code::unauthorized;
  }
  if (milestone->proof_submitted) {
    spdlog::warn("Overwriting proof for milestone {}",
                 to_hex(op.milestone_id));
  }
  milestone->proof_submitted = true;
  milestone->proof_reference = op.proof_reference;
  context_.put_persistent(kMilestoneKind, op.milestone_id, *milestone);
  context_.emit(
      "milestone_proof_submitted",
      {make_attribute("milestone_id", to_hex(op.milestone_id), true),
       make_attribute("proof_reference", to_hex(op.proof_reference))});
  return contract_error_code::ok;
}

contract_error_code milestone_manager::release_milestone(
    const release_milestone_t& op) {
  auto milestone = get_milestone(op.milestone_id);
  if (!milestone) {
    return contract_error_code::not_found;
  }
  if (milestone->released) {
    return contract_error_code::already_released;
  }
  auto config = get_config();
  if (!config) {
    return contract_error_code::not_initialized;
  }
  auto verified = verify_attestation(
      context_, config->attestation_key, op.attestation,
      attestation_subject_t{.contract = context_.contract_address(),
                            .action = attestation_action_t::milestone_release,
                            .project_id = milestone->project_id,
                            .milestone_id = milestone->milestone_id,
                            .amount = milestone->amount,
                            .recipient = milestone->recipient});
  if (verified != contract_error_code::ok) {
    return verified;
  }

  auto summary = get_project_milestones(milestone->project_id)
                     .value_or(project_milestones_t{
                         .project_id = milestone->project_id});
  summary.released_milestones += 1;
  summary.released_amount += milestone->amount;

  milestone->released = true;
  milestone->released_at = context_.ledger().timestamp;
  context_.put_persistent(kMilestoneKind, op.milestone_id, *milestone);
  context_.put_persistent(kProjectMilestonesKind, milestone->project_id,
                          summary);

  spdlog::info("Released milestone {} of project {} ({})",
               to_hex(op.milestone_id), to_hex(milestone->project_id),
               milestone->amount);
  context_.emit(
      "milestone_released",
      {make_attribute("project_id", to_hex(milestone->project_id), true),
       make_attribute("milestone_id", to_hex(op.milestone_id), true),
       make_attribute("amount", std::to_string(milestone->amount)),
       make_attribute("released_at", std::to_string(milestone->released_at))});
  return contract_error_code::ok;
}

std::optional<milestone_state_t> milestone_manager::get_milestone(
    const milestone_id_t& milestone_id) const {
  return context_.get_persistent<milestone_state_t>(kMilestoneKind,
                                                    milestone_id);
}

std::optional<project_milestones_t> milestone_manager::get_project_milestones(
    const project_id_t& project_id) const {
  return context_.get_persistent<project_milestones_t>(kProjectMilestonesKind,
                                                       project_id);
}

amount_t milestone_manager::get_project_released_amount(
    const project_id_t& project_id) const {
  auto summary = get_project_milestones(project_id);
  if (!summary) {
    return 0;
  }
  return summary->released_amount;
}

bool milestone_manager::can_release_milestone(
    const milestone_id_t& milestone_id) const {
  auto milestone = get_milestone(milestone_id);
  return milestone && !milestone->released &&
         (!milestone->proof_required || milestone->proof_submitted);
}

std::optional<milestone_config_t> milestone_manager::get_config() const {
  return context_.get_instance<milestone_config_t>(kConfigKey);
}

}  // namespace pledge::contracts
