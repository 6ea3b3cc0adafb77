#include <pledge/orchestration/milestone_payout.hpp>
#include <pledge/runtime/contract_ids.hpp>
#include <pledge/schema/contract_error_code.hpp>
#include <spdlog/spdlog.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using namespace pledge::schema;

namespace pledge::orchestration {

namespace {

bool has_contract_code(const invocation_result_t& result,
                       const contract_error_code code) {
  return result.code == static_cast<uint32_t>(code) &&
         result.codespace != "pledge.host";
}

void record_failure(payout_report& report,
                    const payout_step step,
                    const invocation_result_t& result) {
  report.step = step;
  report.code = result.code;
  report.codespace = result.codespace;
  report.log = result.log;
}

void record_unavailable(payout_report& report,
                        const payout_step step,
                        const std::string& what) {
  report.step = step;
  report.code = 0;
  report.codespace = "pledge.gateway";
  report.log = what;
}

}  // namespace

milestone_payout::milestone_payout(contract_client& client,
                                   attestation_provider_t attest,
                                   const payout_options options)
    : client_(client), attest_(std::move(attest)), options_(options) {}

payout_report milestone_payout::run(const milestone_id_t& milestone_id) {
  auto report = payout_report{};
  auto milestone = std::optional<milestone_state_t>{};
  try {
    milestone = client_.get_milestone(milestone_id);
  } catch (const std::runtime_error& ex) {
    record_unavailable(report, payout_step::read_milestone, ex.what());
    return report;
  }
  if (!milestone) {
    report.code = static_cast<uint32_t>(contract_error_code::not_found);
    report.codespace = "pledge.milestones";
    report.log = std::string{to_string(contract_error_code::not_found)};
    return report;
  }

  if (!release_milestone(*milestone, report)) {
    return report;
  }
  if (!release_funds(*milestone, report)) {
    return report;
  }

  report.completed = true;
  report.step = payout_step::completed;
  spdlog::info("Paid out milestone {} ({} to {})", to_hex(milestone_id),
               milestone->amount, to_string(milestone->recipient));
  return report;
}

bool milestone_payout::release_milestone(const milestone_state_t& milestone,
                                         payout_report& report) {
  if (milestone.released) {
    report.milestone_already_released = true;
    return true;
  }
  auto attestation = attest_(attestation_subject_t{
      .contract = address_t{pledge::runtime::milestones_contract_id()},
      .action = attestation_action_t::milestone_release,
      .project_id = milestone.project_id,
      .milestone_id = milestone.milestone_id,
      .amount = milestone.amount,
      .recipient = milestone.recipient});

  for (auto attempt = uint32_t{1}; attempt <= options_.max_attempts;
       ++attempt) {
    try {
      // An earlier attempt may have landed without an answer.
      if (attempt > 1 && is_released(milestone.milestone_id)) {
        report.milestone_already_released = true;
        return true;
      }
      auto result = client_.release_milestone(milestone.milestone_id,
                                              attestation);
      if (result.code == 0) {
        return true;
      }
      if (has_contract_code(result, contract_error_code::already_released) ||
          has_contract_code(result,
                            contract_error_code::attestation_replayed)) {
        if (is_released(milestone.milestone_id)) {
          report.milestone_already_released = true;
          return true;
        }
        spdlog::error("Milestone {} answered {} but is not released",
                      to_hex(milestone.milestone_id), result.log);
      }
      record_failure(report, payout_step::release_milestone, result);
      spdlog::error("Milestone {} release stopped: {}",
                    to_hex(milestone.milestone_id), result.log);
      return false;
    } catch (const std::runtime_error& ex) {
      spdlog::warn("Milestone {} release attempt {} unresolved: {}",
                   to_hex(milestone.milestone_id), attempt, ex.what());
      record_unavailable(report, payout_step::release_milestone, ex.what());
    }
  }
  return false;
}

bool milestone_payout::release_funds(const milestone_state_t& milestone,
                                     payout_report& report) {
  auto attestation = attest_(attestation_subject_t{
      .contract = address_t{pledge::runtime::escrow_contract_id()},
      .action = attestation_action_t::escrow_release,
      .project_id = milestone.project_id,
      .milestone_id = milestone.milestone_id,
      .amount = milestone.amount,
      .recipient = milestone.recipient});

  for (auto attempt = uint32_t{1}; attempt <= options_.max_attempts;
       ++attempt) {
    try {
      if (is_paid(milestone.milestone_id)) {
        report.funds_reconciled = true;
        return true;
      }
      auto result = client_.release_to_recipient(
          milestone.project_id, milestone.recipient, milestone.amount,
          attestation, milestone.milestone_id);
      if (result.code == 0) {
        return true;
      }
      if (has_contract_code(result, contract_error_code::already_released) ||
          has_contract_code(result,
                            contract_error_code::attestation_replayed)) {
        if (is_paid(milestone.milestone_id)) {
          report.funds_reconciled = true;
          return true;
        }
        spdlog::error("Funds for milestone {} answered {} but were not paid",
                      to_hex(milestone.milestone_id), result.log);
      }
      record_failure(report, payout_step::release_funds, result);
      spdlog::error("Funds release for milestone {} stopped: {}",
                    to_hex(milestone.milestone_id), result.log);
      return false;
    } catch (const std::runtime_error& ex) {
      spdlog::warn("Funds release attempt {} for milestone {} unresolved: {}",
                   attempt, to_hex(milestone.milestone_id), ex.what());
      record_unavailable(report, payout_step::release_funds, ex.what());
    }
  }
  return false;
}

bool milestone_payout::is_released(const milestone_id_t& milestone_id) {
  auto milestone = client_.get_milestone(milestone_id);
  return milestone.has_value() && milestone->released;
}

bool milestone_payout::is_paid(const milestone_id_t& milestone_id) {
  return client_.get_milestone_payment(milestone_id).has_value();
}

}  // namespace pledge::orchestration
