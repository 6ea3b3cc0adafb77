#pragma once
#include <pledge/orchestration/contract_client.hpp>
#include <pledge/schema/attestation.hpp>
#include <pledge/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace pledge::orchestration {

enum class payout_step : uint8_t {
  read_milestone = 0,
  release_milestone = 1,
  release_funds = 2,
  completed = 3,
};

inline constexpr auto kPayoutStepMappings = std::array{
    std::pair<std::string_view, payout_step>{"read_milestone",
                                             payout_step::read_milestone},
    std::pair<std::string_view, payout_step>{"release_milestone",
                                             payout_step::release_milestone},
    std::pair<std::string_view, payout_step>{"release_funds",
                                             payout_step::release_funds},
    std::pair<std::string_view, payout_step>{"completed",
                                             payout_step::completed}};

inline constexpr std::string_view to_string(const payout_step value) {
  return pledge::schema::to_string(value, kPayoutStepMappings)
      .value_or("unknown");
}

struct payout_options final {
  /// Submissions per step before giving up on an unreachable gateway.
  uint32_t max_attempts{3};
};

/// Outcome of one saga run. On failure `step` names the step that stopped
/// and `code`/`codespace`/`log` carry the ledger's answer.
struct payout_report final {
  bool completed{};
  payout_step step{payout_step::read_milestone};
  uint32_t code{};
  std::string codespace;
  std::string log;
  bool milestone_already_released{};
  bool funds_reconciled{};
};

/// Produces attestation bytes for a subject. Must return the same nonce for
/// the same subject and distinct nonces for distinct subjects.
using attestation_provider_t = std::function<pledge::schema::bytes_t(
    const pledge::schema::attestation_subject_t& subject)>;

/// Releases a milestone and pays its amount to the milestone recipient.
///
/// The two ledger transitions are separate invocations. A step counts as
/// done only when a read confirms it: the milestone shows `released`, or the
/// escrow holds a payment record for the milestone. The funds release is
/// bound to the milestone id, so the escrow pays a milestone at most once.
class milestone_payout final {
 public:
  milestone_payout(contract_client& client,
                   attestation_provider_t attest,
                   payout_options options = {});

  payout_report run(const pledge::schema::milestone_id_t& milestone_id);

 private:
  bool release_milestone(const pledge::schema::milestone_state_t& milestone,
                         payout_report& report);
  bool release_funds(const pledge::schema::milestone_state_t& milestone,
                     payout_report& report);
  bool is_released(const pledge::schema::milestone_id_t& milestone_id);
  bool is_paid(const pledge::schema::milestone_id_t& milestone_id);

  contract_client& client_;
  attestation_provider_t attest_;
  payout_options options_;
};

}  // namespace pledge::orchestration
