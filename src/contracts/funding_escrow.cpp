#include <pledge/common/checked.hpp>
#include <pledge/contracts/attestation.hpp>
#include <pledge/contracts/funding_escrow.hpp>
#include <pledge/contracts/token.hpp>
#include <pledge/runtime/contract_ids.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

using namespace pledge::schema;

namespace pledge::contracts {

namespace {

constexpr auto kConfigKey = std::string_view{"CONFIG"};
constexpr auto kEscrowKind = std::string_view{"ESCROW"};
constexpr auto kMilestonePaymentKind = std::string_view{"MILESTONE_PAYMENT"};

}  // namespace

funding_escrow::funding_escrow(pledge::runtime::context& context)
    : context_(context) {}

contract_error_code funding_escrow::initialize(const initialize_escrow_t& op) {
  if (get_config()) {
    return contract_error_code::already_initialized;
  }
  context_.put_instance(kConfigKey,
                        escrow_config_t{.token = op.token,
                                        .attestation_pubkey =
                                            op.attestation_pubkey});
  spdlog::info("Escrow initialized with token {}", to_string(op.token));
  return contract_error_code::ok;
}

contract_error_code funding_escrow::deposit(const deposit_t& op) {
  if (!context_.is_authorized(op.from)) {
    return contract_error_code::unauthorized;
  }
  if (op.amount <= 0) {
    return contract_error_code::invalid_amount;
  }
  auto config = get_config();
  if (!config) {
    return contract_error_code::not_initialized;
  }

  auto account = get_escrow_info(op.project_id)
                     .value_or(escrow_account_t{
                         .project_id = op.project_id,
                         .attestation_pubkey = config->attestation_pubkey});
  auto deposited =
      pledge::common::checked_add(account.total_deposited, op.amount);
  if (!deposited) {
    return contract_error_code::amount_overflow;
  }

  auto transferred = transfer_token(config->token, op.from,
                                    context_.contract_address(), op.amount);
  if (transferred != contract_error_code::ok) {
    return transferred;
  }

  account.total_deposited = *deposited;
  context_.put_persistent(kEscrowKind, op.project_id, account);
  context_.emit("escrow_deposit",
                {make_attribute("project_id", to_hex(op.project_id), true),
                 make_attribute("from", to_string(op.from), true),
                 make_attribute("amount", std::to_string(op.amount)),
                 make_attribute("memo", op.memo)});
  return contract_error_code::ok;
}

contract_error_code funding_escrow::claim(const claim_t& op) {
  auto account = escrow_account_t{};
  auto checked = check_withdrawal(
      op.project_id, op.amount, op.attestation,
      attestation_subject_t{.contract = context_.contract_address(),
                            .action = attestation_action_t::escrow_claim,
                            .project_id = op.project_id,
                            .amount = op.amount},
      account);
  if (checked != contract_error_code::ok) {
    return checked;
  }

  account.total_claimed += op.amount;
  context_.put_persistent(kEscrowKind, op.project_id, account);
  context_.emit("escrow_claimed",
                {make_attribute("project_id", to_hex(op.project_id), true),
                 make_attribute("amount", std::to_string(op.amount))});
  return contract_error_code::ok;
}

contract_error_code funding_escrow::release_to_recipient(
    const release_to_recipient_t& op) {
  if (op.milestone_id && get_milestone_payment(*op.milestone_id)) {
    return contract_error_code::already_released;
  }
  auto account = escrow_account_t{};
  auto checked = check_withdrawal(
      op.project_id, op.amount, op.attestation,
      attestation_subject_t{.contract = context_.contract_address(),
                            .action = attestation_action_t::escrow_release,
                            .project_id = op.project_id,
                            .milestone_id = op.milestone_id,
                            .amount = op.amount,
                            .recipient = op.recipient},
      account);
  if (checked != contract_error_code::ok) {
    return checked;
  }
  auto config = get_config();
  if (!config) {
    return contract_error_code::not_initialized;
  }

  auto transferred = transfer_token(
      config->token, context_.contract_address(), op.recipient, op.amount);
  if (transferred != contract_error_code::ok) {
    return transferred;
  }

  account.total_claimed += op.amount;
  context_.put_persistent(kEscrowKind, op.project_id, account);
  auto attributes = std::vector<contract_event_attribute_t>{
      make_attribute("project_id", to_hex(op.project_id), true),
      make_attribute("recipient", to_string(op.recipient), true),
      make_attribute("amount", std::to_string(op.amount))};
  if (op.milestone_id) {
    context_.put_persistent(
        kMilestonePaymentKind, *op.milestone_id,
        milestone_payment_t{.project_id = op.project_id,
                            .milestone_id = *op.milestone_id,
                            .recipient = op.recipient,
                            .amount = op.amount,
                            .paid_at = context_.ledger().timestamp});
    attributes.push_back(
        make_attribute("milestone_id", to_hex(*op.milestone_id), true));
  }
  spdlog::info("Released {} from project {} to {}", op.amount,
               to_hex(op.project_id), to_string(op.recipient));
  context_.emit("escrow_released", std::move(attributes));
  return contract_error_code::ok;
}

amount_t funding_escrow::get_balance(const project_id_t& project_id) const {
  auto account = get_escrow_info(project_id);
  if (!account) {
    return 0;
  }
  return available_balance(*account);
}

std::optional<escrow_account_t> funding_escrow::get_escrow_info(
    const project_id_t& project_id) const {
  return context_.get_persistent<escrow_account_t>(kEscrowKind, project_id);
}

std::optional<escrow_config_t> funding_escrow::get_config() const {
  return context_.get_instance<escrow_config_t>(kConfigKey);
}

std::optional<milestone_payment_t> funding_escrow::get_milestone_payment(
    const milestone_id_t& milestone_id) const {
  return context_.get_persistent<milestone_payment_t>(kMilestonePaymentKind,
                                                      milestone_id);
}

contract_error_code funding_escrow::check_withdrawal(
    const project_id_t& project_id,
    const amount_t amount,
    const bytes_t& attestation,
    const attestation_subject_t& subject,
    escrow_account_t& account) {
  if (amount <= 0) {
    return contract_error_code::invalid_amount;
  }
  auto existing = get_escrow_info(project_id);
  if (!existing) {
    return contract_error_code::not_found;
  }
  if (available_balance(*existing) < amount) {
    return contract_error_code::insufficient_balance;
  }
  auto verified = verify_attestation(context_, existing->attestation_pubkey,
                                     attestation, subject);
  if (verified != contract_error_code::ok) {
    return verified;
  }
  account = *existing;
  return contract_error_code::ok;
}

contract_error_code funding_escrow::transfer_token(const address_t& token,
                                                   const address_t& from,
                                                   const address_t& to,
                                                   const amount_t amount) {
  const auto* token_id = std::get_if<named_signer_t>(&token);
  if (token_id == nullptr || *token_id != pledge::runtime::token_contract_id()) {
    spdlog::warn("Escrow token {} is not a deployed token contract",
                 to_string(token));
    return contract_error_code::token_transfer_failed;
  }

  auto code = context_.call(*token_id, [&](pledge::runtime::context& callee) {
    return contracts::token{callee}.transfer(
        transfer_token_t{.from = from, .to = to, .amount = amount});
  });
  if (code != contract_error_code::ok) {
    spdlog::debug("Token transfer of {} from {} failed: {}", amount,
                  to_string(from), to_string(code));
    return contract_error_code::token_transfer_failed;
  }
  return contract_error_code::ok;
}

}  // namespace pledge::contracts
