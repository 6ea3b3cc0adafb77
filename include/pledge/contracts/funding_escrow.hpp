#pragma once
#include <pledge/runtime/context.hpp>
#include <pledge/schema/attestation.hpp>
#include <pledge/schema/claim.hpp>
#include <pledge/schema/contract_error_code.hpp>
#include <pledge/schema/deposit.hpp>
#include <pledge/schema/escrow_account.hpp>
#include <pledge/schema/escrow_config.hpp>
#include <pledge/schema/initialize_escrow.hpp>
#include <pledge/schema/milestone_payment.hpp>
#include <pledge/schema/release_to_recipient.hpp>
#include <optional>

namespace pledge::contracts {

/// Custodial funds per project.
///
/// Every project account moves Uninitialized -> Funded -> Depleted and back
/// to Funded on further deposits; there is no terminal state. Withdrawals
/// (`claim`, `release_to_recipient`) require an attestation checked against
/// the account's attestation key.
class funding_escrow final {
 public:
  explicit funding_escrow(pledge::runtime::context& context);

  pledge::schema::contract_error_code initialize(
      const pledge::schema::initialize_escrow_t& op);

  /// Pull `op.amount` from the depositor into the escrow address.
  pledge::schema::contract_error_code deposit(
      const pledge::schema::deposit_t& op);

  /// Mark funds claimed. No tokens move; settlement happens off-ledger.
  pledge::schema::contract_error_code claim(const pledge::schema::claim_t& op);

  /// Pay funds out to `op.recipient` and mark them claimed. With
  /// `op.milestone_id` set the payment is recorded against that milestone and
  /// a second release for it fails with `already_released`.
  pledge::schema::contract_error_code release_to_recipient(
      const pledge::schema::release_to_recipient_t& op);

  /// Available balance; 0 for unknown projects.
  pledge::schema::amount_t get_balance(
      const pledge::schema::project_id_t& project_id) const;
  std::optional<pledge::schema::escrow_account_t> get_escrow_info(
      const pledge::schema::project_id_t& project_id) const;
  std::optional<pledge::schema::escrow_config_t> get_config() const;
  std::optional<pledge::schema::milestone_payment_t> get_milestone_payment(
      const pledge::schema::milestone_id_t& milestone_id) const;

 private:
  /// Shared validation of claim and release_to_recipient.
  pledge::schema::contract_error_code check_withdrawal(
      const pledge::schema::project_id_t& project_id,
      pledge::schema::amount_t amount,
      const pledge::schema::bytes_t& attestation,
      const pledge::schema::attestation_subject_t& subject,
      pledge::schema::escrow_account_t& account);

  pledge::schema::contract_error_code transfer_token(
      const pledge::schema::address_t& token,
      const pledge::schema::address_t& from,
      const pledge::schema::address_t& to,
      pledge::schema::amount_t amount);

  pledge::runtime::context& context_;
};

}  // namespace pledge::contracts
