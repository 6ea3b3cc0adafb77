#pragma once
#include <pledge/orchestration/ledger_gateway.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/escrow_account.hpp>
#include <pledge/schema/escrow_config.hpp>
#include <pledge/schema/invocation.hpp>
#include <pledge/schema/milestone_payment.hpp>
#include <pledge/schema/milestone_state.hpp>
#include <pledge/schema/project_milestones.hpp>
#include <pledge/schema/project_state.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pledge::orchestration {

/// Typed access to the deployed contracts through a ledger gateway.
///
/// Every call is signed by a single source account. The client tracks the
/// source nonce and re-reads it from the ledger whenever the host rejects an
/// invocation with `invalid_nonce` or a submission outcome is unknown.
class contract_client final {
 public:
  using sign_fn_t = std::function<pledge::schema::signature_t(
      const pledge::schema::bytes_view_t& message)>;

  contract_client(ledger_gateway& gateway,
                  const pledge::schema::network_id_t& network_id,
                  pledge::schema::address_t source,
                  sign_fn_t sign);

  const pledge::schema::address_t& source() const;
  const pledge::schema::network_id_t& network_id() const;

  pledge::schema::invocation_result_t submit(
      const pledge::schema::invocation_payload_t& payload);

  pledge::schema::invocation_result_t register_project(
      const pledge::schema::project_id_t& project_id,
      std::string metadata_uri);
  pledge::schema::invocation_result_t update_project_metadata(
      const pledge::schema::project_id_t& project_id,
      std::string metadata_uri);

  pledge::schema::invocation_result_t initialize_escrow(
      const pledge::schema::address_t& token,
      const pledge::schema::ed25519_signer_id& attestation_pubkey);
  pledge::schema::invocation_result_t deposit(
      const pledge::schema::project_id_t& project_id,
      pledge::schema::amount_t amount,
      std::string memo);
  pledge::schema::invocation_result_t claim(
      const pledge::schema::project_id_t& project_id,
      pledge::schema::amount_t amount,
      pledge::schema::bytes_t attestation);
  pledge::schema::invocation_result_t release_to_recipient(
      const pledge::schema::project_id_t& project_id,
      const pledge::schema::address_t& recipient,
      pledge::schema::amount_t amount,
      pledge::schema::bytes_t attestation,
      std::optional<pledge::schema::milestone_id_t> milestone_id =
          std::nullopt);

  pledge::schema::invocation_result_t initialize_milestones(
      const pledge::schema::address_t& admin,
      const pledge::schema::ed25519_signer_id& attestation_key);
  pledge::schema::invocation_result_t register_milestone(
      const pledge::schema::project_id_t& project_id,
      const pledge::schema::milestone_id_t& milestone_id,
      pledge::schema::amount_t amount,
      bool proof_required,
      const pledge::schema::address_t& recipient);
  pledge::schema::invocation_result_t submit_milestone_proof(
      const pledge::schema::milestone_id_t& milestone_id,
      const pledge::schema::hash32_t& proof_reference);
  pledge::schema::invocation_result_t release_milestone(
      const pledge::schema::milestone_id_t& milestone_id,
      pledge::schema::bytes_t attestation);

  pledge::schema::invocation_result_t initialize_token(
      const pledge::schema::address_t& admin,
      uint32_t decimals,
      std::string name,
      std::string symbol);
  pledge::schema::invocation_result_t mint(const pledge::schema::address_t& to,
                                           pledge::schema::amount_t amount);
  pledge::schema::invocation_result_t transfer(
      const pledge::schema::address_t& to,
      pledge::schema::amount_t amount);

  std::optional<pledge::schema::project_state_t> get_project(
      const pledge::schema::project_id_t& project_id);
  uint32_t get_project_count();
  pledge::schema::amount_t get_balance(
      const pledge::schema::project_id_t& project_id);
  std::optional<pledge::schema::escrow_account_t> get_escrow_info(
      const pledge::schema::project_id_t& project_id);
  std::optional<pledge::schema::escrow_config_t> get_escrow_config();
  std::optional<pledge::schema::milestone_payment_t> get_milestone_payment(
      const pledge::schema::milestone_id_t& milestone_id);
  std::optional<pledge::schema::milestone_state_t> get_milestone(
      const pledge::schema::milestone_id_t& milestone_id);
  std::optional<pledge::schema::project_milestones_t> get_project_milestones(
      const pledge::schema::project_id_t& project_id);
  pledge::schema::amount_t get_project_released_amount(
      const pledge::schema::project_id_t& project_id);
  bool can_release_milestone(
      const pledge::schema::milestone_id_t& milestone_id);
  pledge::schema::amount_t token_balance(
      const pledge::schema::address_t& address);

  /// Last nonce the ledger accepted from the source account.
  uint64_t last_nonce();

 private:
  template <typename T>
  T read(std::string_view path, const pledge::schema::bytes_t& data);

  pledge::schema::bytes_t build(
      const pledge::schema::invocation_payload_t& payload,
      uint64_t nonce) const;

  ledger_gateway& gateway_;
  pledge::schema::network_id_t network_id_;
  pledge::schema::address_t source_;
  sign_fn_t sign_;
  std::optional<uint64_t> next_nonce_;
};

/// True when `result` is the host rejecting the envelope with `code`.
bool is_host_error(const pledge::schema::invocation_result_t& result,
                   uint32_t code);

}  // namespace pledge::orchestration
