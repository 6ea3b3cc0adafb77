#include <pledge/orchestration/contract_client.hpp>
#include <pledge/schema/host_error_code.hpp>
#include <spdlog/spdlog.h>

#include <utility>

using namespace pledge::schema;

namespace pledge::orchestration {

namespace {

using encoder_t = pledge::schema::encoding::encoder<
    pledge::schema::encoding::scale_encoder_tag>;

template <typename Key>
bytes_t encode_key(const Key& key) {
  return encoder_t{}.encode(key);
}

}  // namespace

bool is_host_error(const invocation_result_t& result, const uint32_t code) {
  return result.code == code && result.codespace == "pledge.host";
}

contract_client::contract_client(ledger_gateway& gateway,
                                 const network_id_t& network_id,
                                 address_t source,
                                 sign_fn_t sign)
    : gateway_(gateway),
      network_id_(network_id),
      source_(std::move(source)),
      sign_(std::move(sign)) {}

const address_t& contract_client::source() const {
  return source_;
}

const network_id_t& contract_client::network_id() const {
  return network_id_;
}

invocation_result_t contract_client::submit(
    const invocation_payload_t& payload) {
  if (!next_nonce_) {
    next_nonce_ = last_nonce() + 1;
  }
  auto result = invocation_result_t{};
  try {
    result = gateway_.submit(build(payload, *next_nonce_));
    if (is_host_error(result,
                      static_cast<uint32_t>(host_error_code::invalid_nonce))) {
      next_nonce_ = last_nonce() + 1;
      spdlog::debug("Refreshed nonce for {} to {}", to_string(source_),
                    *next_nonce_);
      result = gateway_.submit(build(payload, *next_nonce_));
    }
  } catch (const gateway_unavailable&) {
    next_nonce_.reset();
    throw;
  }
  if (result.code == 0) {
    ++*next_nonce_;
  }
  return result;
}

invocation_result_t contract_client::register_project(
    const project_id_t& project_id,
    std::string metadata_uri) {
  return submit(register_project_t{.owner = source_,
                                   .project_id = project_id,
                                   .metadata_uri = std::move(metadata_uri)});
}

invocation_result_t contract_client::update_project_metadata(
    const project_id_t& project_id,
    std::string metadata_uri) {
  return submit(update_project_metadata_t{
      .project_id = project_id, .metadata_uri = std::move(metadata_uri)});
}

invocation_result_t contract_client::initialize_escrow(
    const address_t& token,
    const ed25519_signer_id& attestation_pubkey) {
  return submit(initialize_escrow_t{.token = token,
                                    .attestation_pubkey = attestation_pubkey});
}

invocation_result_t contract_client::deposit(const project_id_t& project_id,
                                             const amount_t amount,
                                             std::string memo) {
  return submit(deposit_t{.from = source_,
                          .project_id = project_id,
                          .amount = amount,
                          .memo = std::move(memo)});
}

invocation_result_t contract_client::claim(const project_id_t& project_id,
                                           const amount_t amount,
                                           bytes_t attestation) {
  return submit(claim_t{.project_id = project_id,
                        .amount = amount,
                        .attestation = std::move(attestation)});
}

invocation_result_t contract_client::release_to_recipient(
    const project_id_t& project_id,
    const address_t& recipient,
    const amount_t amount,
    bytes_t attestation,
    std::optional<milestone_id_t> milestone_id) {
  return submit(release_to_recipient_t{.project_id = project_id,
                                       .recipient = recipient,
                                       .amount = amount,
                                       .milestone_id = std::move(milestone_id),
                                       .attestation = std::move(attestation)});
}

invocation_result_t contract_client::initialize_milestones(
    const address_t& admin,
    const ed25519_signer_id& attestation_key) {
  return submit(initialize_milestones_t{.admin = admin,
                                        .attestation_key = attestation_key});
}

invocation_result_t contract_client::register_milestone(
    const project_id_t& project_id,
    const milestone_id_t& milestone_id,
    const amount_t amount,
    const bool proof_required,
    const address_t& recipient) {
  return submit(register_milestone_t{.project_id = project_id,
                                     .milestone_id = milestone_id,
                                     .amount = amount,
                                     .proof_required = proof_required,
                                     .recipient = recipient});
}

invocation_result_t contract_client::submit_milestone_proof(
    const milestone_id_t& milestone_id,
    const hash32_t& proof_reference) {
  return submit(submit_milestone_proof_t{.milestone_id = milestone_id,
                                         .proof_reference = proof_reference});
}

invocation_result_t contract_client::release_milestone(
    const milestone_id_t& milestone_id,
    bytes_t attestation) {
  return submit(release_milestone_t{.milestone_id = milestone_id,
                                    .attestation = std::move(attestation)});
}

invocation_result_t contract_client::initialize_token(const address_t& admin,
                                                      const uint32_t decimals,
                                                      std::string name,
                                                      std::string symbol) {
  return submit(initialize_token_t{.admin = admin,
                                   .decimals = decimals,
                                   .name = std::move(name),
                                   .symbol = std::move(symbol)});
}

invocation_result_t contract_client::mint(const address_t& to,
                                          const amount_t amount) {
  return submit(mint_token_t{.to = to, .amount = amount});
}

invocation_result_t contract_client::transfer(const address_t& to,
                                              const amount_t amount) {
  return submit(transfer_token_t{.from = source_, .to = to, .amount = amount});
}

std::optional<project_state_t> contract_client::get_project(
    const project_id_t& project_id) {
  return read<std::optional<project_state_t>>("/registry/project",
                                              encode_key(project_id));
}

uint32_t contract_client::get_project_count() {
  return read<uint32_t>("/registry/count", {});
}

amount_t contract_client::get_balance(const project_id_t& project_id) {
  return read<amount_t>("/escrow/balance", encode_key(project_id));
}

std::optional<escrow_account_t> contract_client::get_escrow_info(
    const project_id_t& project_id) {
  return read<std::optional<escrow_account_t>>("/escrow/info",
                                               encode_key(project_id));
}

std::optional<escrow_config_t> contract_client::get_escrow_config() {
  return read<std::optional<escrow_config_t>>("/escrow/config", {});
}

std::optional<milestone_payment_t> contract_client::get_milestone_payment(
    const milestone_id_t& milestone_id) {
  return read<std::optional<milestone_payment_t>>("/escrow/milestone_payment",
                                                  encode_key(milestone_id));
}

std::optional<milestone_state_t> contract_client::get_milestone(
    const milestone_id_t& milestone_id) {
  return read<std::optional<milestone_state_t>>("/milestones/milestone",
                                                encode_key(milestone_id));
}

std::optional<project_milestones_t> contract_client::get_project_milestones(
    const project_id_t& project_id) {
  return read<std::optional<project_milestones_t>>("/milestones/project",
                                                   encode_key(project_id));
}

amount_t contract_client::get_project_released_amount(
    const project_id_t& project_id) {
  return read<amount_t>("/milestones/released_amount",
                        encode_key(project_id));
}

bool contract_client::can_release_milestone(
    const milestone_id_t& milestone_id) {
  return read<bool>("/milestones/can_release", encode_key(milestone_id));
}

amount_t contract_client::token_balance(const address_t& address) {
  return read<amount_t>("/token/balance", encode_key(address));
}

uint64_t contract_client::last_nonce() {
  return read<uint64_t>("/engine/nonce", encode_key(source_));
}

template <typename T>
T contract_client::read(const std::string_view path, const bytes_t& data) {
  auto result = gateway_.query(path, data);
  if (result.code != 0) {
    throw query_failed{std::string{path} + ": " + result.log};
  }
  auto decoded = encoder_t{}.try_decode<T>(make_bytes_view(result.value));
  if (!decoded) {
    throw query_failed{std::string{path} + ": undecodable value"};
  }
  return std::move(*decoded);
}

bytes_t contract_client::build(const invocation_payload_t& payload,
                               const uint64_t nonce) const {
  auto invocation = invocation_t{.network_id = network_id_,
                                 .source = source_,
                                 .nonce = nonce,
                                 .payload = payload};
  auto encoder = encoder_t{};
  auto message = encoder.encode(make_signing_payload(invocation));
  invocation.authorizations.push_back(authorization_t{
      .signer = source_, .signature = sign_(make_bytes_view(message))});
  return encoder.encode(invocation);
}

}  // namespace pledge::orchestration
