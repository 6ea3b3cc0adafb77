#include <boost/program_options.hpp>
#include <pledge/config/node_options.hpp>
#include <pledge/common/critical.hpp>
#include <pledge/contracts/attestation.hpp>
#include <pledge/runtime/contract_ids.hpp>
#include <pledge/schema/attestation.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/invocation.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace {

using encoder_t = pledge::schema::encoding::encoder<
    pledge::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    pledge::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

pledge::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  auto hash = pledge::schema::try_make_hash32(require(vm, name));
  if (!hash) {
    pledge::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

std::optional<pledge::schema::hash32_t> get_optional_hash32(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return get_hash32(vm, name);
}

template <std::size_t N>
std::array<uint8_t, N> get_fixed_bytes(const std::string_view hex,
                                       const std::string_view what) {
  auto bytes = pledge::schema::try_from_hex(hex);
  auto out = std::array<uint8_t, N>{};
  if (!bytes || bytes->size() != N) {
    pledge::common::critical(std::string{what} + " has the wrong length");
  }
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

// Accepts ed25519:<hex>, secp256k1:<hex>, contract:<name> or contract:<hex>.
pledge::schema::address_t parse_address(const std::string_view text) {
  auto separator = text.find(':');
  if (separator == std::string_view::npos) {
    pledge::common::critical("address must be <kind>:<value>");
  }
  auto kind = text.substr(0, separator);
  auto value = text.substr(separator + 1);
  if (kind == "ed25519") {
    return pledge::schema::ed25519_signer_id{
        .public_key = get_fixed_bytes<32>(value, "ed25519 public key")};
  }
  if (kind == "secp256k1") {
    return pledge::schema::secp256k1_signer_id{
        .public_key = get_fixed_bytes<33>(value, "secp256k1 public key")};
  }
  if (kind == "contract") {
    auto id = pledge::schema::try_make_hash32(value);
    return pledge::schema::named_signer_t{
        id ? *id : pledge::runtime::make_contract_id(value)};
  }
  pledge::common::critical("unsupported address kind");
}

pledge::schema::address_t get_address(const po::variables_map& vm,
                                      const std::string& name) {
  return parse_address(require(vm, name));
}

pledge::schema::ed25519_signer_id get_ed25519_key(const po::variables_map& vm,
                                                  const std::string& name) {
  return pledge::schema::ed25519_signer_id{
      .public_key = get_fixed_bytes<32>(require(vm, name), name)};
}

pledge::schema::bytes_t get_bytes(const po::variables_map& vm,
                                  const std::string& name) {
  auto bytes = pledge::schema::try_from_hex(require(vm, name));
  if (!bytes) {
    pledge::common::critical("--" + name + " must be hex");
  }
  return *bytes;
}

pledge::schema::network_id_t get_network_id(const po::variables_map& vm) {
  return pledge::config::make_network_id(require(vm, "network"));
}

pledge::schema::signature_t make_signature(const po::variables_map& vm,
                                           const bool secp256k1) {
  auto hex = vm["signature-hex"].as<std::string>();
  if (secp256k1) {
    auto signature = pledge::schema::secp256k1_signature_t{};
    if (!hex.empty()) {
      signature = get_fixed_bytes<65>(hex, "secp256k1 signature");
    }
    return signature;
  }
  auto signature = pledge::schema::ed25519_signature_t{};
  if (!hex.empty()) {
    signature = get_fixed_bytes<64>(hex, "ed25519 signature");
  }
  return signature;
}

pledge::schema::invocation_payload_t build_payload(const po::variables_map& vm) {
  auto payload = require(vm, "payload");
  auto amount = vm["amount"].as<int64_t>();
  if (payload == "register_project") {
    return pledge::schema::register_project_t{
        .owner = get_address(vm, "source"),
        .project_id = get_hash32(vm, "project-id"),
        .metadata_uri = vm["metadata-uri"].as<std::string>()};
  }
  if (payload == "update_project_metadata") {
    return pledge::schema::update_project_metadata_t{
        .project_id = get_hash32(vm, "project-id"),
        .metadata_uri = vm["metadata-uri"].as<std::string>()};
  }
  if (payload == "initialize_escrow") {
    return pledge::schema::initialize_escrow_t{
        .token = get_address(vm, "token"),
        .attestation_pubkey = get_ed25519_key(vm, "attestation-key")};
  }
  if (payload == "deposit") {
    return pledge::schema::deposit_t{.from = get_address(vm, "source"),
                                     .project_id = get_hash32(vm, "project-id"),
                                     .amount = amount,
                                     .memo = vm["memo"].as<std::string>()};
  }
  if (payload == "claim") {
    return pledge::schema::claim_t{.project_id = get_hash32(vm, "project-id"),
                                   .amount = amount,
                                   .attestation = get_bytes(vm, "attestation")};
  }
  if (payload == "release_to_recipient") {
    return pledge::schema::release_to_recipient_t{
        .project_id = get_hash32(vm, "project-id"),
        .recipient = get_address(vm, "recipient"),
        .amount = amount,
        .milestone_id = get_optional_hash32(vm, "milestone-id"),
        .attestation = get_bytes(vm, "attestation")};
  }
  if (payload == "initialize_milestones") {
    return pledge::schema::initialize_milestones_t{
        .admin = get_address(vm, "admin"),
        .attestation_key = get_ed25519_key(vm, "attestation-key")};
  }
  if (payload == "register_milestone") {
    return pledge::schema::register_milestone_t{
        .project_id = get_hash32(vm, "project-id"),
        .milestone_id = get_hash32(vm, "milestone-id"),
        .amount = amount,
        .proof_required = vm["proof-required"].as<bool>(),
        .recipient = get_address(vm, "recipient")};
  }
  if (payload == "submit_milestone_proof") {
    return pledge::schema::submit_milestone_proof_t{
        .milestone_id = get_hash32(vm, "milestone-id"),
        .proof_reference = get_hash32(vm, "proof-reference")};
  }
  if (payload == "release_milestone") {
    return pledge::schema::release_milestone_t{
        .milestone_id = get_hash32(vm, "milestone-id"),
        .attestation = get_bytes(vm, "attestation")};
  }
  if (payload == "initialize_token") {
    return pledge::schema::initialize_token_t{
        .admin = get_address(vm, "admin"),
        .decimals = vm["decimals"].as<uint32_t>(),
        .name = vm["token-name"].as<std::string>(),
        .symbol = vm["token-symbol"].as<std::string>()};
  }
  if (payload == "mint_token") {
    return pledge::schema::mint_token_t{.to = get_address(vm, "recipient"),
                                        .amount = amount};
  }
  if (payload == "transfer_token") {
    return pledge::schema::transfer_token_t{
        .from = get_address(vm, "source"),
        .to = get_address(vm, "recipient"),
        .amount = amount};
  }
  pledge::common::critical("unsupported payload type");
}

pledge::schema::invocation_t build_invocation(const po::variables_map& vm) {
  auto source = get_address(vm, "source");
  auto invocation =
      pledge::schema::invocation_t{.network_id = get_network_id(vm),
                                   .source = source,
                                   .nonce = vm["nonce"].as<uint64_t>(),
                                   .payload = build_payload(vm)};
  auto secp256k1 =
      std::holds_alternative<pledge::schema::secp256k1_signer_id>(source);
  invocation.authorizations.push_back(pledge::schema::authorization_t{
      .signer = source, .signature = make_signature(vm, secp256k1)});
  return invocation;
}

pledge::schema::attestation_subject_t build_subject(
    const po::variables_map& vm) {
  auto action = pledge::schema::try_from_string<
      pledge::schema::attestation_action_t>(require(vm, "action"));
  if (!action) {
    pledge::common::critical(
        "--action must be escrow_claim|escrow_release|milestone_release");
  }
  auto subject = pledge::schema::attestation_subject_t{
      .action = *action,
      .project_id = get_hash32(vm, "project-id"),
      .amount = vm["amount"].as<int64_t>()};
  switch (*action) {
    case pledge::schema::attestation_action_t::escrow_claim:
      subject.contract = pledge::runtime::escrow_contract_id();
      break;
    case pledge::schema::attestation_action_t::escrow_release:
      subject.contract = pledge::runtime::escrow_contract_id();
      subject.milestone_id = get_optional_hash32(vm, "milestone-id");
      subject.recipient = get_address(vm, "recipient");
      break;
    case pledge::schema::attestation_action_t::milestone_release:
      subject.contract = pledge::runtime::milestones_contract_id();
      subject.milestone_id = get_hash32(vm, "milestone-id");
      subject.recipient = get_address(vm, "recipient");
      break;
  }
  return subject;
}

pledge::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = require(vm, "path");
  if (path == "/engine/info" || path == "/registry/count" ||
      path == "/escrow/config") {
    return {};
  }
  if (path == "/engine/nonce") {
    return encoder.encode(get_address(vm, "source"));
  }
  if (path == "/token/balance") {
    return encoder.encode(get_address(vm, "recipient"));
  }
  if (path == "/registry/project" || path == "/escrow/balance" ||
      path == "/escrow/info" || path == "/milestones/project" ||
      path == "/milestones/released_amount") {
    return encoder.encode(get_hash32(vm, "project-id"));
  }
  if (path == "/milestones/milestone" || path == "/milestones/can_release" ||
      path == "/escrow/milestone_payment") {
    return encoder.encode(get_hash32(vm, "milestone-id"));
  }
  pledge::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  pledge_invocation_builder invocation [options]\n"
            << "  pledge_invocation_builder signing-payload [options]\n"
            << "  pledge_invocation_builder attestation-message [options]\n"
            << "  pledge_invocation_builder attestation [options]\n"
            << "  pledge_invocation_builder query-key [options]\n"
            << "  pledge_invocation_builder network-id [options]\n"
            << "  pledge_invocation_builder contract-id [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"pledge_invocation_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "invocation|signing-payload|attestation-message|attestation|query-key|"
      "network-id|contract-id")("payload", po::value<std::string>(),
                                "invocation payload type")(
      "path", po::value<std::string>(), "query path")(
      "network", po::value<std::string>()->default_value("pledge-local"),
      "network passphrase")("nonce", po::value<uint64_t>()->default_value(1),
                            "invocation or attestation nonce")(
      "source", po::value<std::string>(), "source address <kind>:<hex>")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "source signature hex")("project-id", po::value<std::string>(),
                              "project hash32 hex")(
      "milestone-id", po::value<std::string>(), "milestone hash32 hex")(
      "amount", po::value<int64_t>()->default_value(0), "amount in stroops")(
      "memo", po::value<std::string>()->default_value(""), "deposit memo")(
      "metadata-uri", po::value<std::string>()->default_value(""),
      "project metadata uri")("recipient", po::value<std::string>(),
                              "recipient address <kind>:<hex>")(
      "admin", po::value<std::string>(), "admin address <kind>:<hex>")(
      "token", po::value<std::string>()->default_value("contract:token"),
      "token contract address")("attestation-key", po::value<std::string>(),
                                "ed25519 attestation public key hex")(
      "attestation", po::value<std::string>(), "attestation bytes hex")(
      "action", po::value<std::string>(),
      "escrow_claim|escrow_release|milestone_release")(
      "proof-required", po::value<bool>()->default_value(false),
      "milestone needs proof before release")(
      "proof-reference", po::value<std::string>(), "proof hash32 hex")(
      "decimals", po::value<uint32_t>()->default_value(7), "token decimals")(
      "token-name", po::value<std::string>()->default_value("Pledge"),
      "token name")("token-symbol",
                    po::value<std::string>()->default_value("PLG"),
                    "token symbol")("name", po::value<std::string>(),
                                    "contract name");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};
  if (command == "invocation") {
    std::cout << pledge::schema::to_hex(encoder.encode(build_invocation(vm)))
              << '\n';
    return 0;
  }
  if (command == "signing-payload") {
    auto payload = pledge::schema::make_signing_payload(build_invocation(vm));
    std::cout << pledge::schema::to_hex(encoder.encode(payload)) << '\n';
    return 0;
  }
  if (command == "attestation-message") {
    auto message = pledge::contracts::make_attestation_payload(
        get_network_id(vm), build_subject(vm), vm["nonce"].as<uint64_t>());
    std::cout << pledge::schema::to_hex(message) << '\n';
    return 0;
  }
  if (command == "attestation") {
    auto proof = pledge::schema::attestation_proof_t{
        .nonce = vm["nonce"].as<uint64_t>(),
        .signature = get_fixed_bytes<64>(require(vm, "signature-hex"),
                                         "ed25519 signature")};
    std::cout << pledge::schema::to_hex(encoder.encode(proof)) << '\n';
    return 0;
  }
  if (command == "query-key") {
    std::cout << pledge::schema::to_hex(build_query_key(vm)) << '\n';
    return 0;
  }
  if (command == "network-id") {
    std::cout << pledge::schema::to_hex(get_network_id(vm)) << '\n';
    return 0;
  }
  if (command == "contract-id") {
    std::cout << pledge::schema::to_hex(
                     pledge::runtime::make_contract_id(require(vm, "name")))
              << '\n';
    return 0;
  }

  pledge::common::critical(
      "command must be invocation|signing-payload|attestation-message|"
      "attestation|query-key|network-id|contract-id");
}
