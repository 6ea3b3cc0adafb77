#pragma once
#include <pledge/schema/enum_string.hpp>
#include <pledge/schema/primitives.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Schema type: attestation.
// Attestation bytes presented to claim/release entry points carry a
// replay-protection nonce and a signature over attestation_message_t.
namespace pledge::schema {

enum class attestation_action_t : uint8_t {
  escrow_claim = 0,
  escrow_release = 1,
  milestone_release = 2,
};

inline constexpr auto kAttestationActionMappings = std::array{
    std::pair<std::string_view, attestation_action_t>{
        "escrow_claim", attestation_action_t::escrow_claim},
    std::pair<std::string_view, attestation_action_t>{
        "escrow_release", attestation_action_t::escrow_release},
    std::pair<std::string_view, attestation_action_t>{
        "milestone_release", attestation_action_t::milestone_release}};

template <>
inline std::optional<attestation_action_t>
try_from_string<attestation_action_t>(const std::string_view value) {
  return from_string(value, kAttestationActionMappings);
}

inline constexpr std::string_view to_string(const attestation_action_t value) {
  return to_string(value, kAttestationActionMappings).value_or("unknown");
}

inline constexpr auto kAttestationDomain =
    std::string_view{"pledge.attestation.v1"};

template <uint16_t Version>
struct attestation_proof;

/// Wire form of attestation bytes (SCALE encoded).
template <>
struct attestation_proof<1> final {
  uint64_t nonce{};
  ed25519_signature_t signature{};
};

using attestation_proof_t = attestation_proof<1>;

template <uint16_t Version>
struct attestation_message;

/// Canonical message the attestation key signs.
template <>
struct attestation_message<1> final {
  std::string domain{kAttestationDomain};
  network_id_t network_id{};
  address_t contract{};
  attestation_action_t action{};
  project_id_t project_id{};
  std::optional<milestone_id_t> milestone_id;
  amount_t amount{};
  std::optional<address_t> recipient;
  uint64_t nonce{};
};

using attestation_message_t = attestation_message<1>;

/// Action an attestation authorizes, minus the replay nonce.
struct attestation_subject final {
  address_t contract{};
  attestation_action_t action{};
  project_id_t project_id{};
  std::optional<milestone_id_t> milestone_id;
  amount_t amount{};
  std::optional<address_t> recipient;
};

using attestation_subject_t = attestation_subject;

inline attestation_message_t make_attestation_message(
    const network_id_t& network_id,
    const attestation_subject_t& subject,
    const uint64_t nonce) {
  return attestation_message_t{.network_id = network_id,
                               .contract = subject.contract,
                               .action = subject.action,
                               .project_id = subject.project_id,
                               .milestone_id = subject.milestone_id,
                               .amount = subject.amount,
                               .recipient = subject.recipient,
                               .nonce = nonce};
}

}  // namespace pledge::schema
