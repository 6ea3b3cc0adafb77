#pragma once
#include <pledge/schema/claim.hpp>
#include <pledge/schema/deposit.hpp>
#include <pledge/schema/initialize_escrow.hpp>
#include <pledge/schema/initialize_milestones.hpp>
#include <pledge/schema/initialize_token.hpp>
#include <pledge/schema/mint_token.hpp>
#include <pledge/schema/primitives.hpp>
#include <pledge/schema/register_milestone.hpp>
#include <pledge/schema/register_project.hpp>
#include <pledge/schema/release_milestone.hpp>
#include <pledge/schema/release_to_recipient.hpp>
#include <pledge/schema/submit_milestone_proof.hpp>
#include <pledge/schema/transfer_token.hpp>
#include <pledge/schema/update_project_metadata.hpp>
#include <variant>
#include <vector>

// Schema type: invocation.
// Signed envelope around exactly one contract call. Every authorization signs
// the SCALE encoding of invocation_signing_payload_t.
namespace pledge::schema {

using invocation_payload_t = std::variant<register_project_t,
                                          update_project_metadata_t,
                                          initialize_escrow_t,
                                          deposit_t,
                                          claim_t,
                                          release_to_recipient_t,
                                          initialize_milestones_t,
                                          register_milestone_t,
                                          submit_milestone_proof_t,
                                          release_milestone_t,
                                          initialize_token_t,
                                          mint_token_t,
                                          transfer_token_t>;

template <uint16_t Version>
struct authorization;

template <>
struct authorization<1> final {
  signer_id_t signer{};
  signature_t signature{};
};

using authorization_t = authorization<1>;

template <uint16_t Version>
struct invocation;

template <>
struct invocation<1> final {
  uint16_t version{1};
  network_id_t network_id{};
  address_t source{};
  uint64_t nonce{};
  invocation_payload_t payload{};
  std::vector<authorization_t> authorizations;
};

using invocation_t = invocation<1>;

template <uint16_t Version>
struct invocation_signing_payload;

template <>
struct invocation_signing_payload<1> final {
  uint16_t version{1};
  network_id_t network_id{};
  address_t source{};
  uint64_t nonce{};
  invocation_payload_t payload{};
};

using invocation_signing_payload_t = invocation_signing_payload<1>;

inline invocation_signing_payload_t make_signing_payload(
    const invocation_t& value) {
  return invocation_signing_payload_t{.version = value.version,
                                      .network_id = value.network_id,
                                      .source = value.source,
                                      .nonce = value.nonce,
                                      .payload = value.payload};
}

}  // namespace pledge::schema
