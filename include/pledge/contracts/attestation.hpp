#pragma once
#include <pledge/runtime/context.hpp>
#include <pledge/schema/attestation.hpp>
#include <pledge/schema/contract_error_code.hpp>
#include <pledge/schema/primitives.hpp>

namespace pledge::contracts {

inline constexpr auto kAttestationNonceKind = std::string_view{"ATTEST_NONCE"};

/// Check attestation bytes for `subject` against `key`.
///
/// Always rejects input shorter than a signature. In strict mode the bytes
/// must decode to an attestation proof whose signature covers the canonical
/// message for `subject`, and whose nonce this contract has not consumed yet.
/// An accepted nonce is recorded in the caller's frame.
pledge::schema::contract_error_code verify_attestation(
    pledge::runtime::context& context,
    const pledge::schema::ed25519_signer_id& key,
    const pledge::schema::bytes_t& attestation,
    const pledge::schema::attestation_subject_t& subject);

/// Encoded canonical message an attestation key signs.
pledge::schema::bytes_t make_attestation_payload(
    const pledge::schema::network_id_t& network_id,
    const pledge::schema::attestation_subject_t& subject,
    uint64_t nonce);

}  // namespace pledge::contracts
