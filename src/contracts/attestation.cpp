#include <pledge/contracts/attestation.hpp>
#include <pledge/crypto/verify.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <spdlog/spdlog.h>

using namespace pledge::schema;

namespace pledge::contracts {

bytes_t make_attestation_payload(const network_id_t& network_id,
                                 const attestation_subject_t& subject,
                                 const uint64_t nonce) {
  return encoding::scale_encoder_t{}.encode(
      make_attestation_message(network_id, subject, nonce));
}

contract_error_code verify_attestation(pledge::runtime::context& context,
                                       const ed25519_signer_id& key,
                                       const bytes_t& attestation,
                                       const attestation_subject_t& subject) {
  if (attestation.size() < kMinimumSignatureSize) {
    return contract_error_code::invalid_attestation;
  }
  if (!context.strict_crypto()) {
    return contract_error_code::ok;
  }

  auto proof = encoding::scale_encoder_t{}.try_decode<attestation_proof_t>(
      make_bytes_view(attestation));
  if (!proof) {
    spdlog::debug("Rejected undecodable attestation for {}",
                  to_string(subject.action));
    return contract_error_code::invalid_attestation;
  }

  auto message =
      make_attestation_payload(context.network_id(), subject, proof->nonce);
  if (!pledge::crypto::verify_signature(make_bytes_view(message),
                                        signer_id_t{key},
                                        signature_t{proof->signature})) {
    spdlog::debug("Rejected attestation signature for {} nonce {}",
                  to_string(subject.action), proof->nonce);
    return contract_error_code::invalid_attestation;
  }

  if (context.has_persistent(kAttestationNonceKind, proof->nonce)) {
    spdlog::warn("Replayed attestation nonce {} for {}", proof->nonce,
                 to_string(subject.action));
    return contract_error_code::attestation_replayed;
  }
  context.put_persistent(kAttestationNonceKind, proof->nonce, true);
  return contract_error_code::ok;
}

}  // namespace pledge::contracts
