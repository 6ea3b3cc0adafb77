#pragma once
#include <pledge/execution/signature_verifier.hpp>
#include <pledge/runtime/overlay.hpp>
#include <pledge/schema/app_info.hpp>
#include <pledge/schema/block_result.hpp>
#include <pledge/schema/commit_result.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/invocation.hpp>
#include <pledge/schema/invocation_result.hpp>
#include <pledge/schema/ledger_info.hpp>
#include <pledge/schema/primitives.hpp>
#include <pledge/schema/query_result.hpp>
#include <pledge/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace pledge::execution {

/// Deterministic contract host.
///
/// Validates invocation envelopes, dispatches payloads to the registry,
/// escrow, milestone and token contracts, stages writes per invocation and
/// per block, and persists a block atomically at commit.
class engine final {
 public:
  /// `network_id` must match every invocation envelope.
  /// `require_strict_crypto` enables envelope signature and attestation
  /// verification; when false only structural checks run.
  explicit engine(
      pledge::schema::encoding::encoder<
          pledge::schema::encoding::scale_encoder_tag>& encoder,
      pledge::storage::storage<pledge::storage::rocksdb_storage_tag>& storage,
      const pledge::schema::network_id_t& network_id,
      bool require_strict_crypto = true);

  /// Validate an invocation against committed state without executing it.
  pledge::schema::invocation_result_t check_invocation(
      const pledge::schema::bytes_view_t& raw_invocation);

  /// Execute a candidate block and compute its resulting state root.
  ///
  /// Invocations run in order, each in its own overlay on top of the block
  /// overlay. A failed invocation leaves no writes behind. Finalizing again
  /// before `commit` discards the previous candidate block. A block with a
  /// zero timestamp rejects every invocation with `invalid_block_time`.
  pledge::schema::block_result_t finalize_block(
      const pledge::schema::ledger_info_t& ledger,
      const std::vector<pledge::schema::bytes_t>& invocations);

  /// Persist the finalized block with its height and state root in one batch.
  pledge::schema::commit_result_t commit();

  /// Latest committed height and state root.
  pledge::schema::app_info_t info() const;

  /// Read route against committed state.
  pledge::schema::query_result_t query(
      std::string_view path,
      const pledge::schema::bytes_view_t& data);

  /// Install the envelope signature verifier. Ignored in compatibility mode.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  /// Envelope checks: version, network, nonce, source authorization and
  /// signatures. `state` supplies the nonce view.
  pledge::schema::invocation_result_t validate_invocation(
      const pledge::schema::invocation_t& invocation,
      const pledge::runtime::overlay& state,
      std::string_view codespace) const;

  /// Run the payload against `state` and record the nonce on success.
  pledge::schema::invocation_result_t execute_invocation(
      const pledge::schema::invocation_t& invocation,
      const pledge::schema::ledger_info_t& ledger,
      pledge::runtime::overlay& state);

  uint64_t load_nonce(const pledge::runtime::overlay& state,
                      const pledge::schema::address_t& source) const;

  pledge::runtime::overlay make_committed_view() const;

  mutable std::mutex mutex_;
  pledge::schema::encoding::encoder<
      pledge::schema::encoding::scale_encoder_tag>& encoder_;
  pledge::storage::storage<pledge::storage::rocksdb_storage_tag>& storage_;
  pledge::schema::network_id_t network_id_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  int64_t last_committed_height_{};
  pledge::schema::hash32_t last_committed_state_root_{};
  std::optional<int64_t> pending_height_;
  pledge::schema::hash32_t pending_state_root_{};
  pledge::runtime::overlay pending_block_;
};

}  // namespace pledge::execution
