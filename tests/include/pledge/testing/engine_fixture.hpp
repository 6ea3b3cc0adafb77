#pragma once

#include <gtest/gtest.h>

#include <pledge/execution/engine.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/invocation.hpp>
#include <pledge/storage/rocksdb/storage.hpp>
#include <pledge/testing/common.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pledge::testing {

using scale_encoder_t = pledge::schema::encoding::encoder<
    pledge::schema::encoding::scale_encoder_tag>;

/// Fresh RocksDB-backed engine in a temp directory.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix,
                          const bool strict_crypto = false)
      : db_path_{make_db_path(db_prefix)},
        network_id_{make_hash(0x42)},
        strict_crypto_{strict_crypto} {
    open();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    close();
    remove_path(db_path_);
  }

  /// Drop the engine and database handle, then reopen the same path.
  void reopen() {
    close();
    open();
  }

  const std::string& db_path() const { return db_path_; }
  const pledge::schema::network_id_t& network_id() const {
    return network_id_;
  }
  scale_encoder_t& encoder() { return encoder_; }
  pledge::execution::engine& engine() { return *engine_; }

  /// Envelope signed by `source` alone with a placeholder signature.
  pledge::schema::bytes_t make_invocation(
      const pledge::schema::address_t& source,
      const uint64_t nonce,
      const pledge::schema::invocation_payload_t& payload) {
    auto invocation =
        pledge::schema::invocation_t{.network_id = network_id_,
                                     .source = source,
                                     .nonce = nonce,
                                     .payload = payload};
    invocation.authorizations.push_back(pledge::schema::authorization_t{
        .signer = source,
        .signature = pledge::schema::ed25519_signature_t{}});
    return encoder_.encode(invocation);
  }

  /// Finalize `invocations` as block `height` and commit it.
  pledge::schema::block_result_t apply_block(
      const uint64_t height,
      const std::vector<pledge::schema::bytes_t>& invocations) {
    auto block = engine_->finalize_block(
        pledge::schema::ledger_info_t{.sequence = height,
                                      .timestamp = 1'700'000'000 + height},
        invocations);
    EXPECT_EQ(block.results.size(), invocations.size());
    static_cast<void>(engine_->commit());
    return block;
  }

  /// Submit one payload from `source` with the next nonce in a block of its
  /// own.
  pledge::schema::invocation_result_t submit(
      const pledge::schema::address_t& source,
      const pledge::schema::invocation_payload_t& payload) {
    auto nonce = query<uint64_t>("/engine/nonce", encoder_.encode(source)) + 1;
    auto height =
        static_cast<uint64_t>(engine_->info().last_block_height) + 1;
    return apply_block(height, {make_invocation(source, nonce, payload)})
        .results.front();
  }

  template <typename T>
  T query(const std::string_view path, const pledge::schema::bytes_t& data) {
    auto result = engine_->query(path, pledge::schema::make_bytes_view(data));
    EXPECT_EQ(result.code, 0u) << path << ": " << result.log;
    return encoder_.decode<T>(pledge::schema::make_bytes_view(result.value));
  }

 private:
  void open() {
    storage_ = std::make_unique<
        pledge::storage::storage<pledge::storage::rocksdb_storage_tag>>(
        pledge::storage::make_storage<pledge::storage::rocksdb_storage_tag>(
            db_path_));
    engine_ = std::make_unique<pledge::execution::engine>(
        encoder_, *storage_, network_id_, strict_crypto_);
  }

  void close() {
    engine_.reset();
    storage_.reset();
  }

  std::string db_path_;
  pledge::schema::network_id_t network_id_;
  bool strict_crypto_{false};
  scale_encoder_t encoder_;
  std::unique_ptr<
      pledge::storage::storage<pledge::storage::rocksdb_storage_tag>>
      storage_;
  std::unique_ptr<pledge::execution::engine> engine_;
};

}  // namespace pledge::testing
