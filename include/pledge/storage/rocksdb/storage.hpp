#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <pledge/common/critical.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace pledge::storage {

namespace detail {

using encoder_t = pledge::schema::encoding::encoder<
    pledge::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|HOST|COMMITTED_STATE"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const pledge::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<pledge::schema::bytes_t> get_raw(
      const pledge::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void apply(const std::vector<key_value_entry_t>& writes,
             const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<pledge::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const pledge::schema::bytes_view_t& key) const {
  if (!database) {
    pledge::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    pledge::common::critical("Failed to get value from RocksDB");
  }
  return pledge::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(pledge::schema::make_bytes_view(detail::kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, pledge::schema::hash32_t>>(
          pledge::schema::make_bytes_view(*raw));
  if (!decoded.has_value()) {
    pledge::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::apply(
    const std::vector<key_value_entry_t>& writes,
    const committed_state& state) const {
  if (!database) {
    pledge::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto put_status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      pledge::common::critical("failed staging block write");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = batch.Put(
      detail::to_slice(pledge::schema::make_bytes_view(detail::kCommittedStateKey)),
      detail::to_slice(encoded));
  if (!state_status.ok()) {
    pledge::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit block to RocksDB: {}",
                  write_status.ToString());
    pledge::common::critical("failed to commit block");
  }
}

}  // namespace pledge::storage
