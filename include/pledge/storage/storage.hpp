#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace pledge::storage {

using key_value_entry_t =
    std::pair<pledge::schema::bytes_t, pledge::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  pledge::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Raw encoded value at key.
  std::optional<pledge::schema::bytes_t> get_raw(
      const pledge::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically persist a block's writes together with its checkpoint.
  void apply(const std::vector<key_value_entry_t>& writes,
             const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace pledge::storage
