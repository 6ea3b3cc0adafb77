#pragma once
#include <pledge/schema/primitives.hpp>
#include <pledge/storage/storage.hpp>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace pledge::runtime {

/// In-memory staging buffer of writes layered over a read source.
///
/// Reads fall through to the parent source for keys the overlay has not
/// written. Nothing reaches the parent until `merge_into` (or, for the block
/// overlay, storage `apply`) is called, so dropping an overlay discards every
/// write it staged.
class overlay final {
 public:
  using reader_t = std::function<std::optional<pledge::schema::bytes_t>(
      const pledge::schema::bytes_view_t& key)>;

  explicit overlay(reader_t reader);

  /// Overlay stacked on top of another overlay.
  static overlay layered_on(const overlay& parent);

  std::optional<pledge::schema::bytes_t> get(
      const pledge::schema::bytes_view_t& key) const;
  void put(const pledge::schema::bytes_view_t& key,
           pledge::schema::bytes_t value);

  void merge_into(overlay& parent) const;

  /// Staged writes in key order.
  std::vector<pledge::storage::key_value_entry_t> entries() const;

  bool empty() const;
  void clear();

 private:
  reader_t reader_;
  std::map<pledge::schema::bytes_t, pledge::schema::bytes_t> writes_;
};

}  // namespace pledge::runtime
