#include <pledge/runtime/overlay.hpp>
#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string_view>

namespace {

pledge::schema::bytes_t bytes(const std::string_view text) {
  return pledge::schema::make_bytes(text);
}

pledge::runtime::overlay make_base(
    const std::map<pledge::schema::bytes_t, pledge::schema::bytes_t>& rows) {
  return pledge::runtime::overlay{
      [&rows](const pledge::schema::bytes_view_t& key)
          -> std::optional<pledge::schema::bytes_t> {
        auto found = rows.find(pledge::schema::make_bytes(key));
        if (found == rows.end()) {
          return std::nullopt;
        }
        return found->second;
      }};
}

}  // namespace

TEST(overlay, reads_fall_through_to_parent) {
  auto rows = std::map<pledge::schema::bytes_t, pledge::schema::bytes_t>{
      {bytes("k"), bytes("base")}};
  auto base = make_base(rows);
  auto child = pledge::runtime::overlay::layered_on(base);

  auto value = child.get(pledge::schema::make_bytes_view(bytes("k")));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, bytes("base"));
  EXPECT_FALSE(
      child.get(pledge::schema::make_bytes_view(bytes("missing"))).has_value());
}

TEST(overlay, child_writes_are_invisible_until_merged) {
  auto rows = std::map<pledge::schema::bytes_t, pledge::schema::bytes_t>{};
  auto base = make_base(rows);
  auto child = pledge::runtime::overlay::layered_on(base);
  child.put(pledge::schema::make_bytes_view(bytes("k")), bytes("staged"));

  EXPECT_FALSE(base.get(pledge::schema::make_bytes_view(bytes("k"))).has_value());
  child.merge_into(base);
  auto merged = base.get(pledge::schema::make_bytes_view(bytes("k")));
  ASSERT_TRUE(merged.has_value());
  EXPECT_EQ(*merged, bytes("staged"));
}

TEST(overlay, dropping_child_discards_its_writes) {
  auto rows = std::map<pledge::schema::bytes_t, pledge::schema::bytes_t>{};
  auto base = make_base(rows);
  {
    auto child = pledge::runtime::overlay::layered_on(base);
    child.put(pledge::schema::make_bytes_view(bytes("k")), bytes("lost"));
  }
  EXPECT_TRUE(base.empty());
}

TEST(overlay, entries_are_key_ordered_and_last_write_wins) {
  auto base = pledge::runtime::overlay{nullptr};
  base.put(pledge::schema::make_bytes_view(bytes("b")), bytes("1"));
  base.put(pledge::schema::make_bytes_view(bytes("a")), bytes("2"));
  base.put(pledge::schema::make_bytes_view(bytes("b")), bytes("3"));

  auto entries = base.entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first, bytes("a"));
  EXPECT_EQ(entries[1].first, bytes("b"));
  EXPECT_EQ(entries[1].second, bytes("3"));

  base.clear();
  EXPECT_TRUE(base.empty());
}
