#pragma once
#include <pledge/schema/primitives.hpp>

namespace pledge::schema {

/// Ledger clock seen by every invocation of a block.
struct ledger_info final {
  uint64_t sequence{};
  timestamp_seconds_t timestamp{};
};

using ledger_info_t = ledger_info;

}  // namespace pledge::schema
