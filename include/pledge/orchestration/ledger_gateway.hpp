#pragma once
#include <pledge/schema/invocation_result.hpp>
#include <pledge/schema/primitives.hpp>
#include <pledge/schema/query_result.hpp>
#include <stdexcept>
#include <string_view>

namespace pledge::orchestration {

/// The submission outcome is unknown: it may or may not have been applied.
class gateway_unavailable final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// A read route answered with an error or an undecodable value.
class query_failed final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Path from the off-chain coordinator to a ledger running the contracts.
class ledger_gateway {
 public:
  virtual ~ledger_gateway() = default;

  /// Submit one encoded invocation and wait for its result.
  /// Throws gateway_unavailable when the outcome is unknown.
  virtual pledge::schema::invocation_result_t submit(
      const pledge::schema::bytes_t& invocation) = 0;

  /// Evaluate a read route against committed state.
  /// Throws gateway_unavailable when the ledger cannot be reached.
  virtual pledge::schema::query_result_t query(
      std::string_view path,
      const pledge::schema::bytes_t& data) = 0;
};

}  // namespace pledge::orchestration
