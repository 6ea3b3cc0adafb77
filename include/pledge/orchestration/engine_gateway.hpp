#pragma once
#include <pledge/execution/engine.hpp>
#include <pledge/orchestration/ledger_gateway.hpp>
#include <functional>

namespace pledge::orchestration {

/// In-process gateway: every submission is finalized and committed as its
/// own block.
class engine_gateway final : public ledger_gateway {
 public:
  using clock_fn_t = std::function<pledge::schema::timestamp_seconds_t()>;

  explicit engine_gateway(pledge::execution::engine& engine);
  engine_gateway(pledge::execution::engine& engine, clock_fn_t clock);

  pledge::schema::invocation_result_t submit(
      const pledge::schema::bytes_t& invocation) override;
  pledge::schema::query_result_t query(
      std::string_view path,
      const pledge::schema::bytes_t& data) override;

 private:
  pledge::execution::engine& engine_;
  clock_fn_t clock_;
};

}  // namespace pledge::orchestration
