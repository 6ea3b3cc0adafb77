#include <pledge/orchestration/engine_gateway.hpp>

#include <chrono>
#include <utility>

namespace pledge::orchestration {

namespace {

pledge::schema::timestamp_seconds_t system_clock_seconds() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<pledge::schema::timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

}  // namespace

engine_gateway::engine_gateway(pledge::execution::engine& engine)
    : engine_gateway(engine, system_clock_seconds) {}

engine_gateway::engine_gateway(pledge::execution::engine& engine,
                               clock_fn_t clock)
    : engine_(engine), clock_(std::move(clock)) {}

pledge::schema::invocation_result_t engine_gateway::submit(
    const pledge::schema::bytes_t& invocation) {
  auto height = engine_.info().last_block_height + 1;
  auto block = engine_.finalize_block(
      pledge::schema::ledger_info_t{.sequence = static_cast<uint64_t>(height),
                                    .timestamp = clock_()},
      {invocation});
  engine_.commit();
  return block.results.front();
}

pledge::schema::query_result_t engine_gateway::query(
    const std::string_view path,
    const pledge::schema::bytes_t& data) {
  return engine_.query(path, pledge::schema::make_bytes_view(data));
}

}  // namespace pledge::orchestration
