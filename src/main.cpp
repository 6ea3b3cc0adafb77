#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <pledge/config/node_options.hpp>
#include <pledge/execution/engine.hpp>
#include <pledge/storage/rocksdb/storage.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void setup_logging(const pledge::config::node_options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (options.log_file) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        *options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "pledged", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

uint64_t now_seconds() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

void print_result(const uint64_t height,
                  const std::size_t index,
                  const pledge::schema::invocation_result_t& result) {
  std::cout << "height=" << height << " index=" << index
            << " code=" << result.code << " codespace=" << result.codespace
            << " log=\"" << result.log << "\" info=\"" << result.info
            << "\"\n";
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type << " contract=" << event.contract;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
}

int run_blocks(pledge::execution::engine& engine, std::istream& input) {
  auto failures = 0;
  auto block = std::vector<pledge::schema::bytes_t>{};
  auto flush = [&] {
    if (block.empty()) {
      return;
    }
    auto height = static_cast<uint64_t>(engine.info().last_block_height) + 1;
    auto finalized = engine.finalize_block(
        pledge::schema::ledger_info_t{.sequence = height,
                                      .timestamp = now_seconds()},
        block);
    for (auto i = std::size_t{0}; i < finalized.results.size(); ++i) {
      print_result(height, i, finalized.results[i]);
      if (finalized.results[i].code != 0) {
        ++failures;
      }
    }
    auto committed = engine.commit();
    spdlog::info("Committed block {} state root {}", committed.committed_height,
                 pledge::schema::to_hex(committed.state_root));
    block.clear();
  };

  auto line = std::string{};
  while (std::getline(input, line)) {
    if (line.empty()) {
      flush();
      continue;
    }
    auto decoded = pledge::schema::try_from_hex(line);
    if (!decoded) {
      spdlog::error("Skipping line that is not hex: '{}'", line);
      ++failures;
      continue;
    }
    block.push_back(std::move(*decoded));
  }
  flush();
  return failures == 0 ? 0 : 2;
}

int run_query(pledge::execution::engine& engine,
              const pledge::config::node_options& options) {
  auto data = pledge::schema::try_from_hex(options.query_data);
  if (!data) {
    spdlog::error("--query-data is not hex");
    return 1;
  }
  auto result = engine.query(*options.query_path,
                             pledge::schema::make_bytes_view(*data));
  std::cout << "code=" << result.code << " height=" << result.height
            << " log=\"" << result.log << "\" value="
            << pledge::schema::to_hex(result.value) << '\n';
  return result.code == 0 ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = std::optional<pledge::config::node_options>{};
  try {
    options = pledge::config::parse_node_options(argc, argv, std::cout);
  } catch (const boost::program_options::error& ex) {
    std::cerr << "pledged: " << ex.what() << '\n';
    return 1;
  }
  if (!options) {
    return 0;
  }
  setup_logging(*options);

  auto encoder = pledge::schema::encoding::encoder<
      pledge::schema::encoding::scale_encoder_tag>{};
  auto storage =
      pledge::storage::make_storage<pledge::storage::rocksdb_storage_tag>(
          options->db_path);
  auto engine = pledge::execution::engine{
      encoder, storage, pledge::config::make_network_id(options->network),
      options->strict_crypto};

  auto status = 0;
  if (options->query_path) {
    status = run_query(engine, *options);
  } else if (options->input) {
    auto file = std::ifstream{*options->input};
    if (!file) {
      spdlog::error("Cannot open input file {}", *options->input);
      status = 1;
    } else {
      status = run_blocks(engine, file);
    }
  } else {
    status = run_blocks(engine, std::cin);
  }

  spdlog::shutdown();
  return status;
}
