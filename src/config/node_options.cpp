#include <boost/program_options.hpp>
#include <pledge/blake3/hash.hpp>
#include <pledge/config/node_options.hpp>

#include <fstream>

namespace po = boost::program_options;

namespace pledge::config {

std::optional<node_options> parse_node_options(const int argc,
                                               const char* const argv[],
                                               std::ostream& out) {
  auto options = node_options{};
  auto config_file = std::string{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI style configuration file");

  auto node = po::options_description{"Node"};
  node.add_options()(
      "db-path", po::value<std::string>(&options.db_path)->default_value(
                     options.db_path),
      "RocksDB directory")(
      "network", po::value<std::string>(&options.network)
                     ->default_value(options.network),
      "Network passphrase")(
      "strict-crypto", po::value<bool>(&options.strict_crypto)
                           ->default_value(options.strict_crypto),
      "Verify envelope signatures and attestations")(
      "log-level", po::value<std::string>(&options.log_level)
                       ->default_value(options.log_level),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(), "Also log to this file")(
      "input,i", po::value<std::string>(),
      "Invocation file (hex per line, blank line between blocks)")(
      "query", po::value<std::string>(), "Read route to evaluate and exit")(
      "query-data", po::value<std::string>(&options.query_data)
                        ->default_value(""),
      "SCALE encoded query key as hex");

  auto command_line = po::options_description{"pledged"};
  command_line.add(generic).add(node);

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, command_line), vm);
  if (vm.contains("help")) {
    out << command_line << '\n';
    return std::nullopt;
  }
  if (vm.contains("config")) {
    auto file = std::ifstream{vm["config"].as<std::string>()};
    if (!file) {
      throw po::error{"cannot open config file " +
                      vm["config"].as<std::string>()};
    }
    po::store(po::parse_config_file(file, node), vm);
  }
  po::notify(vm);

  if (vm.contains("log-file")) {
    options.log_file = vm["log-file"].as<std::string>();
  }
  if (vm.contains("input")) {
    options.input = vm["input"].as<std::string>();
  }
  if (vm.contains("query")) {
    options.query_path = vm["query"].as<std::string>();
  }
  return options;
}

pledge::schema::network_id_t make_network_id(
    const std::string_view passphrase) {
  return pledge::blake3::hash(passphrase);
}

}  // namespace pledge::config
