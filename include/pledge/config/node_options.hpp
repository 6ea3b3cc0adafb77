#pragma once
#include <pledge/schema/primitives.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace pledge::config {

/// Runtime configuration of the `pledged` host.
struct node_options final {
  std::string db_path{"pledge-data"};
  /// Network passphrase; the network id is its blake3 hash.
  std::string network{"pledge-local"};
  bool strict_crypto{true};
  std::string log_level{"info"};
  std::optional<std::string> log_file;
  /// Invocation file, one hex envelope per line, blank line between blocks.
  /// Reads stdin when unset.
  std::optional<std::string> input;
  std::optional<std::string> query_path;
  std::string query_data;
};

/// Parse the command line, then the config file named by `--config` if any.
/// Command line values win over file values. Returns std::nullopt after
/// printing usage to `out` when help was requested. Throws
/// boost::program_options::error on malformed input.
std::optional<node_options> parse_node_options(int argc,
                                               const char* const argv[],
                                               std::ostream& out);

pledge::schema::network_id_t make_network_id(std::string_view passphrase);

}  // namespace pledge::config
