#pragma once

#include <portage/bridge/params.hpp>
#include <cstdint>
#include <string>

namespace portage::config {

/// Node configuration. Bridge parameters are consensus-relevant and must
/// match across validators; the rest is local.
struct node_options final {
  std::string grpc_port{"0.0.0.0:26658"};
  std::string db_path{"portage.db"};
  std::string log_file{"portage.log"};
  bool verbose{false};
  bool strict_crypto{true};

  bool bridge_enabled{false};
  std::string rpc_url;
  uint64_t rpc_timeout_ms{5000};
  uint64_t rpc_connect_timeout_ms{3000};
  std::string signer_key;
  portage::bridge::params bridge;
};

enum class parse_status : uint8_t { run, help, error };

struct parse_result final {
  parse_status status{parse_status::error};
  node_options options;
  /// Usage text for `help`, the reason for `error`.
  std::string message;
};

/// Parse the command line and, when `--config` names one, an INI-style
/// config file. Command-line values take precedence over the file.
parse_result parse_node_options(int argc, const char* const argv[]);

/// Check cross-field constraints and resolve the signer key. Returns an
/// empty string when the options are usable.
std::string validate(node_options& options);

}  // namespace portage::config
