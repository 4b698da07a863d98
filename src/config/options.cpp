#include <portage/config/options.hpp>
#include <portage/crypto/eth_signer.hpp>
#include <portage/schema/address.hpp>

#include <boost/program_options.hpp>
#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace portage::config {

namespace {

po::options_description make_node_description(node_options& options) {
  auto node = po::options_description{"Node"};
  node.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI-style configuration file")(
      "grpc-port,g",
      po::value<std::string>(&options.grpc_port)->default_value(
          options.grpc_port),
      "IP:Port for the ABCI server")(
      "db-path",
      po::value<std::string>(&options.db_path)->default_value(options.db_path),
      "RocksDB directory")(
      "log-file",
      po::value<std::string>(&options.log_file)->default_value(
          options.log_file),
      "Log file path")("verbose,v",
                       po::bool_switch(&options.verbose)->default_value(false),
                       "Enable debug logging")(
      "strict-crypto",
      po::value<bool>(&options.strict_crypto)->default_value(true),
      "Verify transaction signatures");

  auto bridge = po::options_description{"Bridge"};
  bridge.add_options()(
      "bridge.enabled",
      po::value<bool>(&options.bridge_enabled)->default_value(false),
      "Run the block-end deposit hooks")(
      "bridge.rpc-url", po::value<std::string>(&options.rpc_url),
      "L2 JSON-RPC endpoint")(
      "bridge.contract",
      po::value<std::string>(&options.bridge.contract)
          ->default_value(options.bridge.contract),
      "L2 bridge contract address")(
      "bridge.l2-genesis-time",
      po::value<uint64_t>(&options.bridge.l2_genesis_time)
          ->default_value(options.bridge.l2_genesis_time),
      "L2 genesis timestamp (seconds)")(
      "bridge.l2-block-interval",
      po::value<uint64_t>(&options.bridge.l2_block_interval)
          ->default_value(options.bridge.l2_block_interval),
      "L2 block interval (seconds)")(
      "bridge.finality-margin",
      po::value<uint64_t>(&options.bridge.finality_margin)
          ->default_value(options.bridge.finality_margin),
      "L2 blocks subtracted from the derived height")(
      "bridge.check-interval",
      po::value<uint64_t>(&options.bridge.check_interval)
          ->default_value(options.bridge.check_interval),
      "Seconds between deposit gap scans")(
      "bridge.max-batch",
      po::value<uint64_t>(&options.bridge.max_batch)
          ->default_value(options.bridge.max_batch),
      "Deposits settled per gap scan")(
      "bridge.per-block-cap",
      po::value<uint64_t>(&options.bridge.per_block_cap)
          ->default_value(options.bridge.per_block_cap),
      "Deposits ingested per block")(
      "bridge.rpc-timeout-ms",
      po::value<uint64_t>(&options.rpc_timeout_ms)
          ->default_value(options.rpc_timeout_ms),
      "Total timeout per L2 request")(
      "bridge.rpc-connect-timeout-ms",
      po::value<uint64_t>(&options.rpc_connect_timeout_ms)
          ->default_value(options.rpc_connect_timeout_ms),
      "Connect timeout per L2 request")(
      "bridge.signer-key", po::value<std::string>(&options.signer_key),
      "Withdrawal signing key (hex); enables block-end auto-signing");

  auto description = po::options_description{"Portage"};
  description.add(node).add(bridge);
  return description;
}

}  // namespace

parse_result parse_node_options(int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto description = make_node_description(result.options);
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        result.message = "cannot open config file " + path;
        return result;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    result.message = ex.what();
    return result;
  }

  if (vm.contains("help")) {
    auto usage = std::ostringstream{};
    usage << description;
    result.status = parse_status::help;
    result.message = usage.str();
    return result;
  }

  result.message = validate(result.options);
  result.status =
      result.message.empty() ? parse_status::run : parse_status::error;
  return result;
}

std::string validate(node_options& options) {
  auto contract =
      portage::schema::try_parse_eth_address(options.bridge.contract);
  if (!contract) {
    return "bridge.contract must be 0x followed by 40 hex characters";
  }
  // Record ids hash the contract string, so every spelling must agree.
  options.bridge.contract = portage::crypto::to_checksum_address(*contract);
  if (options.bridge.l2_block_interval == 0) {
    return "bridge.l2-block-interval must be positive";
  }
  if (options.bridge_enabled && options.rpc_url.empty()) {
    return "bridge.enabled requires bridge.rpc-url";
  }
  if (options.rpc_timeout_ms == 0) {
    return "bridge.rpc-timeout-ms must be positive";
  }
  options.bridge.signer_key.reset();
  if (!options.signer_key.empty()) {
    options.bridge.signer_key =
        portage::crypto::parse_secret_key(options.signer_key);
    if (!options.bridge.signer_key) {
      return "bridge.signer-key must be a valid secp256k1 secret in hex";
    }
  }
  return {};
}

}  // namespace portage::config
