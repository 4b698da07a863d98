#include <boost/program_options.hpp>
#include <portage/blake3/hash.hpp>
#include <portage/bridge/deposit_settlement.hpp>
#include <portage/bridge/withdrawals.hpp>
#include <portage/common/critical.hpp>
#include <portage/schema/encoding/scale/encoder.hpp>
#include <portage/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = portage::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

constexpr auto kDefaultChainName = std::string_view{"portage-bridge-chain"};

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    portage::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

portage::schema::hash32_t get_hash32(const po::variables_map& vm,
                                     const std::string& name) {
  auto bytes = portage::schema::try_from_hex(require_string(vm, name));
  if (!bytes || bytes->size() != 32) {
    portage::common::critical("--" + name + " must be 32 bytes of hex");
  }
  auto hash = portage::schema::hash32_t{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(hash));
  return hash;
}

portage::schema::amount_t get_amount(const po::variables_map& vm) {
  auto amount = portage::schema::try_parse_amount(require_string(vm, "amount"));
  if (!amount) {
    portage::common::critical("--amount must be a decimal integer");
  }
  return *amount;
}

portage::schema::hash32_t resolve_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return get_hash32(vm, "chain-id");
  }
  return portage::blake3::hash(
      std::string_view{vm["chain-name"].as<std::string>()});
}

portage::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  auto bytes = portage::schema::bytes_t{};
  if (!hex.empty()) {
    auto decoded = portage::schema::try_from_hex(hex);
    if (!decoded) {
      portage::common::critical("--signature-hex is not valid hex");
    }
    bytes = std::move(*decoded);
  }
  if (kind == "ed25519") {
    auto signature = portage::schema::ed25519_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        portage::common::critical("ed25519 signature must be 64 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return portage::schema::signature_t{signature};
  }
  if (kind == "secp256k1") {
    auto signature = portage::schema::secp256k1_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        portage::common::critical("secp256k1 signature must be 65 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return portage::schema::signature_t{signature};
  }
  portage::common::critical("unsupported signature-kind");
}

portage::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = require_string(vm, "payload");
  if (payload == "initiate_withdrawal") {
    return portage::schema::initiate_withdrawal_t{
        .destination = require_string(vm, "destination"),
        .amount = get_amount(vm)};
  }
  if (payload == "sign_withdrawal") {
    return portage::schema::sign_withdrawal_t{
        .nonce = require_string(vm, "withdrawal-nonce"),
        .signer_key = require_string(vm, "signer-key")};
  }
  if (payload == "process_deposit") {
    auto height = std::optional<uint64_t>{};
    if (vm.contains("external-height")) {
      height = vm["external-height"].as<uint64_t>();
    }
    return portage::schema::process_deposit_t{
        .index = vm["index"].as<uint64_t>(), .external_height = height};
  }
  if (payload == "complete_withdrawal") {
    return portage::schema::complete_withdrawal_t{
        .nonce = require_string(vm, "withdrawal-nonce"),
        .external_tx_ref = vm["external-tx-ref"].as<std::string>()};
  }
  portage::common::critical(
      "payload must be initiate_withdrawal|sign_withdrawal|process_deposit|"
      "complete_withdrawal");
}

portage::schema::bytes_t build_query_data(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = require_string(vm, "path");
  if (path == "/engine/info" || path == "/bridge/cursor" ||
      path == "/bridge/last_check_time") {
    return {};
  }
  if (path == "/bridge/processed") {
    return encoder.encode(require_string(vm, "record-id"));
  }
  if (path == "/bridge/processed_index" || path == "/bridge/record_id") {
    return encoder.encode(vm["index"].as<uint64_t>());
  }
  if (path == "/withdrawal/get") {
    return encoder.encode(require_string(vm, "withdrawal-nonce"));
  }
  if (path == "/withdrawal/list") {
    if (!vm.contains("owner")) {
      return {};
    }
    return encoder.encode(
        std::optional<std::string>{vm["owner"].as<std::string>()});
  }
  if (path == "/bank/balance") {
    return encoder.encode(require_string(vm, "account"));
  }
  portage::common::critical("unsupported query path");
}

/// Rebuilds the signed message of a withdrawal and prints the recovering
/// address, for checking a signature before it is submitted to the L2.
int recover_withdrawal_signer(const po::variables_map& vm) {
  auto signature = portage::schema::try_from_hex(
      require_string(vm, "signature-hex"));
  if (!signature) {
    portage::common::critical("--signature-hex is not valid hex");
  }
  auto request = portage::schema::withdrawal_request_t{};
  request.nonce = require_string(vm, "withdrawal-nonce");
  request.destination = require_string(vm, "destination");
  request.amount = get_amount(vm);
  request.signature = std::move(*signature);
  auto signer = portage::bridge::recover_signer(request);
  if (!signer) {
    std::cerr << "signature does not recover an address\n";
    return 1;
  }
  std::cout << *signer << '\n';
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder query-data [options]\n"
            << "  transaction_builder chain-id [--chain-name name]\n"
            << "  transaction_builder record-id --contract addr --index n\n"
            << "  transaction_builder recover-signer [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-data|chain-id|record-id|recover-signer")(
      "payload", po::value<std::string>(),
      "initiate_withdrawal|sign_withdrawal|process_deposit|"
      "complete_withdrawal")("path", po::value<std::string>(),
                             "abci query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name",
      po::value<std::string>()->default_value(std::string{kDefaultChainName}),
      "chain name hashed into the chain id")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "named signer hash32 hex")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "destination", po::value<std::string>(), "L2 destination address")(
      "amount", po::value<std::string>(), "decimal amount")(
      "withdrawal-nonce", po::value<std::string>(), "withdrawal nonce")(
      "signer-key", po::value<std::string>(), "withdrawal signing key hex")(
      "external-tx-ref", po::value<std::string>()->default_value(""),
      "L2 claim transaction reference")(
      "index", po::value<uint64_t>()->default_value(0), "deposit index")(
      "external-height", po::value<uint64_t>(), "pinned L2 block height")(
      "record-id", po::value<std::string>(), "processed record id")(
      "owner", po::value<std::string>(), "withdrawal owner account")(
      "account", po::value<std::string>(), "bank account")(
      "contract", po::value<std::string>(), "L2 bridge contract address");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto transaction = portage::schema::transaction_t{
        .version = 1,
        .chain_id = resolve_chain_id(vm),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = portage::schema::signer_id_t{get_hash32(vm, "signer")},
        .payload = build_payload(vm),
        .signature = make_signature(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << portage::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-data") {
    auto data = build_query_data(vm);
    std::cout << portage::schema::to_base64(data) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = resolve_chain_id(vm);
    std::cout << portage::schema::to_hex(chain_id) << '\n';
    return 0;
  }

  if (command == "record-id") {
    std::cout << portage::bridge::make_record_id(require_string(vm, "contract"),
                                                 vm["index"].as<uint64_t>())
              << '\n';
    return 0;
  }

  if (command == "recover-signer") {
    return recover_withdrawal_signer(vm);
  }

  portage::common::critical(
      "command must be transaction|query-data|chain-id|record-id|"
      "recover-signer");
}
