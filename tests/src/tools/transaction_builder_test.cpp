#include <gtest/gtest.h>
#include <portage/blake3/hash.hpp>
#include <portage/bridge/withdrawals.hpp>
#include <portage/crypto/eth_signer.hpp>
#include <portage/schema/encoding/scale/encoder.hpp>
#include <portage/schema/primitives.hpp>
#include <portage/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef PORTAGE_TRANSACTION_BUILDER_PATH
#define PORTAGE_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = portage::schema::encoding::scale_encoder_t;

constexpr auto kSigner =
    "cdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcdcd";
constexpr auto kNonce =
    "0x0000000000000000000000000000000000000000000000000000000000000001";
constexpr auto kDestination = "0x1111111111111111111111111111111111111111";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

portage::schema::transaction_t decode_transaction(const std::string& base64) {
  auto bytes = portage::schema::from_base64(base64);
  auto encoder = encoder_t{};
  return encoder.decode<portage::schema::transaction_t>(
      portage::schema::make_bytes_view(bytes));
}

}  // namespace

TEST(transaction_builder, prints_chain_and_record_ids) {
  auto builder = std::string{PORTAGE_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto default_chain = portage::blake3::hash(
      std::string_view{"portage-bridge-chain"});
  EXPECT_EQ(run_builder(builder, "chain-id"),
            portage::schema::to_hex(default_chain));

  auto named_chain = portage::blake3::hash(std::string_view{"devnet"});
  EXPECT_EQ(run_builder(builder, "chain-id --chain-name devnet"),
            portage::schema::to_hex(named_chain));

  EXPECT_EQ(
      run_builder(builder,
                  "record-id --contract "
                  "0xcc391c8f1aFd6DB5D8b0e064BA81b1383b14FE5B --index 5"),
      "0xe94028dcf92adbbd75dfe155c3507883a2dda938f3617d3caa4d9507d2e417c1");
}

TEST(transaction_builder, builds_bridge_transactions) {
  auto builder = std::string{PORTAGE_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto initiate = decode_transaction(run_builder(
      builder, "transaction --payload initiate_withdrawal --nonce 3 --signer " +
                   std::string{kSigner} + " --destination " +
                   std::string{kDestination} +
                   " --amount 115792089237316195423570985008687907853269984665640564039457584007913129639935"));
  EXPECT_EQ(initiate.version, 1);
  EXPECT_EQ(initiate.nonce, 3u);
  EXPECT_EQ(initiate.chain_id,
            portage::blake3::hash(std::string_view{"portage-bridge-chain"}));
  ASSERT_TRUE(std::holds_alternative<portage::schema::named_signer_t>(
      initiate.signer));
  EXPECT_EQ(std::get<portage::schema::named_signer_t>(initiate.signer),
            portage::schema::make_hash32(std::string_view{kSigner}));
  ASSERT_TRUE(std::holds_alternative<portage::schema::initiate_withdrawal_t>(
      initiate.payload));
  auto& withdrawal =
      std::get<portage::schema::initiate_withdrawal_t>(initiate.payload);
  EXPECT_EQ(withdrawal.destination, kDestination);
  EXPECT_EQ(portage::schema::to_string(withdrawal.amount),
            "115792089237316195423570985008687907853269984665640564039457584007913129639935");
  EXPECT_TRUE(std::holds_alternative<portage::schema::ed25519_signature_t>(
      initiate.signature));

  auto deposit = decode_transaction(run_builder(
      builder, "transaction --payload process_deposit --signer " +
                   std::string{kSigner} +
                   " --index 9 --external-height 400 --chain-name devnet"));
  EXPECT_EQ(deposit.chain_id,
            portage::blake3::hash(std::string_view{"devnet"}));
  ASSERT_TRUE(
      std::holds_alternative<portage::schema::process_deposit_t>(deposit.payload));
  auto& process = std::get<portage::schema::process_deposit_t>(deposit.payload);
  EXPECT_EQ(process.index, 9u);
  EXPECT_EQ(process.external_height.value_or(0), 400u);

  auto complete = decode_transaction(run_builder(
      builder, "transaction --payload complete_withdrawal --signer " +
                   std::string{kSigner} + " --withdrawal-nonce " +
                   std::string{kNonce} +
                   " --external-tx-ref 0xfeed --signature-kind secp256k1"));
  ASSERT_TRUE(std::holds_alternative<portage::schema::complete_withdrawal_t>(
      complete.payload));
  EXPECT_EQ(
      std::get<portage::schema::complete_withdrawal_t>(complete.payload)
          .external_tx_ref,
      "0xfeed");
  EXPECT_TRUE(std::holds_alternative<portage::schema::secp256k1_signature_t>(
      complete.signature));
}

TEST(transaction_builder, encodes_query_data) {
  auto builder = std::string{PORTAGE_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto encoder = encoder_t{};
  EXPECT_EQ(run_builder(builder, "query-data --path /withdrawal/get "
                                 "--withdrawal-nonce " +
                                     std::string{kNonce}),
            portage::schema::to_base64(encoder.encode(std::string{kNonce})));
  EXPECT_EQ(run_builder(builder, "query-data --path /bridge/processed_index "
                                 "--index 12"),
            portage::schema::to_base64(encoder.encode(uint64_t{12})));
  EXPECT_EQ(
      run_builder(builder, "query-data --path /withdrawal/list --owner abc"),
      portage::schema::to_base64(
          encoder.encode(std::optional<std::string>{"abc"})));
  EXPECT_TRUE(run_builder(builder, "query-data --path /engine/info").empty());
}

TEST(transaction_builder, recovers_withdrawal_signer) {
  auto builder = std::string{PORTAGE_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto request = portage::schema::withdrawal_request_t{};
  request.nonce = kNonce;
  request.destination = kDestination;
  request.amount = 500'000;
  auto digest = portage::bridge::withdrawal_digest(request);
  ASSERT_TRUE(digest.has_value());
  auto secret = portage::crypto::parse_secret_key(
      "0x0000000000000000000000000000000000000000000000000000000000000001");
  ASSERT_TRUE(secret.has_value());
  auto signature = portage::crypto::sign_digest(*digest, *secret);
  ASSERT_TRUE(signature.has_value());

  auto recovered = run_builder(
      builder, "recover-signer --withdrawal-nonce " + std::string{kNonce} +
                   " --destination " + std::string{kDestination} +
                   " --amount 500000 --signature-hex " +
                   portage::schema::to_hex(portage::schema::bytes_view_t{
                       signature->data(), signature->size()}));
  EXPECT_EQ(recovered, "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
}
