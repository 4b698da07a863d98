#pragma once

#include <portage/execution/engine.hpp>
#include <portage/schema/encoding/scale/encoder.hpp>
#include <portage/schema/transaction.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <tuple>
#include <vector>

namespace portage::testing {

using scale_encoder_t = portage::schema::encoding::scale_encoder_t;

inline portage::schema::transaction_t make_transaction(
    const portage::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const portage::schema::signer_id_t& signer,
    const portage::schema::transaction_payload_t& payload) {
  return portage::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = portage::schema::ed25519_signature_t{}};
}

inline portage::schema::bytes_t encode_transaction(
    const portage::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline portage::schema::hash32_t chain_id_from_engine(
    portage::execution::engine& engine) {
  auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = scale_encoder_t{};
  auto decoded = encoder.decode<
      std::tuple<int64_t, portage::schema::hash32_t, portage::schema::hash32_t>>(
      portage::schema::bytes_view_t{query.value.data(), query.value.size()});
  return std::get<2>(decoded);
}

/// FinalizeBlock followed by Commit.
inline portage::schema::block_result_t finalize_and_commit(
    portage::execution::engine& engine,
    const uint64_t height,
    const uint64_t block_time,
    const std::vector<portage::schema::transaction_t>& txs) {
  auto raw = std::vector<portage::schema::bytes_t>{};
  raw.reserve(txs.size());
  for (const auto& tx : txs) {
    raw.push_back(encode_transaction(tx));
  }
  auto result = engine.finalize_block(height, block_time, raw);
  engine.commit();
  return result;
}

template <typename T>
T query_value(portage::execution::engine& engine,
              const std::string_view path,
              const portage::schema::bytes_t& data = {}) {
  auto query = engine.query(
      path, portage::schema::bytes_view_t{data.data(), data.size()});
  EXPECT_EQ(query.code, 0u) << query.log;
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(
      portage::schema::bytes_view_t{query.value.data(), query.value.size()});
}

}  // namespace portage::testing
