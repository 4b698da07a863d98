#pragma once

#include <portage/schema/primitives.hpp>
#include <portage/schema/transaction_event.hpp>
#include <portage/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// FinalizeBlock output: per-transaction results, block-level events from the
// bridge hooks, and the candidate app hash.
namespace portage::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  std::vector<transaction_event_t> events;
  hash32_t app_hash;
};

using block_result_t = block_result<1>;

}  // namespace portage::schema
