#pragma once

#include <portage/bridge/chain_reader.hpp>
#include <portage/bridge/deposit_settlement.hpp>
#include <portage/bridge/params.hpp>
#include <portage/schema/transaction_event.hpp>
#include <cstdint>
#include <vector>

namespace portage::bridge {

struct scan_report final {
  bool ran{};
  uint64_t external_height{};
  uint64_t scanned{};
  uint64_t credited{};
  uint64_t skipped{};
};

/// Rate-limited gap scan over indices [0, highest], settling at most
/// `max_batch` unprocessed records per run. Never moves the cursor.
scan_report scan_deposits(
    const params& params,
    chain_reader& reader,
    deposit_settlement& settlement,
    uint64_t block_time,
    std::vector<portage::schema::transaction_event_t>& events);

}  // namespace portage::bridge
