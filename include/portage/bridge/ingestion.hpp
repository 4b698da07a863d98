#pragma once

#include <portage/bridge/chain_reader.hpp>
#include <portage/bridge/deposit_settlement.hpp>
#include <portage/bridge/params.hpp>
#include <portage/schema/transaction_event.hpp>
#include <cstdint>
#include <vector>

namespace portage::bridge {

struct ingestion_report final {
  uint64_t external_height{};
  uint64_t credited{};
  uint64_t skipped{};
};

/// Sequential block-end ingestion: settles up to `per_block_cap` records
/// following the cursor, as of the external height derived from block_time.
/// Stops at the first record the L2 does not have (or cannot serve).
ingestion_report ingest_deposits(
    const params& params,
    chain_reader& reader,
    deposit_settlement& settlement,
    uint64_t block_time,
    std::vector<portage::schema::transaction_event_t>& events);

}  // namespace portage::bridge
