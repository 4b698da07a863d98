#include <portage/bridge/ingestion.hpp>

#include <spdlog/spdlog.h>

namespace portage::bridge {

ingestion_report ingest_deposits(
    const params& params,
    chain_reader& reader,
    deposit_settlement& settlement,
    uint64_t block_time,
    std::vector<portage::schema::transaction_event_t>& events) {
  auto report = ingestion_report{};
  report.external_height = derive_external_height(params, block_time);

  for (auto attempt = uint64_t{0}; attempt < params.per_block_cap; ++attempt) {
    auto cursor = settlement.cursor();
    auto index = cursor.last_processed_index + 1;

    auto fetched = reader.fetch_deposit(index, report.external_height);
    if (fetched.status == fetch_status::not_found) {
      spdlog::debug("No deposit {} at external height {}", index,
                    report.external_height);
      break;
    }
    if (fetched.status == fetch_status::unavailable || !fetched.record) {
      spdlog::warn("Deposit {} unavailable at external height {}: {}", index,
                   report.external_height, fetched.error);
      break;
    }

    if (settlement.is_processed(index)) {
      spdlog::warn("Deposit {} already processed, advancing cursor", index);
      cursor.last_processed_index = index;
      settlement.set_cursor(cursor);
      break;
    }

    auto outcome =
        settlement.settle(*fetched.record, report.external_height, events);
    if (outcome.status == settle_status::credited) {
      ++report.credited;
    } else if (outcome.status == settle_status::skipped) {
      ++report.skipped;
    }
    cursor.last_processed_index = index;
    cursor.last_external_height = report.external_height;
    settlement.set_cursor(cursor);
  }

  if (report.credited + report.skipped > 0) {
    spdlog::info(
        "Ingested deposits at external height {}: {} credited, {} skipped",
        report.external_height, report.credited, report.skipped);
  }
  return report;
}

}  // namespace portage::bridge
