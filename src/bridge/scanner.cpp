#include <portage/bridge/scanner.hpp>

#include <spdlog/spdlog.h>

namespace portage::bridge {

scan_report scan_deposits(
    const params& params,
    chain_reader& reader,
    deposit_settlement& settlement,
    uint64_t block_time,
    std::vector<portage::schema::transaction_event_t>& events) {
  auto report = scan_report{};
  auto last_check = settlement.last_check_time();
  if (block_time < last_check ||
      block_time - last_check < params.check_interval) {
    return report;
  }

  report.external_height = derive_external_height(params, block_time);
  auto current = reader.current_height();
  if (!current) {
    spdlog::warn("Deposit scan deferred: external chain height unavailable");
    return report;
  }
  if (*current < report.external_height) {
    spdlog::warn(
        "Deposit scan deferred: external chain at {} behind derived height {}",
        *current, report.external_height);
    return report;
  }
  auto highest = reader.highest_index(report.external_height);
  if (!highest) {
    spdlog::warn("Deposit scan deferred: highest deposit index unavailable");
    return report;
  }

  report.ran = true;
  settlement.set_last_check_time(block_time);

  auto missing = std::vector<uint64_t>{};
  for (auto index = uint64_t{0}; missing.size() < params.max_batch; ++index) {
    if (!settlement.is_processed(index)) {
      missing.push_back(index);
    }
    if (index == *highest) {
      break;
    }
  }
  if (missing.empty()) {
    spdlog::info("Deposit scan: all deposits up to {} processed", *highest);
    return report;
  }

  for (auto index : missing) {
    ++report.scanned;
    auto fetched = reader.fetch_deposit(index, report.external_height);
    if (fetched.status == fetch_status::not_found) {
      continue;
    }
    if (fetched.status == fetch_status::unavailable || !fetched.record) {
      spdlog::warn("Deposit scan stopped at {}: {}", index, fetched.error);
      break;
    }
    auto outcome =
        settlement.settle(*fetched.record, report.external_height, events);
    if (outcome.status == settle_status::credited) {
      ++report.credited;
    } else if (outcome.status == settle_status::skipped) {
      ++report.skipped;
    }
  }

  spdlog::info(
      "Deposit scan at external height {}: {} examined, {} credited, {} "
      "skipped",
      report.external_height, report.scanned, report.credited, report.skipped);
  return report;
}

}  // namespace portage::bridge
