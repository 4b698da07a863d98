#include <portage/bridge/deposit_settlement.hpp>
#include <portage/crypto/digest.hpp>
#include <portage/schema/address.hpp>
#include <portage/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>
#include <utility>

using namespace portage::schema;

namespace portage::bridge {

std::string make_record_id(std::string_view contract, uint64_t index) {
  auto material = std::string{contract};
  material += '-';
  material += std::to_string(index);
  auto digest = portage::crypto::sha256(std::string_view{material});
  return "0x" + to_hex(bytes_view_t{digest.data(), digest.size()});
}

deposit_settlement::deposit_settlement(
    portage::schema::encoding::scale_encoder_t& encoder,
    portage::state::store& store,
    portage::bank::ledger& bank,
    std::string contract)
    : encoder_{encoder},
      store_{store},
      bank_{bank},
      contract_{std::move(contract)} {}

const std::string& deposit_settlement::contract() const {
  return contract_;
}

std::optional<processed_deposit_t> deposit_settlement::processed(
    const std::string& record_id) const {
  auto key = key::make_processed_key(encoder_, record_id);
  return store_.get<processed_deposit_t>(encoder_, make_bytes_view(key));
}

bool deposit_settlement::is_processed(uint64_t index) const {
  return processed(make_record_id(contract_, index)).has_value();
}

std::optional<uint64_t> deposit_settlement::processed_height(
    uint64_t index) const {
  auto key = key::make_deposit_index_key(encoder_, index);
  return store_.get<uint64_t>(encoder_, make_bytes_view(key));
}

sync_cursor_t deposit_settlement::cursor() const {
  auto key = key::make_sync_cursor_key(encoder_);
  return store_.get<sync_cursor_t>(encoder_, make_bytes_view(key))
      .value_or(sync_cursor_t{});
}

void deposit_settlement::set_cursor(const sync_cursor_t& cursor) {
  auto current = this->cursor();
  if (cursor.last_processed_index < current.last_processed_index) {
    portage::common::critical("sync cursor moved backwards");
  }
  auto key = key::make_sync_cursor_key(encoder_);
  store_.put(encoder_, make_bytes_view(key), cursor);
}

uint64_t deposit_settlement::last_check_time() const {
  auto key = key::make_deposit_check_time_key(encoder_);
  return store_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
}

void deposit_settlement::set_last_check_time(uint64_t block_time) {
  auto key = key::make_deposit_check_time_key(encoder_);
  store_.put(encoder_, make_bytes_view(key), block_time);
}

void deposit_settlement::mark_processed(const std::string& record_id,
                                        const processed_deposit_t& entry) {
  auto processed_key = key::make_processed_key(encoder_, record_id);
  store_.put(encoder_, make_bytes_view(processed_key), entry);
  auto index_key = key::make_deposit_index_key(encoder_, entry.index);
  store_.put(encoder_, make_bytes_view(index_key), entry.external_height);
}

settle_outcome deposit_settlement::settle(
    const deposit_record_t& record,
    uint64_t external_height,
    std::vector<transaction_event_t>& events) {
  auto outcome = settle_outcome{};
  outcome.record_id = make_record_id(contract_, record.index);
  outcome.recipient = record.account;

  if (processed(outcome.record_id)) {
    if (!processed_height(record.index)) {
      auto index_key = key::make_deposit_index_key(encoder_, record.index);
      store_.put(encoder_, make_bytes_view(index_key), external_height);
    }
    spdlog::debug("deposit {} already processed as {}", record.index,
                  outcome.record_id);
    outcome.status = settle_status::already_processed;
    return outcome;
  }

  auto account = normalize_account(record.account);
  if (!account) {
    outcome.reason = kInvalidRecipientReason;
  } else if (record.amount == 0) {
    outcome.reason = kZeroAmountReason;
  } else if (!bank_.credit(*account, record.amount)) {
    outcome.reason = kBalanceOverflowReason;
  }

  auto entry = processed_deposit_t{};
  entry.index = record.index;
  entry.external_height = external_height;

  if (outcome.reason.empty()) {
    outcome.status = settle_status::credited;
    outcome.recipient = *account;
    entry.outcome = deposit_outcome_t::credited;
    mark_processed(outcome.record_id, entry);
    events.push_back(make_event(
        "deposit_synced",
        {{"deposit_index", std::to_string(record.index)},
         {"recipient", outcome.recipient},
         {"amount", to_string(record.amount)},
         {"eth_block_height", std::to_string(external_height)},
         {"record_id", outcome.record_id}}));
    spdlog::info("Credited deposit {} of {} to {} at external height {}",
                 record.index, to_string(record.amount), outcome.recipient,
                 external_height);
    return outcome;
  }

  outcome.status = settle_status::skipped;
  entry.outcome = deposit_outcome_t::skipped;
  entry.reason = outcome.reason;
  mark_processed(outcome.record_id, entry);
  events.push_back(make_event(
      "deposit_skipped",
      {{"deposit_index", std::to_string(record.index)},
       {"recipient", outcome.recipient},
       {"amount", to_string(record.amount)},
       {"reason", outcome.reason},
       {"eth_block_height", std::to_string(external_height)},
       {"record_id", outcome.record_id}}));
  spdlog::warn("Skipped deposit {} for '{}': {}", record.index,
               outcome.recipient, outcome.reason);
  return outcome;
}

}  // namespace portage::bridge
