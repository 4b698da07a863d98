#pragma once

#include <portage/bank/ledger.hpp>
#include <portage/schema/deposit_record.hpp>
#include <portage/schema/encoding/scale/encoder.hpp>
#include <portage/schema/processed_deposit.hpp>
#include <portage/schema/sync_cursor.hpp>
#include <portage/schema/transaction_event.hpp>
#include <portage/state/store.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portage::bridge {

inline constexpr auto kInvalidRecipientReason =
    std::string_view{"invalid recipient address"};
inline constexpr auto kZeroAmountReason = std::string_view{"zero amount"};
inline constexpr auto kBalanceOverflowReason =
    std::string_view{"balance overflow"};

/// "0x" + hex(sha256(contract + "-" + decimal(index))).
std::string make_record_id(std::string_view contract, uint64_t index);

enum class settle_status : uint8_t { credited, skipped, already_processed };

struct settle_outcome final {
  settle_status status{settle_status::already_processed};
  std::string record_id;
  /// Normalized account when credited, the raw account otherwise.
  std::string recipient;
  std::string reason;
};

/// Processed-record set, per-index view, ingestion cursor and scanner clock,
/// plus the credit-or-skip step every settling path goes through.
class deposit_settlement final {
 public:
  deposit_settlement(portage::schema::encoding::scale_encoder_t& encoder,
                     portage::state::store& store,
                     portage::bank::ledger& bank,
                     std::string contract);

  const std::string& contract() const;

  std::optional<portage::schema::processed_deposit_t> processed(
      const std::string& record_id) const;
  bool is_processed(uint64_t index) const;
  std::optional<uint64_t> processed_height(uint64_t index) const;

  portage::schema::sync_cursor_t cursor() const;
  void set_cursor(const portage::schema::sync_cursor_t& cursor);

  uint64_t last_check_time() const;
  void set_last_check_time(uint64_t block_time);

  /// Credit or deterministically skip `record`. Settling a record that is
  /// already in the processed set changes nothing except backfilling its
  /// index entry.
  settle_outcome settle(
      const portage::schema::deposit_record_t& record,
      uint64_t external_height,
      std::vector<portage::schema::transaction_event_t>& events);

 private:
  void mark_processed(const std::string& record_id,
                      const portage::schema::processed_deposit_t& entry);

  portage::schema::encoding::scale_encoder_t& encoder_;
  portage::state::store& store_;
  portage::bank::ledger& bank_;
  std::string contract_;
};

}  // namespace portage::bridge
