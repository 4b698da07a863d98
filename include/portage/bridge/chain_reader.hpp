#pragma once

#include <portage/schema/deposit_record.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace portage::bridge {

enum class fetch_status : uint8_t { found, not_found, unavailable };

struct fetch_result final {
  fetch_status status{fetch_status::unavailable};
  std::optional<portage::schema::deposit_record_t> record;
  std::string error;
};

/// Read-only view of the L2 bridge contract.
///
/// Implementations never throw; transport and decoding failures surface as
/// `unavailable` or std::nullopt so callers can retry on a later block.
class chain_reader {
 public:
  virtual ~chain_reader() = default;

  /// Deposit `index` as of `external_height` (latest when absent).
  virtual fetch_result fetch_deposit(
      uint64_t index,
      std::optional<uint64_t> external_height) = 0;

  /// Current L2 block number.
  virtual std::optional<uint64_t> current_height() = 0;

  /// Highest deposit index the contract has assigned.
  virtual std::optional<uint64_t> highest_index(
      std::optional<uint64_t> external_height) = 0;
};

}  // namespace portage::bridge
