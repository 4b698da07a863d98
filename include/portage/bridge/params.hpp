#pragma once

#include <portage/crypto/eth_signer.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace portage::bridge {

inline constexpr auto kDefaultContract =
    std::string_view{"0xcc391c8f1aFd6DB5D8b0e064BA81b1383b14FE5B"};

/// Bridge timing and batching parameters. Every validator must run with the
/// same values: they feed the external height and the batch boundaries,
/// both of which are consensus-visible.
struct params final {
  std::string contract{kDefaultContract};
  uint64_t l2_genesis_time{1686789347};
  uint64_t l2_block_interval{2};
  uint64_t finality_margin{64};
  uint64_t check_interval{600};
  uint64_t max_batch{10};
  uint64_t per_block_cap{5};
  /// Validator withdrawal key; block-end auto-signing is off without one.
  std::optional<portage::crypto::secret_key_t> signer_key;
};

/// External height treated as final at block_time:
/// max(1, floor((block_time - genesis) / interval) - finality_margin).
uint64_t derive_external_height(const params& params, uint64_t block_time);

}  // namespace portage::bridge
