#pragma once

#include <cstdint>
#include <string>

// Schema type: complete withdrawal.
// Bridge workflow: bookkeeping once the L2 claim has been observed.
namespace portage::schema {

template <uint16_t Version>
struct complete_withdrawal;

template <>
struct complete_withdrawal<1> final {
  uint16_t version{1};
  std::string nonce;
  std::string external_tx_ref;
};

using complete_withdrawal_t = complete_withdrawal<1>;

}  // namespace portage::schema
