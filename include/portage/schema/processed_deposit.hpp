#pragma once

#include <portage/schema/deposit_outcome.hpp>
#include <cstdint>
#include <string>

// Schema type: processed deposit.
// Bridge workflow: membership entry of the processed-record set, keyed by
// record id. Written once; its presence alone means "handled".
namespace portage::schema {

template <uint16_t Version>
struct processed_deposit;

template <>
struct processed_deposit<1> final {
  uint16_t version{1};
  uint64_t index{};
  uint64_t external_height{};
  deposit_outcome_t outcome{deposit_outcome_t::credited};
  std::string reason;
};

using processed_deposit_t = processed_deposit<1>;

}  // namespace portage::schema
