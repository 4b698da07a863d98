#pragma once

#include <portage/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: deposit record.
// Bridge workflow: one entry of the L2 bridge contract's deposit ledger, read
// at a fixed external height. Immutable once observed.
namespace portage::schema {

template <uint16_t Version>
struct deposit_record;

template <>
struct deposit_record<1> final {
  uint16_t version{1};
  uint64_t index{};
  std::string account;
  amount_t amount{};
  uint64_t external_height{};
};

using deposit_record_t = deposit_record<1>;

}  // namespace portage::schema
