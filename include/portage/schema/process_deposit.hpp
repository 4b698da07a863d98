#pragma once

#include <cstdint>
#include <optional>

// Schema type: process deposit.
// Bridge workflow: operator-pushed settlement of one deposit index, optionally
// pinned to an explicit external height.
namespace portage::schema {

template <uint16_t Version>
struct process_deposit;

template <>
struct process_deposit<1> final {
  uint16_t version{1};
  uint64_t index{};
  std::optional<uint64_t> external_height;
};

using process_deposit_t = process_deposit<1>;

}  // namespace portage::schema
