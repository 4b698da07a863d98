#pragma once

#include <portage/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: initiate withdrawal.
// Bridge workflow: burn the signer's balance and open a withdrawal request
// payable to an L2 address.
namespace portage::schema {

template <uint16_t Version>
struct initiate_withdrawal;

template <>
struct initiate_withdrawal<1> final {
  uint16_t version{1};
  std::string destination;
  amount_t amount{};
};

using initiate_withdrawal_t = initiate_withdrawal<1>;

}  // namespace portage::schema
