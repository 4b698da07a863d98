#pragma once

#include <cstdint>
#include <string>

// Schema type: sign withdrawal.
namespace portage::schema {

template <uint16_t Version>
struct sign_withdrawal;

template <>
struct sign_withdrawal<1> final {
  uint16_t version{1};
  std::string nonce;
  std::string signer_key;
};

using sign_withdrawal_t = sign_withdrawal<1>;

}  // namespace portage::schema
