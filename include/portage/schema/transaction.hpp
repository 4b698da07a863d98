#pragma once
#include <portage/schema/complete_withdrawal.hpp>
#include <portage/schema/initiate_withdrawal.hpp>
#include <portage/schema/primitives.hpp>
#include <portage/schema/process_deposit.hpp>
#include <portage/schema/sign_withdrawal.hpp>
#include <variant>

namespace portage::schema {

using transaction_payload_t = std::variant<initiate_withdrawal_t,
                                           sign_withdrawal_t,
                                           process_deposit_t,
                                           complete_withdrawal_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

/// Bytes covered by the envelope signature: the transaction encoded with a
/// default (zeroed ed25519) signature.
template <typename Encoder>
bytes_t make_signing_bytes(Encoder& encoder, const transaction_t& tx) {
  auto unsigned_tx = tx;
  unsigned_tx.signature = signature_t{};
  return encoder.encode(unsigned_tx);
}

}  // namespace portage::schema
