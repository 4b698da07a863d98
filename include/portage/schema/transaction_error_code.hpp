#pragma once

#include <cstdint>

namespace portage::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  insufficient_funds = 10,
  invalid_destination = 11,
  invalid_amount = 12,
  withdrawal_missing = 13,
  invalid_signer_key = 14,
  withdrawal_completed = 15,
  withdrawal_not_signed = 16,
  invalid_nonce_format = 17,
  deposit_already_processed = 18,
  deposit_not_found = 19,
  external_chain_unavailable = 20,
  bridge_disabled = 21,
};

}  // namespace portage::schema
