#pragma once

#include <portage/schema/primitives.hpp>

namespace portage::crypto {

/// True when the OpenSSL providers for ed25519 and secp256k1 are loaded.
bool available();

/// Verify a transaction envelope signature. ed25519 signs the message
/// directly; secp256k1 signs sha256(message) and may carry its recovery byte
/// at either end of the 65-byte signature.
bool verify_signature(const portage::schema::bytes_view_t& message,
                      const portage::schema::signer_id_t& signer,
                      const portage::schema::signature_t& signature);

}  // namespace portage::crypto
