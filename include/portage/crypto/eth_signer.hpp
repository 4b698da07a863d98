#pragma once

#include <portage/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

// secp256k1 signing in the form EVM contracts verify with `ecrecover`.
namespace portage::crypto {

using secret_key_t = portage::schema::hash32_t;

/// Accepts an optional `0x` prefix followed by exactly 64 hex characters
/// that form a valid secp256k1 secret.
std::optional<secret_key_t> parse_secret_key(std::string_view hex);

std::optional<portage::schema::eth_address_t> address_of(
    const secret_key_t& secret);

/// EIP-55 mixed-case `0x` form of an address.
std::string to_checksum_address(const portage::schema::eth_address_t& address);

/// keccak256("\x19Ethereum Signed Message:\n32" || message_hash).
portage::schema::hash32_t personal_message_digest(
    const portage::schema::hash32_t& message_hash);

/// Deterministic (RFC 6979) recoverable signature laid out r || s || v with
/// v in {27, 28}.
std::optional<portage::schema::secp256k1_signature_t> sign_digest(
    const portage::schema::hash32_t& digest,
    const secret_key_t& secret);

/// Accepts v as a raw recovery id (0..3) or in the 27+ form.
std::optional<portage::schema::eth_address_t> recover_address(
    const portage::schema::hash32_t& digest,
    const portage::schema::secp256k1_signature_t& signature);

}  // namespace portage::crypto
