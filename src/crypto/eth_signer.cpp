#include <portage/crypto/digest.hpp>
#include <portage/crypto/eth_signer.hpp>
#include <portage/common/critical.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <memory>

namespace portage::crypto {

namespace {

constexpr auto kPersonalMessagePrefix =
    std::string_view{"\x19"
                     "Ethereum Signed Message:\n32"};
constexpr auto kRecoveryOffset = uint8_t{27};

using secp256k1_context_ptr =
    std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

const secp256k1_context* context() {
  static const auto ctx = secp256k1_context_ptr{
      secp256k1_context_create(SECP256K1_CONTEXT_SIGN |
                               SECP256K1_CONTEXT_VERIFY),
      secp256k1_context_destroy};
  if (!ctx) {
    portage::common::critical("failed to create secp256k1 context");
  }
  return ctx.get();
}

portage::schema::eth_address_t address_of_public_key(
    const secp256k1_pubkey& public_key) {
  auto serialized = std::array<uint8_t, 65>{};
  auto serialized_size = serialized.size();
  secp256k1_ec_pubkey_serialize(context(), serialized.data(), &serialized_size,
                                &public_key, SECP256K1_EC_UNCOMPRESSED);
  // Drop the 0x04 tag; the address is the low 20 bytes of the hash.
  auto hashed = keccak256(
      portage::schema::bytes_view_t{serialized.data() + 1, serialized_size - 1});
  auto address = portage::schema::eth_address_t{};
  std::copy(std::end(hashed) - address.size(), std::end(hashed),
            std::begin(address));
  return address;
}

}  // namespace

std::optional<secret_key_t> parse_secret_key(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.size() != 64) {
    return std::nullopt;
  }
  auto secret = portage::schema::try_make_hash32(hex);
  if (!secret) {
    return std::nullopt;
  }
  if (secp256k1_ec_seckey_verify(context(), secret->data()) != 1) {
    return std::nullopt;
  }
  return secret;
}

std::string to_checksum_address(
    const portage::schema::eth_address_t& address) {
  auto hex = portage::schema::to_hex(address);
  auto hashed = keccak256(std::string_view{hex});
  for (auto i = size_t{0}; i < hex.size(); ++i) {
    auto nibble = (i % 2 == 0) ? (hashed[i / 2] >> 4) : (hashed[i / 2] & 0x0F);
    if (nibble >= 8) {
      hex[i] = static_cast<char>(
          std::toupper(static_cast<unsigned char>(hex[i])));
    }
  }
  return "0x" + hex;
}

std::optional<portage::schema::eth_address_t> address_of(
    const secret_key_t& secret) {
  auto public_key = secp256k1_pubkey{};
  if (secp256k1_ec_pubkey_create(context(), &public_key, secret.data()) != 1) {
    return std::nullopt;
  }
  return address_of_public_key(public_key);
}

portage::schema::hash32_t personal_message_digest(
    const portage::schema::hash32_t& message_hash) {
  auto material = portage::schema::make_bytes(kPersonalMessagePrefix);
  material.insert(std::end(material), std::begin(message_hash),
                  std::end(message_hash));
  return keccak256(material);
}

std::optional<portage::schema::secp256k1_signature_t> sign_digest(
    const portage::schema::hash32_t& digest,
    const secret_key_t& secret) {
  auto signature = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_sign_recoverable(context(), &signature, digest.data(),
                                       secret.data(),
                                       secp256k1_nonce_function_rfc6979,
                                       nullptr) != 1) {
    return std::nullopt;
  }

  auto out = portage::schema::secp256k1_signature_t{};
  auto recovery_id = int{-1};
  secp256k1_ecdsa_recoverable_signature_serialize_compact(
      context(), out.data(), &recovery_id, &signature);
  if (recovery_id < 0 || recovery_id > 3) {
    return std::nullopt;
  }
  out[64] = static_cast<uint8_t>(recovery_id);
  if (out[64] < kRecoveryOffset) {
    out[64] = static_cast<uint8_t>(out[64] + kRecoveryOffset);
  }
  return out;
}

std::optional<portage::schema::eth_address_t> recover_address(
    const portage::schema::hash32_t& digest,
    const portage::schema::secp256k1_signature_t& signature) {
  auto recovery_id = static_cast<int>(signature[64]);
  if (recovery_id >= kRecoveryOffset) {
    recovery_id -= kRecoveryOffset;
  }
  if (recovery_id < 0 || recovery_id > 3) {
    return std::nullopt;
  }

  auto parsed = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(
          context(), &parsed, signature.data(), recovery_id) != 1) {
    return std::nullopt;
  }
  auto public_key = secp256k1_pubkey{};
  if (secp256k1_ecdsa_recover(context(), &public_key, &parsed,
                              digest.data()) != 1) {
    return std::nullopt;
  }
  return address_of_public_key(public_key);
}

}  // namespace portage::crypto
