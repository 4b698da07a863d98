#include <portage/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace portage::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool has_key_type(EVP_PKEY_CTX* raw) {
  auto ctx = evp_pkey_ctx_ptr{raw, EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* md,
                   const portage::schema::bytes_view_t& signature,
                   const portage::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

bool verify_ed25519(const portage::schema::bytes_view_t& message,
                    const portage::schema::ed25519_signer_id& signer,
                    const portage::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), nullptr, signature, message);
}

// Recovery ids are either raw (0..3) or offset by 27; the side carrying the
// id is detected and the compact r || s returned.
std::optional<std::array<uint8_t, 64>> compact_secp256k1_signature(
    const portage::schema::secp256k1_signature_t& signature) {
  auto is_recovery_id = [](const uint8_t value) {
    return value <= 3 || value >= 27;
  };
  auto out = std::array<uint8_t, 64>{};
  if (is_recovery_id(signature[64])) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  if (is_recovery_id(signature[0])) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> to_der(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG owns r and s from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

std::optional<evp_pkey_ptr> make_secp256k1_public_key(
    const portage::schema::secp256k1_signer_id& signer) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return std::nullopt;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return std::nullopt;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

bool verify_secp256k1(const portage::schema::bytes_view_t& message,
                      const portage::schema::secp256k1_signer_id& signer,
                      const portage::schema::secp256k1_signature_t& signature) {
  auto compact = compact_secp256k1_signature(signature);
  if (!compact) {
    return false;
  }
  auto der = to_der(*compact);
  if (!der) {
    return false;
  }
  auto pkey = make_secp256k1_public_key(signer);
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey->get(), EVP_sha256(),
                       portage::schema::bytes_view_t{der->data(), der->size()},
                       message);
}

}  // namespace

bool available() {
  static const auto available_now =
      has_key_type(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr)) &&
      has_key_type(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
  return available_now;
}

bool verify_signature(const portage::schema::bytes_view_t& message,
                      const portage::schema::signer_id_t& signer,
                      const portage::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const portage::schema::ed25519_signer_id& value) {
            const auto* ed25519 =
                std::get_if<portage::schema::ed25519_signature_t>(&signature);
            return ed25519 != nullptr &&
                   verify_ed25519(message, value, *ed25519);
          },
          [&](const portage::schema::secp256k1_signer_id& value) {
            const auto* secp256k1 =
                std::get_if<portage::schema::secp256k1_signature_t>(
                    &signature);
            return secp256k1 != nullptr &&
                   verify_secp256k1(message, value, *secp256k1);
          },
          // Named signers have no key material to check against.
          [](const portage::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace portage::crypto
