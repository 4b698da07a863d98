#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <portage/crypto/eth_signer.hpp>
#include <portage/crypto/verify.hpp>
#include <portage/testing/secp256k1_signer.hpp>

#include <array>
#include <memory>
#include <vector>

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_ed25519_key() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (ctx && EVP_PKEY_keygen_init(ctx.get()) == 1) {
    EVP_PKEY_keygen(ctx.get(), &raw);
  }
  return evp_pkey_ptr{raw, EVP_PKEY_free};
}

portage::testing::secp256k1_envelope_signer make_secp_signer() {
  auto secret = portage::crypto::parse_secret_key(
      "4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318");
  return portage::testing::secp256k1_envelope_signer{secret.value()};
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!portage::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto pkey = make_ed25519_key();
  ASSERT_TRUE(pkey);

  auto public_key = std::array<uint8_t, 32>{};
  auto public_key_size = public_key.size();
  ASSERT_EQ(EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(),
                                        &public_key_size),
            1);

  auto message = std::vector<uint8_t>{'p', 'o', 'r', 't', 'a', 'g', 'e'};
  auto signature = portage::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  auto sign_ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  ASSERT_TRUE(sign_ctx);
  ASSERT_EQ(EVP_DigestSignInit(sign_ctx.get(), nullptr, nullptr, nullptr,
                               pkey.get()),
            1);
  ASSERT_EQ(EVP_DigestSign(sign_ctx.get(), signature.data(), &signature_size,
                           message.data(), message.size()),
            1);

  auto signer = portage::schema::signer_id_t{
      portage::schema::ed25519_signer_id{.public_key = public_key}};
  EXPECT_TRUE(portage::crypto::verify_signature(
      portage::schema::bytes_view_t{message.data(), message.size()}, signer,
      portage::schema::signature_t{signature}));

  message[0] ^= 0x01;
  EXPECT_FALSE(portage::crypto::verify_signature(
      portage::schema::bytes_view_t{message.data(), message.size()}, signer,
      portage::schema::signature_t{signature}));
}

TEST(crypto_verify, verifies_secp256k1_with_raw_or_offset_recovery_byte) {
  if (!portage::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto secp = make_secp_signer();
  auto signer = secp.signer();
  ASSERT_TRUE(signer.has_value());

  auto message = std::vector<uint8_t>{'s', 'e', 'c', 'p', '-', 'm', 's', 'g'};
  auto view = portage::schema::bytes_view_t{message.data(), message.size()};
  auto trailing = secp.sign(view);
  ASSERT_TRUE(trailing.has_value());
  EXPECT_TRUE(portage::crypto::verify_signature(
      view, portage::schema::signer_id_t{*signer},
      portage::schema::signature_t{*trailing}));

  auto offset = *trailing;
  offset[64] = 27;
  EXPECT_TRUE(portage::crypto::verify_signature(
      view, portage::schema::signer_id_t{*signer},
      portage::schema::signature_t{offset}));

  message[0] ^= 0x01;
  EXPECT_FALSE(portage::crypto::verify_signature(
      portage::schema::bytes_view_t{message.data(), message.size()},
      portage::schema::signer_id_t{*signer},
      portage::schema::signature_t{*trailing}));
}

TEST(crypto_verify, rejects_mismatched_signer_and_signature_variants) {
  auto ed_signer = portage::schema::ed25519_signer_id{};
  ed_signer.public_key[0] = 1;
  auto secp_signature = portage::schema::secp256k1_signature_t{};

  EXPECT_FALSE(portage::crypto::verify_signature(
      portage::schema::bytes_view_t{},
      portage::schema::signer_id_t{ed_signer},
      portage::schema::signature_t{secp_signature}));
}

TEST(crypto_verify, rejects_named_signer_signatures) {
  auto named = portage::schema::named_signer_t{};
  named[0] = 0x42;
  auto message = std::array<uint8_t, 3>{'a', 'b', 'c'};
  EXPECT_FALSE(portage::crypto::verify_signature(
      portage::schema::bytes_view_t{message.data(), message.size()},
      portage::schema::signer_id_t{named},
      portage::schema::signature_t{portage::schema::ed25519_signature_t{}}));
}

TEST(crypto_verify, rejects_secp256k1_without_recovery_byte) {
  if (!portage::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto secp = make_secp_signer();
  auto signer = secp.signer();
  ASSERT_TRUE(signer.has_value());
  auto message = std::vector<uint8_t>{'m'};
  auto view = portage::schema::bytes_view_t{message.data(), message.size()};
  auto signature = secp.sign(view);
  ASSERT_TRUE(signature.has_value());
  (*signature)[0] = 7;
  (*signature)[64] = 7;
  EXPECT_FALSE(portage::crypto::verify_signature(
      view, portage::schema::signer_id_t{*signer},
      portage::schema::signature_t{*signature}));
}
