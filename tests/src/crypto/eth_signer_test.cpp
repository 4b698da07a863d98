#include <gtest/gtest.h>
#include <portage/crypto/digest.hpp>
#include <portage/crypto/eth_signer.hpp>
#include <portage/schema/address.hpp>

#include <string>
#include <string_view>

namespace {

constexpr auto kSecretOne = std::string_view{
    "0000000000000000000000000000000000000000000000000000000000000001"};

}  // namespace

TEST(crypto_eth_signer, parses_secret_keys) {
  EXPECT_TRUE(portage::crypto::parse_secret_key(kSecretOne).has_value());
  auto prefixed = std::string{"0x"} + std::string{kSecretOne};
  EXPECT_TRUE(portage::crypto::parse_secret_key(prefixed).has_value());

  EXPECT_FALSE(portage::crypto::parse_secret_key("").has_value());
  EXPECT_FALSE(portage::crypto::parse_secret_key("0x1234").has_value());
  EXPECT_FALSE(
      portage::crypto::parse_secret_key(
          "0000000000000000000000000000000000000000000000000000000000000000")
          .has_value());
  // Curve order n is not a valid secret.
  EXPECT_FALSE(
      portage::crypto::parse_secret_key(
          "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")
          .has_value());
  EXPECT_FALSE(
      portage::crypto::parse_secret_key(
          "zz00000000000000000000000000000000000000000000000000000000000001")
          .has_value());
}

TEST(crypto_eth_signer, derives_known_address) {
  auto secret = portage::crypto::parse_secret_key(kSecretOne);
  ASSERT_TRUE(secret.has_value());
  auto address = portage::crypto::address_of(*secret);
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(portage::schema::to_eth_address_string(*address),
            "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
}

TEST(crypto_eth_signer, signatures_are_deterministic_and_recoverable) {
  auto secret = portage::crypto::parse_secret_key(
      "4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318");
  ASSERT_TRUE(secret.has_value());
  auto address = portage::crypto::address_of(*secret);
  ASSERT_TRUE(address.has_value());

  auto digest = portage::crypto::personal_message_digest(
      portage::crypto::keccak256(std::string_view{"withdrawal"}));
  auto first = portage::crypto::sign_digest(digest, *secret);
  auto second = portage::crypto::sign_digest(digest, *secret);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, *second);
  EXPECT_TRUE((*first)[64] == 27 || (*first)[64] == 28);

  auto recovered = portage::crypto::recover_address(digest, *first);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, *address);

  auto raw_v = *first;
  raw_v[64] = static_cast<uint8_t>(raw_v[64] - 27);
  auto recovered_raw = portage::crypto::recover_address(digest, raw_v);
  ASSERT_TRUE(recovered_raw.has_value());
  EXPECT_EQ(*recovered_raw, *address);

  auto other_digest = portage::crypto::personal_message_digest(
      portage::crypto::keccak256(std::string_view{"other"}));
  auto other = portage::crypto::recover_address(other_digest, *first);
  if (other.has_value()) {
    EXPECT_NE(*other, *address);
  }
}

TEST(crypto_eth_signer, rejects_malformed_recovery_id) {
  auto secret = portage::crypto::parse_secret_key(kSecretOne);
  ASSERT_TRUE(secret.has_value());
  auto digest = portage::crypto::keccak256(std::string_view{"x"});
  auto signature = portage::crypto::sign_digest(digest, *secret);
  ASSERT_TRUE(signature.has_value());
  auto broken = *signature;
  broken[64] = 99;
  EXPECT_FALSE(portage::crypto::recover_address(digest, broken).has_value());
}

TEST(crypto_eth_signer, formats_checksum_addresses) {
  auto mixed = portage::schema::try_parse_eth_address(
      "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
  ASSERT_TRUE(mixed.has_value());
  EXPECT_EQ(portage::crypto::to_checksum_address(*mixed),
            "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");

  auto upper = portage::schema::try_parse_eth_address(
      "0xFB6916095CA1DF60BB79CE92CE3EA74C37C5D359");
  ASSERT_TRUE(upper.has_value());
  EXPECT_EQ(portage::crypto::to_checksum_address(*upper),
            "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359");
}
