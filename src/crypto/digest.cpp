#include <portage/common/critical.hpp>
#include <portage/crypto/digest.hpp>

#include <ethash/keccak.hpp>
#include <openssl/evp.h>

#include <algorithm>
#include <iterator>
#include <memory>

namespace portage::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

portage::schema::hash32_t sha256(const portage::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    portage::common::critical("failed to allocate digest context");
  }
  auto digest = portage::schema::hash32_t{};
  auto digest_size = static_cast<unsigned int>(digest.size());
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_size) != 1) {
    portage::common::critical("sha256 digest failed");
  }
  return digest;
}

portage::schema::hash32_t sha256(const std::string_view& str) {
  return sha256(portage::schema::make_bytes_view(str));
}

portage::schema::hash32_t keccak256(
    const portage::schema::bytes_view_t& bytes) {
  auto hashed = ethash::keccak256(bytes.data(), bytes.size());
  auto digest = portage::schema::hash32_t{};
  std::copy(std::begin(hashed.bytes), std::end(hashed.bytes),
            std::begin(digest));
  return digest;
}

portage::schema::hash32_t keccak256(const std::string_view& str) {
  return keccak256(portage::schema::make_bytes_view(str));
}

}  // namespace portage::crypto
