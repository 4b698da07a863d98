#include <blake3.h>
#include <portage/blake3/hash.hpp>

namespace portage::blake3 {

namespace {

portage::schema::hash32_t finalize(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = portage::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<portage::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

portage::schema::hash32_t hash(const std::string_view& str) {
  return finalize(str.data(), str.size());
}

portage::schema::hash32_t hash(const portage::schema::bytes_view_t& bytes) {
  return finalize(bytes.data(), bytes.size());
}

}  // namespace portage::blake3
