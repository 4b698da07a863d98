#pragma once

#include <portage/schema/address.hpp>
#include <portage/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace portage::testing {

/// secp256k1 secret 1; its address is the well known 0x7E5F...5Bdf.
inline constexpr auto kTestSignerKey = std::string_view{
    "0x0000000000000000000000000000000000000000000000000000000000000001"};
inline constexpr auto kTestSignerAddress =
    std::string_view{"0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"};
inline constexpr auto kTestDestination =
    std::string_view{"0x1111111111111111111111111111111111111111"};

inline portage::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = portage::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline portage::schema::named_signer_t make_named_signer_id(
    const uint8_t seed) {
  auto named = portage::schema::named_signer_t{};
  named[0] = seed;
  return named;
}

inline portage::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return portage::schema::signer_id_t{make_named_signer_id(seed)};
}

/// Bech32 account over a 20-byte id filled from seed.
inline std::string make_account(const uint8_t seed) {
  auto id = portage::schema::bytes_t(20);
  for (std::size_t i = 0; i < id.size(); ++i) {
    id[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return portage::schema::make_account_address(
      portage::schema::bytes_view_t{id.data(), id.size()});
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary database directory, removed on destruction. Declare it before
/// the storage that lives in it.
class scoped_db_path final {
 public:
  explicit scoped_db_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  ~scoped_db_path() { remove_path(path_); }

  scoped_db_path(const scoped_db_path&) = delete;
  scoped_db_path& operator=(const scoped_db_path&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace portage::testing
