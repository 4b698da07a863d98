#pragma once

#include <portage/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: withdrawal status.
// Bridge workflow: pending -> signed -> completed, forward only.
namespace portage::schema {

enum class withdrawal_status_t : uint8_t {
  pending = 0,
  signed_ = 1,
  completed = 2
};

inline constexpr auto kWithdrawalStatusMappings =
    std::array{std::pair<std::string_view, withdrawal_status_t>{
                   "pending", withdrawal_status_t::pending},
               std::pair<std::string_view, withdrawal_status_t>{
                   "signed", withdrawal_status_t::signed_},
               std::pair<std::string_view, withdrawal_status_t>{
                   "completed", withdrawal_status_t::completed}};

template <>
inline std::optional<withdrawal_status_t> try_from_string<withdrawal_status_t>(
    const std::string_view value) {
  return from_string(value, kWithdrawalStatusMappings);
}

inline constexpr std::string_view to_string(const withdrawal_status_t value) {
  return to_string(value, kWithdrawalStatusMappings).value_or("unknown");
}

}  // namespace portage::schema
