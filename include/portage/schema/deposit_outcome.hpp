#pragma once

#include <portage/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: deposit outcome.
// Bridge workflow: how a settled deposit record was handled.
namespace portage::schema {

enum class deposit_outcome_t : uint8_t { credited = 0, skipped = 1 };

inline constexpr auto kDepositOutcomeMappings =
    std::array{std::pair<std::string_view, deposit_outcome_t>{
                   "credited", deposit_outcome_t::credited},
               std::pair<std::string_view, deposit_outcome_t>{
                   "skipped", deposit_outcome_t::skipped}};

template <>
inline std::optional<deposit_outcome_t> try_from_string<deposit_outcome_t>(
    const std::string_view value) {
  return from_string(value, kDepositOutcomeMappings);
}

inline constexpr std::string_view to_string(const deposit_outcome_t value) {
  return to_string(value, kDepositOutcomeMappings).value_or("unknown");
}

}  // namespace portage::schema
