#pragma once

#include <portage/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

// Schema type: transaction event.
// Bridge workflow: indexed emission consumed by relayers and explorers
// (deposit_synced, deposit_skipped, withdrawal_*).
namespace portage::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

/// Build an event whose attributes are all indexed.
inline transaction_event_t make_event(
    std::string type,
    std::initializer_list<std::pair<std::string, std::string>> attributes) {
  auto event = transaction_event_t{};
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(
        transaction_event_attribute_t{.key = key, .value = value, .index = true});
  }
  return event;
}

}  // namespace portage::schema
