#pragma once

#include <portage/schema/primitives.hpp>
#include <portage/schema/withdrawal_status.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: withdrawal request.
// Bridge workflow: created by a burn; the stored signature is the artifact a
// user presents to the L2 contract to claim funds.
namespace portage::schema {

template <uint16_t Version>
struct withdrawal_request;

template <>
struct withdrawal_request<1> final {
  uint16_t version{1};
  std::string nonce;
  std::string owner;
  std::string destination;
  amount_t amount{};
  withdrawal_status_t status{withdrawal_status_t::pending};
  std::optional<bytes_t> signature;
  timestamp_seconds_t created_at{};
  timestamp_seconds_t completed_at{};
  std::optional<std::string> external_tx_ref;
};

using withdrawal_request_t = withdrawal_request<1>;

}  // namespace portage::schema
