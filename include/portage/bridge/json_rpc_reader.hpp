#pragma once

#include <portage/bridge/chain_reader.hpp>
#include <portage/schema/primitives.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace portage::bridge {

/// Chain reader backed by an Ethereum JSON-RPC endpoint (`eth_call`,
/// `eth_blockNumber`) over libcurl.
class json_rpc_reader final : public chain_reader {
 public:
  json_rpc_reader(std::string endpoint,
                  std::string contract,
                  uint64_t timeout_ms = 5000,
                  uint64_t connect_timeout_ms = 3000);

  fetch_result fetch_deposit(uint64_t index,
                             std::optional<uint64_t> external_height) override;
  std::optional<uint64_t> current_height() override;
  std::optional<uint64_t> highest_index(
      std::optional<uint64_t> external_height) override;

  /// Serialize a JSON-RPC 2.0 request body.
  static std::string make_request(std::string_view method,
                                  const nlohmann::json& params);

  /// Extract `result` from a response body, or std::nullopt with `error`
  /// set when the body is malformed or carries an error object.
  static std::optional<nlohmann::json> parse_response(std::string_view body,
                                                      std::string& error);

 private:
  std::optional<nlohmann::json> call(std::string_view method,
                                     const nlohmann::json& params,
                                     std::string& error) const;
  std::optional<portage::schema::bytes_t> eth_call(
      const std::string& calldata,
      std::optional<uint64_t> external_height,
      std::string& error) const;

  std::string endpoint_;
  std::string contract_;
  uint64_t timeout_ms_;
  uint64_t connect_timeout_ms_;
};

}  // namespace portage::bridge
