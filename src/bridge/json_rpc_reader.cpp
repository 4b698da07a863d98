#include <portage/bridge/abi.hpp>
#include <portage/bridge/json_rpc_reader.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <memory>
#include <utility>

namespace portage::bridge {

namespace {

struct curl_deleter final {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct curl_slist_deleter final {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using curl_ptr = std::unique_ptr<CURL, curl_deleter>;
using curl_slist_ptr = std::unique_ptr<curl_slist, curl_slist_deleter>;

size_t append_body(char* contents, size_t size, size_t count, void* user) {
  auto* body = static_cast<std::string*>(user);
  body->append(contents, size * count);
  return size * count;
}

std::optional<std::string> post_json(const std::string& endpoint,
                                     const std::string& request,
                                     uint64_t timeout_ms,
                                     uint64_t connect_timeout_ms,
                                     std::string& error) {
  auto handle = curl_ptr{curl_easy_init()};
  if (!handle) {
    error = "curl_easy_init failed";
    return std::nullopt;
  }
  auto headers = curl_slist_ptr{
      curl_slist_append(nullptr, "Content-Type: application/json")};
  auto body = std::string{};

  curl_easy_setopt(handle.get(), CURLOPT_URL, endpoint.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(request.size()));
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(timeout_ms));
  curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(connect_timeout_ms));
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

  auto code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    error = curl_easy_strerror(code);
    return std::nullopt;
  }
  auto status = long{0};
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status != 200) {
    error = "http status " + std::to_string(status);
    return std::nullopt;
  }
  return body;
}

}  // namespace

json_rpc_reader::json_rpc_reader(std::string endpoint,
                                 std::string contract,
                                 uint64_t timeout_ms,
                                 uint64_t connect_timeout_ms)
    : endpoint_{std::move(endpoint)},
      contract_{std::move(contract)},
      timeout_ms_{timeout_ms},
      connect_timeout_ms_{std::min(connect_timeout_ms, timeout_ms)} {}

std::string json_rpc_reader::make_request(std::string_view method,
                                          const nlohmann::json& params) {
  auto request = nlohmann::json{{"jsonrpc", "2.0"},
                                {"id", 1},
                                {"method", std::string{method}},
                                {"params", params}};
  return request.dump();
}

std::optional<nlohmann::json> json_rpc_reader::parse_response(
    std::string_view body,
    std::string& error) {
  auto response = nlohmann::json::parse(body, nullptr, false);
  if (response.is_discarded() || !response.is_object()) {
    error = "malformed JSON-RPC response";
    return std::nullopt;
  }
  if (auto it = response.find("error");
      it != response.end() && !it->is_null()) {
    error = it->is_object() && it->contains("message") &&
                    (*it)["message"].is_string()
                ? (*it)["message"].get<std::string>()
                : it->dump();
    return std::nullopt;
  }
  auto result = response.find("result");
  if (result == response.end()) {
    error = "JSON-RPC response without result";
    return std::nullopt;
  }
  return *result;
}

std::optional<nlohmann::json> json_rpc_reader::call(
    std::string_view method,
    const nlohmann::json& params,
    std::string& error) const {
  auto body = post_json(endpoint_, make_request(method, params), timeout_ms_,
                        connect_timeout_ms_, error);
  if (!body) {
    return std::nullopt;
  }
  return parse_response(*body, error);
}

std::optional<portage::schema::bytes_t> json_rpc_reader::eth_call(
    const std::string& calldata,
    std::optional<uint64_t> external_height,
    std::string& error) const {
  auto params = nlohmann::json::array(
      {nlohmann::json{{"to", contract_}, {"data", calldata}},
       abi::block_tag(external_height)});
  auto result = call("eth_call", params, error);
  if (!result) {
    return std::nullopt;
  }
  if (!result->is_string()) {
    error = "eth_call result is not a string";
    return std::nullopt;
  }
  auto decoded = portage::schema::try_from_hex(result->get<std::string>());
  if (!decoded) {
    error = "eth_call result is not hex";
  }
  return decoded;
}

fetch_result json_rpc_reader::fetch_deposit(
    uint64_t index,
    std::optional<uint64_t> external_height) {
  auto result = fetch_result{};
  auto raw = eth_call(abi::encode_call(abi::kDepositsSignature,
                                       portage::schema::amount_t{index}),
                      external_height, result.error);
  if (!raw) {
    spdlog::warn("deposits({}) failed at {}: {}", index,
                 abi::block_tag(external_height), result.error);
    result.status = fetch_status::unavailable;
    return result;
  }
  auto decoded = abi::decode_string_uint256(
      portage::schema::make_bytes_view(*raw));
  if (!decoded) {
    result.error = "undecodable deposits() return data";
    spdlog::warn("deposits({}) returned {} undecodable bytes", index,
                 raw->size());
    result.status = fetch_status::unavailable;
    return result;
  }
  if (decoded->first.empty()) {
    spdlog::debug("deposit {} not found at {}", index,
                  abi::block_tag(external_height));
    result.status = fetch_status::not_found;
    return result;
  }

  result.status = fetch_status::found;
  result.record = portage::schema::deposit_record_t{
      .index = index,
      .account = std::move(decoded->first),
      .amount = decoded->second,
      .external_height = external_height.value_or(0)};
  return result;
}

std::optional<uint64_t> json_rpc_reader::current_height() {
  auto error = std::string{};
  auto result = call("eth_blockNumber", nlohmann::json::array(), error);
  if (!result || !result->is_string()) {
    spdlog::warn("eth_blockNumber failed: {}",
                 error.empty() ? "non-string result" : error);
    return std::nullopt;
  }
  return abi::parse_quantity(result->get<std::string>());
}

std::optional<uint64_t> json_rpc_reader::highest_index(
    std::optional<uint64_t> external_height) {
  auto error = std::string{};
  auto raw = eth_call(abi::encode_call(abi::kDepositIndexSignature),
                      external_height, error);
  if (!raw) {
    spdlog::warn("depositIndex() failed at {}: {}",
                 abi::block_tag(external_height), error);
    return std::nullopt;
  }
  auto value = abi::decode_uint256(portage::schema::make_bytes_view(*raw));
  if (!value || *value > std::numeric_limits<uint64_t>::max()) {
    spdlog::warn("depositIndex() returned an undecodable value");
    return std::nullopt;
  }
  return static_cast<uint64_t>(*value);
}

}  // namespace portage::bridge
