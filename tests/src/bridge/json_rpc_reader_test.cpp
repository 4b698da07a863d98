#include <gtest/gtest.h>
#include <portage/bridge/json_rpc_reader.hpp>

#include <curl/curl.h>
#include <string>

namespace {

class json_rpc_reader_test : public ::testing::Test {
 protected:
  static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  static void TearDownTestSuite() { curl_global_cleanup(); }
};

}  // namespace

TEST(json_rpc_request, serializes_method_and_params) {
  auto body = portage::bridge::json_rpc_reader::make_request(
      "eth_call",
      nlohmann::json::array({nlohmann::json{{"to", "0xabc"}, {"data", "0x01"}},
                             "latest"}));
  auto parsed = nlohmann::json::parse(body);
  EXPECT_EQ(parsed["jsonrpc"], "2.0");
  EXPECT_EQ(parsed["id"], 1);
  EXPECT_EQ(parsed["method"], "eth_call");
  ASSERT_TRUE(parsed["params"].is_array());
  EXPECT_EQ(parsed["params"][0]["to"], "0xabc");
  EXPECT_EQ(parsed["params"][1], "latest");
}

TEST(json_rpc_response, extracts_result) {
  auto error = std::string{};
  auto result = portage::bridge::json_rpc_reader::parse_response(
      R"({"jsonrpc":"2.0","id":1,"result":"0x1b4"})", error);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>(), "0x1b4");
  EXPECT_TRUE(error.empty());
}

TEST(json_rpc_response, reports_error_objects) {
  auto error = std::string{};
  auto result = portage::bridge::json_rpc_reader::parse_response(
      R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"execution reverted"}})",
      error);
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(error, "execution reverted");
}

TEST(json_rpc_response, rejects_malformed_bodies) {
  auto error = std::string{};
  EXPECT_FALSE(portage::bridge::json_rpc_reader::parse_response("not json", error)
                   .has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(portage::bridge::json_rpc_reader::parse_response("[1,2]", error)
                   .has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(portage::bridge::json_rpc_reader::parse_response(
                   R"({"jsonrpc":"2.0","id":1})", error)
                   .has_value());
  EXPECT_FALSE(error.empty());
}

TEST_F(json_rpc_reader_test, unreachable_endpoint_is_unavailable) {
  auto reader = portage::bridge::json_rpc_reader{
      "http://127.0.0.1:1", "0xcc391c8f1aFd6DB5D8b0e064BA81b1383b14FE5B", 500,
      200};

  auto result = reader.fetch_deposit(1, 100);
  EXPECT_EQ(result.status, portage::bridge::fetch_status::unavailable);
  EXPECT_FALSE(result.record.has_value());
  EXPECT_FALSE(result.error.empty());

  EXPECT_FALSE(reader.current_height().has_value());
  EXPECT_FALSE(reader.highest_index(std::nullopt).has_value());
}
