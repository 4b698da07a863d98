#pragma once

#include <portage/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Minimal Solidity ABI codec for the bridge contract views.
namespace portage::bridge::abi {

inline constexpr auto kDepositsSignature = std::string_view{"deposits(uint256)"};
inline constexpr auto kDepositIndexSignature =
    std::string_view{"depositIndex()"};

/// First four bytes of keccak256(signature).
portage::schema::bytes_t selector(std::string_view signature);

/// `0x`-prefixed calldata: selector followed by one word per argument.
std::string encode_call(std::string_view signature);
std::string encode_call(std::string_view signature,
                        const portage::schema::amount_t& argument);

std::optional<portage::schema::amount_t> decode_uint256(
    const portage::schema::bytes_view_t& data);

/// Decode a `(string, uint256)` return tuple.
std::optional<std::pair<std::string, portage::schema::amount_t>>
decode_string_uint256(const portage::schema::bytes_view_t& data);

/// JSON-RPC block tag: `0x`-hex height, or `latest`.
std::string block_tag(std::optional<uint64_t> height);

/// Parse a JSON-RPC quantity (`0x`-prefixed hex, no leading zero padding
/// required).
std::optional<uint64_t> parse_quantity(std::string_view quantity);

}  // namespace portage::bridge::abi
