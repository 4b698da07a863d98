#pragma once

#include <portage/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Host-chain account addresses (bech32, BIP-173) and external-chain
// addresses (`0x` + 40 hex).
namespace portage::schema {

inline constexpr auto kAccountPrefix = std::string_view{"b52"};

/// Encode 8-bit payload bytes as bech32 under `hrp`.
std::string bech32_encode(std::string_view hrp, const bytes_view_t& payload);

/// Decode a bech32 string into (lowercase hrp, 8-bit payload bytes).
std::optional<std::pair<std::string, bytes_t>> bech32_decode(
    std::string_view encoded);

/// Canonical account string for a 20 or 32 byte account id.
std::string make_account_address(const bytes_view_t& account_id);

/// Account owned by a transaction signer: first 20 bytes of
/// sha256(public key or named id).
std::string make_account_address(const signer_id_t& signer);

/// Canonical form of a deposit recipient. Valid bech32 under kAccountPrefix
/// is returned as is; kAccountPrefix followed by hex is re-encoded as
/// bech32; anything else yields std::nullopt.
std::optional<std::string> normalize_account(std::string_view account);

/// Strictly `0x` followed by 40 hex characters (either case).
std::optional<eth_address_t> try_parse_eth_address(std::string_view address);
std::string to_eth_address_string(const eth_address_t& address);

}  // namespace portage::schema
