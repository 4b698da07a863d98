#pragma once

#include <portage/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Bridge workflow: canonical key prefixes and key codecs for bank balances,
// the processed-record set, ingestion cursor, and withdrawal ledger.
namespace portage::schema::key {

inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kChainIdKey{"SYS|APP|CHAIN_ID"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|BANK|BALANCE|"};
inline constexpr std::string_view kProcessedKeyPrefix{
    "SYS|BRIDGE|PROCESSED|"};
inline constexpr std::string_view kDepositIndexKeyPrefix{"SYS|BRIDGE|INDEX|"};
inline constexpr std::string_view kSyncCursorKey{"SYS|BRIDGE|CURSOR|"};
inline constexpr std::string_view kDepositCheckTimeKey{
    "SYS|BRIDGE|CHECK_TIME|"};
inline constexpr std::string_view kWithdrawalKeyPrefix{
    "SYS|WITHDRAWAL|REQUEST|"};
inline constexpr std::string_view kWithdrawalSequenceKey{
    "SYS|WITHDRAWAL|SEQUENCE|"};
inline constexpr std::string_view kWithdrawalSignedThroughKey{
    "SYS|WITHDRAWAL|SIGNED_THROUGH|"};

inline const std::array<std::string_view, 10> kEngineKeyspaces{
    kNonceKeyPrefix,        kChainIdKey,          kBalanceKeyPrefix,
    kProcessedKeyPrefix,    kDepositIndexKeyPrefix, kSyncCursorKey,
    kDepositCheckTimeKey,   kWithdrawalKeyPrefix, kWithdrawalSequenceKey,
    kWithdrawalSignedThroughKey};

template <typename Encoder, typename T>
portage::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
portage::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
portage::schema::bytes_t make_signer_nonce_key(
    Encoder& encoder,
    const portage::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
portage::schema::bytes_t make_chain_id_key(Encoder& encoder) {
  return make_prefix_key(encoder, kChainIdKey);
}

template <typename Encoder>
portage::schema::bytes_t make_balance_key(Encoder& encoder,
                                          const std::string& account,
                                          const std::string& denom) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{account, denom});
}

template <typename Encoder>
portage::schema::bytes_t make_processed_key(Encoder& encoder,
                                            const std::string& record_id) {
  return make_prefixed_key(encoder, kProcessedKeyPrefix, record_id);
}

template <typename Encoder>
portage::schema::bytes_t make_deposit_index_key(Encoder& encoder,
                                                const uint64_t index) {
  return make_prefixed_key(encoder, kDepositIndexKeyPrefix, index);
}

template <typename Encoder>
portage::schema::bytes_t make_sync_cursor_key(Encoder& encoder) {
  return make_prefix_key(encoder, kSyncCursorKey);
}

template <typename Encoder>
portage::schema::bytes_t make_deposit_check_time_key(Encoder& encoder) {
  return make_prefix_key(encoder, kDepositCheckTimeKey);
}

template <typename Encoder>
portage::schema::bytes_t make_withdrawal_key(Encoder& encoder,
                                             const std::string& nonce) {
  return make_prefixed_key(encoder, kWithdrawalKeyPrefix, nonce);
}

template <typename Encoder>
portage::schema::bytes_t make_withdrawal_sequence_key(Encoder& encoder) {
  return make_prefix_key(encoder, kWithdrawalSequenceKey);
}

template <typename Encoder>
portage::schema::bytes_t make_withdrawal_signed_through_key(Encoder& encoder) {
  return make_prefix_key(encoder, kWithdrawalSignedThroughKey);
}

}  // namespace portage::schema::key
