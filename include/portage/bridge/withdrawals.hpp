#pragma once

#include <portage/bank/ledger.hpp>
#include <portage/bridge/operation_result.hpp>
#include <portage/crypto/eth_signer.hpp>
#include <portage/schema/encoding/scale/encoder.hpp>
#include <portage/schema/primitives.hpp>
#include <portage/schema/transaction_event.hpp>
#include <portage/schema/withdrawal_request.hpp>
#include <portage/state/store.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portage::bridge {

/// "0x" + 64 lowercase hex digits of sequence.
std::string make_withdrawal_nonce(uint64_t sequence);

/// 32 nonce bytes of a well-formed withdrawal nonce.
std::optional<portage::schema::hash32_t> parse_withdrawal_nonce(
    std::string_view nonce);

/// destination (20 bytes) || amount (32 bytes, big-endian) || nonce (32 bytes).
std::optional<portage::schema::bytes_t> make_withdrawal_message(
    const portage::schema::withdrawal_request_t& request);

/// Personal-message digest an L2 contract recomputes before `ecrecover`.
std::optional<portage::schema::hash32_t> withdrawal_digest(
    const portage::schema::withdrawal_request_t& request);

/// `0x` address that produced the stored signature.
std::optional<std::string> recover_signer(
    const portage::schema::withdrawal_request_t& request);

/// Burn-and-authorize withdrawal ledger.
class withdrawal_ledger final {
 public:
  withdrawal_ledger(portage::schema::encoding::scale_encoder_t& encoder,
                    portage::state::store& store,
                    portage::bank::ledger& bank);

  /// Burn amount from owner and open a pending request; returns its nonce.
  operation_result<std::string> initiate(
      const std::string& owner,
      const std::string& destination,
      const portage::schema::amount_t& amount,
      uint64_t now,
      std::vector<portage::schema::transaction_event_t>& events);

  /// Sign a request. An already signed request returns its stored signature
  /// without re-signing.
  operation_result<portage::schema::secp256k1_signature_t> sign(
      const std::string& nonce,
      std::string_view signer_key,
      std::vector<portage::schema::transaction_event_t>& events);

  operation_result<portage::schema::secp256k1_signature_t> sign(
      const std::string& nonce,
      const portage::crypto::secret_key_t& signer_key,
      std::vector<portage::schema::transaction_event_t>& events);

  /// Mark a signed request as claimed on the L2. Completing a completed
  /// request is a successful no-op and yields false.
  operation_result<bool> complete(
      const std::string& nonce,
      const std::string& external_tx_ref,
      uint64_t now,
      std::vector<portage::schema::transaction_event_t>& events);

  std::optional<portage::schema::withdrawal_request_t> get(
      const std::string& nonce) const;

  /// Requests ordered by nonce, optionally restricted to one owner.
  std::vector<portage::schema::withdrawal_request_t> list(
      const std::optional<std::string>& owner) const;

  /// Sign every pending request with signer_key; returns how many were
  /// signed. Only sequences above signed_through() are visited.
  uint64_t sign_pending(
      const portage::crypto::secret_key_t& signer_key,
      std::vector<portage::schema::transaction_event_t>& events);

  uint64_t last_sequence() const;

  /// Highest sequence at or below which no request is pending.
  uint64_t signed_through() const;

 private:
  void save(const portage::schema::withdrawal_request_t& request);

  portage::schema::encoding::scale_encoder_t& encoder_;
  portage::state::store& store_;
  portage::bank::ledger& bank_;
};

}  // namespace portage::bridge
