#include <portage/bridge/withdrawals.hpp>
#include <portage/crypto/digest.hpp>
#include <portage/schema/address.hpp>
#include <portage/schema/key/engine_keys.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <string>
#include <tuple>

using namespace portage::schema;

namespace portage::bridge {

namespace {

std::string signature_hex(const secp256k1_signature_t& signature) {
  return "0x" + to_hex(bytes_view_t{signature.data(), signature.size()});
}

std::optional<secp256k1_signature_t> stored_signature(
    const withdrawal_request_t& request) {
  if (request.status != withdrawal_status_t::signed_ || !request.signature ||
      request.signature->size() != std::tuple_size_v<secp256k1_signature_t>) {
    return std::nullopt;
  }
  auto signature = secp256k1_signature_t{};
  std::copy(std::begin(*request.signature), std::end(*request.signature),
            std::begin(signature));
  return signature;
}

}  // namespace

std::string make_withdrawal_nonce(uint64_t sequence) {
  return fmt::format("0x{:064x}", sequence);
}

std::optional<hash32_t> parse_withdrawal_nonce(std::string_view nonce) {
  if (nonce.size() != 66 || !nonce.starts_with("0x")) {
    return std::nullopt;
  }
  return try_make_hash32(nonce);
}

std::optional<bytes_t> make_withdrawal_message(
    const withdrawal_request_t& request) {
  auto destination = try_parse_eth_address(request.destination);
  auto nonce = parse_withdrawal_nonce(request.nonce);
  if (!destination || !nonce) {
    return std::nullopt;
  }
  auto amount = to_word(request.amount);

  auto message = bytes_t{};
  message.reserve(destination->size() + amount.size() + nonce->size());
  message.insert(std::end(message), std::begin(*destination),
                 std::end(*destination));
  message.insert(std::end(message), std::begin(amount), std::end(amount));
  message.insert(std::end(message), std::begin(*nonce), std::end(*nonce));
  return message;
}

std::optional<hash32_t> withdrawal_digest(const withdrawal_request_t& request) {
  auto message = make_withdrawal_message(request);
  if (!message) {
    return std::nullopt;
  }
  return portage::crypto::personal_message_digest(
      portage::crypto::keccak256(make_bytes_view(*message)));
}

std::optional<std::string> recover_signer(const withdrawal_request_t& request) {
  if (!request.signature ||
      request.signature->size() != std::tuple_size_v<secp256k1_signature_t>) {
    return std::nullopt;
  }
  auto digest = withdrawal_digest(request);
  if (!digest) {
    return std::nullopt;
  }
  auto signature = secp256k1_signature_t{};
  std::copy(std::begin(*request.signature), std::end(*request.signature),
            std::begin(signature));
  auto address = portage::crypto::recover_address(*digest, signature);
  if (!address) {
    return std::nullopt;
  }
  return to_eth_address_string(*address);
}

withdrawal_ledger::withdrawal_ledger(
    portage::schema::encoding::scale_encoder_t& encoder,
    portage::state::store& store,
    portage::bank::ledger& bank)
    : encoder_{encoder}, store_{store}, bank_{bank} {}

uint64_t withdrawal_ledger::last_sequence() const {
  auto key = key::make_withdrawal_sequence_key(encoder_);
  return store_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
}

void withdrawal_ledger::save(const withdrawal_request_t& request) {
  auto key = key::make_withdrawal_key(encoder_, request.nonce);
  store_.put(encoder_, make_bytes_view(key), request);
}

operation_result<std::string> withdrawal_ledger::initiate(
    const std::string& owner,
    const std::string& destination,
    const amount_t& amount,
    uint64_t now,
    std::vector<transaction_event_t>& events) {
  using result_t = operation_result<std::string>;
  if (!try_parse_eth_address(destination)) {
    return result_t::failure(transaction_error_code::invalid_destination,
                             "destination must be 0x followed by 40 hex");
  }
  if (amount == 0) {
    return result_t::failure(transaction_error_code::invalid_amount,
                             "amount must be positive");
  }
  if (!bank_.burn(owner, amount)) {
    return result_t::failure(transaction_error_code::insufficient_funds,
                             "balance " + to_string(bank_.balance(owner)) +
                                 " is below " + to_string(amount));
  }

  auto sequence = last_sequence() + 1;
  auto sequence_key = key::make_withdrawal_sequence_key(encoder_);
  store_.put(encoder_, make_bytes_view(sequence_key), sequence);

  auto request = withdrawal_request_t{};
  request.nonce = make_withdrawal_nonce(sequence);
  request.owner = owner;
  request.destination = destination;
  request.amount = amount;
  request.status = withdrawal_status_t::pending;
  request.created_at = now;
  save(request);

  events.push_back(make_event("withdrawal_initiated",
                              {{"nonce", request.nonce},
                               {"owner", owner},
                               {"destination", destination},
                               {"amount", to_string(amount)}}));
  spdlog::info("Withdrawal {} opened: {} burned by {} for {}", request.nonce,
               to_string(amount), owner, destination);
  return result_t::success(request.nonce);
}

operation_result<secp256k1_signature_t> withdrawal_ledger::sign(
    const std::string& nonce,
    std::string_view signer_key,
    std::vector<transaction_event_t>& events) {
  using result_t = operation_result<secp256k1_signature_t>;
  if (!parse_withdrawal_nonce(nonce)) {
    return result_t::failure(transaction_error_code::invalid_nonce_format,
                             "nonce must be 0x followed by 64 hex");
  }
  auto secret = portage::crypto::parse_secret_key(signer_key);
  if (!secret) {
    return result_t::failure(transaction_error_code::invalid_signer_key,
                             "signer key must be 32 bytes of hex");
  }
  return sign(nonce, *secret, events);
}

operation_result<secp256k1_signature_t> withdrawal_ledger::sign(
    const std::string& nonce,
    const portage::crypto::secret_key_t& signer_key,
    std::vector<transaction_event_t>& events) {
  using result_t = operation_result<secp256k1_signature_t>;
  auto request = get(nonce);
  if (!request) {
    return result_t::failure(transaction_error_code::withdrawal_missing,
                             "no withdrawal with nonce " + nonce);
  }
  if (request->status == withdrawal_status_t::completed) {
    return result_t::failure(transaction_error_code::withdrawal_completed,
                             "withdrawal already completed");
  }
  if (auto stored = stored_signature(*request)) {
    return result_t::success(*stored);
  }

  auto digest = withdrawal_digest(*request);
  if (!digest) {
    portage::common::critical("stored withdrawal request is malformed");
  }
  auto signature = portage::crypto::sign_digest(*digest, signer_key);
  if (!signature) {
    return result_t::failure(transaction_error_code::invalid_signer_key,
                             "signing failed");
  }

  request->signature = bytes_t(std::begin(*signature), std::end(*signature));
  request->status = withdrawal_status_t::signed_;
  save(*request);

  events.push_back(make_event(
      "withdrawal_signed",
      {{"nonce", nonce}, {"signature", signature_hex(*signature)}}));
  spdlog::info("Withdrawal {} signed", nonce);
  return result_t::success(*signature);
}

operation_result<bool> withdrawal_ledger::complete(
    const std::string& nonce,
    const std::string& external_tx_ref,
    uint64_t now,
    std::vector<transaction_event_t>& events) {
  using result_t = operation_result<bool>;
  if (!parse_withdrawal_nonce(nonce)) {
    return result_t::failure(transaction_error_code::invalid_nonce_format,
                             "nonce must be 0x followed by 64 hex");
  }
  auto request = get(nonce);
  if (!request) {
    return result_t::failure(transaction_error_code::withdrawal_missing,
                             "no withdrawal with nonce " + nonce);
  }
  if (request->status == withdrawal_status_t::completed) {
    return result_t::success(false);
  }
  if (request->status != withdrawal_status_t::signed_) {
    return result_t::failure(transaction_error_code::withdrawal_not_signed,
                             "withdrawal must be signed before completion");
  }

  request->status = withdrawal_status_t::completed;
  request->completed_at = now;
  request->external_tx_ref = external_tx_ref;
  save(*request);

  events.push_back(
      make_event("withdrawal_completed",
                 {{"nonce", nonce}, {"external_tx_ref", external_tx_ref}}));
  spdlog::info("Withdrawal {} completed by {}", nonce, external_tx_ref);
  return result_t::success(true);
}

std::optional<withdrawal_request_t> withdrawal_ledger::get(
    const std::string& nonce) const {
  auto key = key::make_withdrawal_key(encoder_, nonce);
  return store_.get<withdrawal_request_t>(encoder_, make_bytes_view(key));
}

std::vector<withdrawal_request_t> withdrawal_ledger::list(
    const std::optional<std::string>& owner) const {
  auto prefix = key::make_prefix_key(encoder_, key::kWithdrawalKeyPrefix);
  auto requests = std::vector<withdrawal_request_t>{};
  for (const auto& entry : store_.list_by_prefix(make_bytes_view(prefix))) {
    auto request = encoder_.try_decode<withdrawal_request_t>(
        bytes_view_t{entry.second.data(), entry.second.size()});
    if (!request) {
      portage::common::critical("failed to decode withdrawal request");
    }
    if (!owner || request->owner == *owner) {
      requests.push_back(std::move(*request));
    }
  }
  return requests;
}

uint64_t withdrawal_ledger::signed_through() const {
  auto key = key::make_withdrawal_signed_through_key(encoder_);
  return store_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
}

uint64_t withdrawal_ledger::sign_pending(
    const portage::crypto::secret_key_t& signer_key,
    std::vector<transaction_event_t>& events) {
  auto signed_count = uint64_t{0};
  auto start = signed_through();
  auto through = start;
  auto contiguous = true;
  auto last = last_sequence();
  for (auto sequence = start + 1; sequence <= last; ++sequence) {
    auto nonce = make_withdrawal_nonce(sequence);
    auto request = get(nonce);
    if (!request) {
      portage::common::critical("withdrawal sequence " +
                                std::to_string(sequence) + " has no request");
    }
    if (request->status == withdrawal_status_t::pending) {
      if (!sign(nonce, signer_key, events)) {
        contiguous = false;
        continue;
      }
      ++signed_count;
    }
    if (contiguous) {
      through = sequence;
    }
  }
  if (through != start) {
    auto key = key::make_withdrawal_signed_through_key(encoder_);
    store_.put(encoder_, make_bytes_view(key), through);
  }
  return signed_count;
}

}  // namespace portage::bridge
