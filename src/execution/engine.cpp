#include <portage/blake3/hash.hpp>
#include <portage/bridge/ingestion.hpp>
#include <portage/bridge/scanner.hpp>
#include <portage/crypto/verify.hpp>
#include <portage/execution/engine.hpp>
#include <portage/schema/address.hpp>
#include <portage/schema/key/engine_keys.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iterator>
#include <tuple>
#include <utility>

using namespace portage::schema;

namespace {

constexpr auto kCheckTxCodespace = std::string_view{"portage.checktx"};
constexpr auto kProposalCodespace = std::string_view{"portage.proposal"};
constexpr auto kFinalizeCodespace = std::string_view{"portage.finalize"};
constexpr auto kQueryCodespace = std::string_view{"portage.query"};
constexpr auto kDefaultChainId = std::string_view{"portage-bridge-chain"};

portage::schema::hash32_t fold_app_hash(
    const portage::schema::hash32_t& seed,
    int64_t height,
    const portage::state::write_set_t& writes) {
  auto encoder = portage::schema::encoding::scale_encoder_t{};
  auto entries = std::vector<std::tuple<bytes_t, bytes_t>>{};
  entries.reserve(writes.size());
  for (const auto& [key, value] : writes) {
    entries.emplace_back(key, value);
  }

  auto material = portage::schema::bytes_t{};
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  encoder.encode(height, material);
  encoder.encode(entries, material);
  return portage::blake3::hash(
      portage::schema::bytes_view_t{material.data(), material.size()});
}

transaction_result_t make_error_result(transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

std::optional<transaction_t> decode_transaction(
    portage::schema::encoding::scale_encoder_t& encoder,
    const bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction is not a SCALE encoded envelope";
  }
  return tx;
}

bool signature_matches_signer(const signer_id_t& signer,
                              const signature_t& signature) {
  return std::visit(
      overloaded{[&](const ed25519_signer_id&) {
                   return std::holds_alternative<ed25519_signature_t>(
                       signature);
                 },
                 [&](const secp256k1_signer_id&) {
                   return std::holds_alternative<secp256k1_signature_t>(
                       signature);
                 },
                 [&](const named_signer_t&) { return true; }},
      signer);
}

template <typename T>
transaction_result_t from_operation(
    const portage::bridge::operation_result<T>& operation,
    std::string_view codespace) {
  return make_error_result(operation.error, operation.message, {}, codespace);
}

}  // namespace

namespace portage::execution {

engine::engine(
    portage::schema::encoding::scale_encoder_t& encoder,
    portage::storage::storage<portage::storage::rocksdb_storage_tag>& storage,
    portage::bridge::params params,
    bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      store_{storage},
      bank_{encoder, store_},
      deposits_{encoder, store_, bank_, params.contract},
      withdrawals_{encoder, store_, bank_},
      params_{std::move(params)},
      chain_id_{portage::blake3::hash(kDefaultChainId)},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{portage::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; envelope signatures are not checked");
  }
  spdlog::info("Execution engine ready at height {} (bridge contract {})",
               last_committed_height_, params_.contract);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kCheckTxCodespace);
  }
  auto result = validate_transaction(*tx, kCheckTxCodespace);
  if (result.code == 0) {
    result.gas_wanted = 1000;
  }
  return result;
}

transaction_result_t engine::process_proposal_transaction(
    const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kProposalCodespace);
  }
  return validate_transaction(*tx, kProposalCodespace);
}

std::optional<hash32_t> engine::init_chain(std::string_view chain_id,
                                           const bytes_view_t& app_state,
                                           int64_t initial_height,
                                           std::string& error) {
  auto lock = std::scoped_lock{mutex_};
  store_.discard_block();

  auto balances = std::vector<std::pair<std::string, amount_t>>{};
  if (!app_state.empty()) {
    auto genesis =
        nlohmann::json::parse(make_string_view(app_state), nullptr, false);
    if (genesis.is_discarded() || !genesis.is_object()) {
      error = "app_state is not a JSON object";
      return std::nullopt;
    }
    auto entries = genesis.value("balances", nlohmann::json::array());
    if (!entries.is_array()) {
      error = "balances must be an array";
      return std::nullopt;
    }
    for (const auto& entry : entries) {
      if (!entry.is_object() || !entry.contains("address") ||
          !entry["address"].is_string() || !entry.contains("amount")) {
        error = "balance entries need address and amount";
        return std::nullopt;
      }
      auto account = normalize_account(entry["address"].get<std::string>());
      if (!account) {
        error = "invalid genesis address " + entry["address"].dump();
        return std::nullopt;
      }
      auto amount_text = entry["amount"].is_string()
                             ? entry["amount"].get<std::string>()
                             : entry["amount"].dump();
      auto amount = try_parse_amount(amount_text);
      if (!amount) {
        error = "invalid genesis amount " + entry["amount"].dump();
        return std::nullopt;
      }
      balances.emplace_back(std::move(*account), *amount);
    }
  }

  chain_id_ = portage::blake3::hash(chain_id);
  auto chain_id_key = key::make_chain_id_key(encoder_);
  store_.put(encoder_, make_bytes_view(chain_id_key), chain_id_);
  for (const auto& [account, amount] : balances) {
    bank_.set_balance(account, amount);
  }

  auto genesis_height = initial_height > 0 ? initial_height - 1 : 0;
  auto writes = store_.take_block_writes();
  auto app_hash = fold_app_hash(make_zero_hash(), genesis_height, writes);
  storage_.commit(std::vector<portage::storage::key_value_entry_t>(
                      std::begin(writes), std::end(writes)),
                  portage::storage::committed_state{.height = genesis_height,
                                                    .app_hash = app_hash});
  last_committed_height_ = genesis_height;
  last_committed_app_hash_ = app_hash;
  pending_height_ = 0;
  pending_app_hash_ = app_hash;

  spdlog::info("Initialized chain '{}' with {} genesis balance(s)", chain_id,
               balances.size());
  return app_hash;
}

transaction_result_t engine::validate_transaction(const transaction_t& tx,
                                                  std::string_view codespace) {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id",
                             "chain id does not match this network",
                             codespace);
  }
  if (!signature_matches_signer(tx.signer, tx.signature)) {
    return make_error_result(transaction_error_code::invalid_signature_type,
                             "invalid signature type",
                             "signature type does not match signer type",
                             codespace);
  }
  if (require_strict_crypto_) {
    auto message = make_signing_bytes(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(make_bytes_view(message), tx.signer,
                             tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed,
          "signature verification failed", {}, codespace);
    }
  }
  auto expected = signer_nonce(tx.signer) + 1;
  if (tx.nonce != expected) {
    return make_error_result(transaction_error_code::invalid_nonce,
                             "invalid nonce",
                             "expected nonce " + std::to_string(expected),
                             codespace);
  }
  return transaction_result_t{};
}

uint64_t engine::signer_nonce(const signer_id_t& signer) const {
  auto key = key::make_signer_nonce_key(encoder_, signer);
  return store_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
}

transaction_result_t engine::execute_operation(const transaction_t& tx) {
  auto result = transaction_result_t{};
  std::visit(
      overloaded{
          [&](const initiate_withdrawal_t& payload) {
            auto owner = make_account_address(tx.signer);
            auto operation =
                withdrawals_.initiate(owner, payload.destination,
                                      payload.amount, current_block_time_,
                                      result.events);
            if (!operation) {
              result = from_operation(operation, kFinalizeCodespace);
              return;
            }
            result.data = make_bytes(*operation.value);
            result.info = "withdrawal " + *operation.value + " initiated";
          },
          [&](const sign_withdrawal_t& payload) {
            auto operation = withdrawals_.sign(payload.nonce, payload.signer_key,
                                               result.events);
            if (!operation) {
              result = from_operation(operation, kFinalizeCodespace);
              return;
            }
            result.data =
                bytes_t(std::begin(*operation.value), std::end(*operation.value));
            result.info = "withdrawal " + payload.nonce + " signed";
          },
          [&](const process_deposit_t& payload) {
            auto events = std::vector<transaction_event_t>{};
            result = process_deposit(payload, events);
            result.events = std::move(events);
          },
          [&](const complete_withdrawal_t& payload) {
            auto operation =
                withdrawals_.complete(payload.nonce, payload.external_tx_ref,
                                      current_block_time_, result.events);
            if (!operation) {
              result = from_operation(operation, kFinalizeCodespace);
              return;
            }
            result.info = *operation.value
                              ? "withdrawal " + payload.nonce + " completed"
                              : "withdrawal " + payload.nonce +
                                    " already completed";
          }},
      tx.payload);

  if (result.code == 0) {
    result.gas_wanted = 1000;
    result.gas_used = 750;
  }
  return result;
}

transaction_result_t engine::process_deposit(
    const process_deposit_t& payload,
    std::vector<transaction_event_t>& events) {
  if (!reader_) {
    return make_error_result(transaction_error_code::bridge_disabled,
                             "bridge disabled",
                             "no external chain reader configured",
                             kFinalizeCodespace);
  }
  if (deposits_.is_processed(payload.index)) {
    return make_error_result(transaction_error_code::deposit_already_processed,
                             "deposit already processed",
                             "deposit index " + std::to_string(payload.index),
                             kFinalizeCodespace);
  }

  auto external_height = payload.external_height.value_or(
      portage::bridge::derive_external_height(params_, current_block_time_));
  auto fetched = reader_->fetch_deposit(payload.index, external_height);
  if (fetched.status == portage::bridge::fetch_status::not_found) {
    return make_error_result(
        transaction_error_code::deposit_not_found, "deposit not found",
        "no deposit " + std::to_string(payload.index) + " at external height " +
            std::to_string(external_height),
        kFinalizeCodespace);
  }
  if (fetched.status != portage::bridge::fetch_status::found ||
      !fetched.record) {
    return make_error_result(
        transaction_error_code::external_chain_unavailable,
        "external chain unavailable", fetched.error, kFinalizeCodespace);
  }

  auto record = *fetched.record;
  record.index = payload.index;
  auto outcome = deposits_.settle(record, external_height, events);

  auto cursor = deposits_.cursor();
  if (payload.index == cursor.last_processed_index + 1) {
    cursor.last_processed_index = payload.index;
    deposits_.set_cursor(cursor);
  }

  auto result = transaction_result_t{};
  auto deposit_outcome = outcome.status == portage::bridge::settle_status::credited
                             ? deposit_outcome_t::credited
                             : deposit_outcome_t::skipped;
  result.data = encoder_.encode(std::tuple{outcome.recipient, record.amount,
                                           payload.index, external_height,
                                           deposit_outcome});
  result.info = "deposit " + std::to_string(payload.index) + " " +
                std::string{to_string(deposit_outcome)};
  return result;
}

void engine::run_block_hooks(uint64_t block_time,
                             std::vector<transaction_event_t>& events) {
  if (reader_) {
    auto hook_scope = portage::state::scope{store_};
    portage::bridge::ingest_deposits(params_, *reader_, deposits_, block_time,
                                     events);
    portage::bridge::scan_deposits(params_, *reader_, deposits_, block_time,
                                   events);
    hook_scope.commit();
  }
  if (params_.signer_key) {
    auto hook_scope = portage::state::scope{store_};
    auto signed_count = withdrawals_.sign_pending(*params_.signer_key, events);
    hook_scope.commit();
    if (signed_count > 0) {
      spdlog::info("Auto-signed {} pending withdrawal(s)", signed_count);
    }
  }
}

block_result_t engine::finalize_block(uint64_t height,
                                      uint64_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  store_.discard_block();
  current_block_time_ = block_time;

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  for (const auto& raw_tx : txs) {
    auto decode_error = std::string{};
    auto tx = decode_transaction(encoder_, make_bytes_view(raw_tx),
                                 decode_error);
    if (!tx) {
      result.tx_results.push_back(
          make_error_result(transaction_error_code::invalid_transaction,
                            "invalid transaction", decode_error,
                            kFinalizeCodespace));
      continue;
    }

    auto tx_scope = portage::state::scope{store_};
    auto validation = validate_transaction(*tx, kFinalizeCodespace);
    if (validation.code != 0) {
      result.tx_results.push_back(std::move(validation));
      continue;
    }
    auto tx_result = execute_operation(*tx);
    if (tx_result.code == 0) {
      auto nonce_key = key::make_signer_nonce_key(encoder_, tx->signer);
      store_.put(encoder_, make_bytes_view(nonce_key), tx->nonce);
      tx_scope.commit();
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  run_block_hooks(block_time, result.events);

  pending_height_ = static_cast<int64_t>(height);
  pending_app_hash_ = fold_app_hash(last_committed_app_hash_, pending_height_,
                                    store_.block_writes());
  result.app_hash = pending_app_hash_;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    auto writes = store_.take_block_writes();
    storage_.commit(std::vector<portage::storage::key_value_entry_t>(
                        std::begin(writes), std::end(writes)),
                    portage::storage::committed_state{
                        .height = pending_height_,
                        .app_hash = pending_app_hash_});
    last_committed_height_ = pending_height_;
    last_committed_app_hash_ = pending_app_hash_;
    pending_height_ = 0;
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.app_hash = last_committed_app_hash_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_app_hash = last_committed_app_hash_;
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto invalid_key = [&](std::string_view expected) {
    return make_query_error(query_error_code::invalid_key,
                            "query data must be " + std::string{expected},
                            data, last_committed_height_);
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_app_hash_, chain_id_});
    return result;
  }
  if (path == "/bridge/processed") {
    auto record_id = encoder_.try_decode<std::string>(data);
    if (!record_id) {
      return invalid_key("a SCALE string record id");
    }
    result.value = encoder_.encode(deposits_.processed(*record_id).has_value());
    return result;
  }
  if (path == "/bridge/processed_index") {
    auto index = encoder_.try_decode<uint64_t>(data);
    if (!index) {
      return invalid_key("a SCALE u64 deposit index");
    }
    result.value = encoder_.encode(deposits_.processed_height(*index));
    return result;
  }
  if (path == "/bridge/record_id") {
    auto index = encoder_.try_decode<uint64_t>(data);
    if (!index) {
      return invalid_key("a SCALE u64 deposit index");
    }
    result.value = encoder_.encode(
        portage::bridge::make_record_id(deposits_.contract(), *index));
    return result;
  }
  if (path == "/bridge/cursor") {
    result.value = encoder_.encode(deposits_.cursor());
    return result;
  }
  if (path == "/bridge/last_check_time") {
    result.value = encoder_.encode(deposits_.last_check_time());
    return result;
  }
  if (path == "/withdrawal/get") {
    auto nonce = encoder_.try_decode<std::string>(data);
    if (!nonce) {
      return invalid_key("a SCALE string nonce");
    }
    auto request = withdrawals_.get(*nonce);
    if (!request) {
      return make_query_error(query_error_code::not_found,
                              "no withdrawal with nonce " + *nonce, data,
                              last_committed_height_);
    }
    result.value = encoder_.encode(*request);
    return result;
  }
  if (path == "/withdrawal/list") {
    auto owner = std::optional<std::string>{};
    if (!data.empty()) {
      auto decoded = encoder_.try_decode<std::optional<std::string>>(data);
      if (!decoded) {
        return invalid_key("a SCALE optional owner");
      }
      owner = std::move(*decoded);
    }
    result.value = encoder_.encode(withdrawals_.list(owner));
    return result;
  }
  if (path == "/bank/balance") {
    auto account = encoder_.try_decode<std::string>(data);
    if (!account) {
      return invalid_key("a SCALE string account");
    }
    result.value = encoder_.encode(bank_.balance(*account));
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path " + std::string{path}, data,
                          last_committed_height_);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

void engine::set_chain_reader(
    std::shared_ptr<portage::bridge::chain_reader> reader) {
  auto lock = std::scoped_lock{mutex_};
  reader_ = std::move(reader);
  spdlog::info("External chain reader {}", reader_ ? "attached" : "detached");
}

hash32_t engine::chain_id() const {
  auto lock = std::scoped_lock{mutex_};
  return chain_id_;
}

void engine::load_persisted_state() {
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_app_hash_ = committed->app_hash;
    pending_app_hash_ = committed->app_hash;
  }
  auto chain_id_key = key::make_chain_id_key(encoder_);
  if (auto stored = storage_.get<hash32_t>(encoder_,
                                           make_bytes_view(chain_id_key))) {
    chain_id_ = *stored;
  }
}

}  // namespace portage::execution
