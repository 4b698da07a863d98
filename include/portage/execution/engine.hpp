#pragma once

#include <portage/bank/ledger.hpp>
#include <portage/bridge/chain_reader.hpp>
#include <portage/bridge/deposit_settlement.hpp>
#include <portage/bridge/params.hpp>
#include <portage/bridge/withdrawals.hpp>
#include <portage/execution/signature_verifier.hpp>
#include <portage/schema/app_info.hpp>
#include <portage/schema/block_result.hpp>
#include <portage/schema/commit_result.hpp>
#include <portage/schema/encoding/scale/encoder.hpp>
#include <portage/schema/primitives.hpp>
#include <portage/schema/query_result.hpp>
#include <portage/schema/transaction.hpp>
#include <portage/schema/transaction_error_code.hpp>
#include <portage/schema/transaction_result.hpp>
#include <portage/state/store.hpp>
#include <portage/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portage::execution {

/// Deterministic bridge state machine used by the ABCI server.
///
/// The engine validates transaction envelopes, dispatches bridge entry
/// points, runs the block-end deposit and signing hooks, stages every write
/// in a block overlay and flushes it at Commit.
class engine final {
 public:
  /// Construct the engine over an opened storage backend.
  ///
  /// `require_strict_crypto` enables real signature verification; when false,
  /// envelope signatures are not checked (local networks only).
  engine(portage::schema::encoding::scale_encoder_t& encoder,
         portage::storage::storage<portage::storage::rocksdb_storage_tag>&
             storage,
         portage::bridge::params params = {},
         bool require_strict_crypto = true);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Decodes and validates the envelope only; never mutates state.
  portage::schema::transaction_result_t check_transaction(
      const portage::schema::bytes_view_t& raw_tx);

  /// Validate a transaction while building or checking a proposal.
  portage::schema::transaction_result_t process_proposal_transaction(
      const portage::schema::bytes_view_t& raw_tx);

  /// Apply genesis: chain id and initial balances from `app_state` JSON.
  ///
  /// Genesis state is persisted immediately at `initial_height - 1`. Returns
  /// the resulting app hash, or std::nullopt with `error` set when the
  /// genesis document is invalid.
  std::optional<portage::schema::hash32_t> init_chain(
      std::string_view chain_id,
      const portage::schema::bytes_view_t& app_state,
      int64_t initial_height,
      std::string& error);

  /// Execute a block and compute its app hash.
  ///
  /// Transactions run in order, each in its own write scope; per-tx results
  /// are returned even on failures. The deposit ingestion, gap scan and
  /// withdrawal auto-signing hooks run after the last transaction.
  portage::schema::block_result_t finalize_block(
      uint64_t height,
      uint64_t block_time,
      const std::vector<portage::schema::bytes_t>& txs);

  /// Flush the finalized block's writes and checkpoint atomically.
  portage::schema::commit_result_t commit();

  /// Latest committed height and app hash.
  portage::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  portage::schema::query_result_t query(
      std::string_view path,
      const portage::schema::bytes_view_t& data);

  /// Install runtime signature verifier callback.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Attach the L2 reader; nullptr disables every bridge path that reads
  /// the L2.
  void set_chain_reader(std::shared_ptr<portage::bridge::chain_reader> reader);

  portage::schema::hash32_t chain_id() const;

 private:
  portage::schema::transaction_result_t validate_transaction(
      const portage::schema::transaction_t& tx,
      std::string_view codespace);

  portage::schema::transaction_result_t execute_operation(
      const portage::schema::transaction_t& tx);

  portage::schema::transaction_result_t process_deposit(
      const portage::schema::process_deposit_t& payload,
      std::vector<portage::schema::transaction_event_t>& events);

  void run_block_hooks(
      uint64_t block_time,
      std::vector<portage::schema::transaction_event_t>& events);

  uint64_t signer_nonce(const portage::schema::signer_id_t& signer) const;

  void load_persisted_state();

  mutable std::mutex mutex_;
  portage::schema::encoding::scale_encoder_t& encoder_;
  portage::storage::storage<portage::storage::rocksdb_storage_tag>& storage_;
  portage::state::store store_;
  portage::bank::ledger bank_;
  portage::bridge::deposit_settlement deposits_;
  portage::bridge::withdrawal_ledger withdrawals_;
  portage::bridge::params params_;
  std::shared_ptr<portage::bridge::chain_reader> reader_;
  int64_t last_committed_height_{};
  portage::schema::hash32_t last_committed_app_hash_{};
  int64_t pending_height_{};
  portage::schema::hash32_t pending_app_hash_{};
  uint64_t current_block_time_{};
  portage::schema::hash32_t chain_id_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace portage::execution
