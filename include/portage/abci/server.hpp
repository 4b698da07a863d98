#pragma once

#include <tendermint/abci/types.grpc.pb.h>
#include <portage/execution/engine.hpp>

namespace portage::abci {

/// ABCI callback listener used by CometBFT to drive application execution.
///
/// Quick reference (ABCI++):
/// - Echo/Flush: liveness and flush barriers.
/// - Info/InitChain: handshake, genesis balances and initial app hash.
/// - CheckTx: mempool admission checks; no state mutation.
/// - PrepareProposal: proposer-side tx selection/filtering.
/// - ProcessProposal: validator-side proposal accept/reject decision.
/// - FinalizeBlock: execute block, run bridge hooks, return app_hash.
/// - Commit: persist finalized state.
/// - Snapshot methods: state sync is not offered; empty or reject answers.
/// - Vote extensions: unused; empty extension, always accepted.
struct listener final : public tendermint::abci::ABCI::CallbackService {
  explicit listener(portage::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestEcho* request,
      tendermint::abci::ResponseEcho* response) override final;

  virtual grpc::ServerUnaryReactor* Flush(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestFlush* request,
      tendermint::abci::ResponseFlush* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestInfo* request,
      tendermint::abci::ResponseInfo* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestCheckTx* request,
      tendermint::abci::ResponseCheckTx* response) override final;

  /// Read query against current state; see engine::query for routes.
  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestQuery* request,
      tendermint::abci::ResponseQuery* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestCommit* request,
      tendermint::abci::ResponseCommit* response) override final;

  /// Fails the call with INVALID_ARGUMENT when app_state_bytes is not a
  /// valid genesis document.
  virtual grpc::ServerUnaryReactor* InitChain(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestInitChain* request,
      tendermint::abci::ResponseInitChain* response) override final;

  virtual grpc::ServerUnaryReactor* ListSnapshots(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestListSnapshots* request,
      tendermint::abci::ResponseListSnapshots* response) override final;

  virtual grpc::ServerUnaryReactor* OfferSnapshot(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestOfferSnapshot* request,
      tendermint::abci::ResponseOfferSnapshot* response) override final;

  virtual grpc::ServerUnaryReactor* LoadSnapshotChunk(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestLoadSnapshotChunk* request,
      tendermint::abci::ResponseLoadSnapshotChunk* response) override final;

  virtual grpc::ServerUnaryReactor* ApplySnapshotChunk(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestApplySnapshotChunk* request,
      tendermint::abci::ResponseApplySnapshotChunk* response) override final;

  /// Keeps transactions that pass CheckTx, in order, under max_tx_bytes.
  virtual grpc::ServerUnaryReactor* PrepareProposal(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestPrepareProposal* request,
      tendermint::abci::ResponsePrepareProposal* response) override final;

  virtual grpc::ServerUnaryReactor* ProcessProposal(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestProcessProposal* request,
      tendermint::abci::ResponseProcessProposal* response) override final;

  virtual grpc::ServerUnaryReactor* ExtendVote(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestExtendVote* request,
      tendermint::abci::ResponseExtendVote* response) override final;

  virtual grpc::ServerUnaryReactor* VerifyVoteExtension(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestVerifyVoteExtension* request,
      tendermint::abci::ResponseVerifyVoteExtension* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestFinalizeBlock* request,
      tendermint::abci::ResponseFinalizeBlock* response) override final;

  portage::execution::engine& execution_engine_;
};

}  // namespace portage::abci
