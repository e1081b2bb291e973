#pragma once

#include <steward/substrate/v1/substrate.grpc.pb.h>
#include <steward/execution/engine.hpp>
#include <mutex>

namespace steward::substrate {

/// Callback listener the ordering substrate drives.
///
/// Quick reference:
/// - Info: handshake; last committed height and state root.
/// - CheckTx: mempool admission; no state mutation.
/// - FinalizeBlock: execute an ordered block and return results + state root.
/// - Commit: persist the finalized block.
/// - Query: read committed state.
///
/// Every call takes the same mutex, so the engine sees one caller at a time.
struct listener final : public steward::substrate::v1::Substrate::CallbackService {
  explicit listener(steward::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const steward::substrate::v1::InfoRequest* request,
      steward::substrate::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const steward::substrate::v1::CheckTxRequest* request,
      steward::substrate::v1::CheckTxResponse* response) override final;

  /// Execute ordered block transactions at (height, time).
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const steward::substrate::v1::FinalizeBlockRequest* request,
      steward::substrate::v1::FinalizeBlockResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const steward::substrate::v1::CommitRequest* request,
      steward::substrate::v1::CommitResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const steward::substrate::v1::QueryRequest* request,
      steward::substrate::v1::QueryResponse* response) override final;

  steward::execution::engine& execution_engine_;
  std::mutex mutex_;
};

}  // namespace steward::substrate
