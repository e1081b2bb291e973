#pragma once

#include <steward/execution/context.hpp>
#include <steward/execution/engine_config.hpp>
#include <steward/execution/signature_verifier.hpp>
#include <steward/execution/state_overlay.hpp>
#include <steward/schema/app_info.hpp>
#include <steward/schema/block_result.hpp>
#include <steward/schema/commit_result.hpp>
#include <steward/schema/history_entry.hpp>
#include <steward/schema/primitives.hpp>
#include <steward/schema/query_result.hpp>
#include <steward/schema/transaction.hpp>
#include <steward/schema/transaction_result.hpp>
#include <steward/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace steward::execution {

/// Deterministic policy state machine driven by an ordering substrate.
///
/// The engine is single-writer: callers serialize every entry point. Each
/// transaction runs against its own overlay on top of the block overlay, so a
/// failed transaction leaves no trace besides its history row.
class engine final {
 public:
  using storage_t =
      steward::storage::storage<steward::storage::rocksdb_storage_tag>;

  /// Bind the engine to encoder/storage backends and load the last committed
  /// checkpoint. The chain id is derived from `config.chain_name`.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  engine_config config = {});

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;
  engine(engine&&) = delete;
  engine& operator=(engine&&) = delete;

  /// Mempool admission (CheckTx semantics). Decodes and checks envelope,
  /// verification pairing and signatures; never touches state.
  steward::schema::transaction_result_t check_transaction(
      const steward::schema::bytes_view_t& raw_tx) const;

  /// Execute an ordered block. Heights must increase and block time must not
  /// go backwards relative to the last committed block.
  steward::schema::block_result_t finalize_block(
      uint64_t height,
      steward::schema::timestamp_seconds_t block_time,
      const std::vector<steward::schema::bytes_t>& txs);

  /// Persist the finalized block's writes and checkpoint atomically.
  steward::schema::commit_result_t commit();

  steward::schema::app_info_t info() const;

  /// Read-path query against committed state.
  ///
  /// Routes: /engine/info, /state/global, /state/proposal, /state/vote,
  /// /state/votes, /state/agent, /state/oracle, /state/vault, /state/health,
  /// /history/range.
  steward::schema::query_result_t query(
      std::string_view path,
      const steward::schema::bytes_view_t& data) const;

  /// History rows in the inclusive height range.
  std::vector<steward::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Replace the Ed25519 verifier. Only consulted in strict-crypto mode.
  void set_signature_verifier(signature_verifier_t verifier);

  const steward::schema::hash32_t& chain_id() const { return chain_id_; }
  const engine_config& config() const { return config_; }

 private:
  struct pending_block final {
    int64_t height{};
    steward::schema::timestamp_seconds_t block_time{};
    steward::schema::hash32_t state_root;
  };

  std::optional<steward::schema::transaction_result_t> validate_envelope(
      const steward::schema::transaction_t& tx,
      std::string_view codespace) const;

  tx_status_t execute_instruction(execution_context& ctx,
                                  const steward::schema::transaction_t& tx,
                                  std::size_t index) const;

  steward::schema::transaction_result_t execute_transaction(
      const steward::schema::transaction_t& tx,
      uint64_t height,
      steward::schema::timestamp_seconds_t block_time);

  void load_persisted_state();

  encoder_t& encoder_;
  storage_t& storage_;
  engine_config config_;
  steward::schema::hash32_t chain_id_;
  signature_verifier_t signature_verifier_;
  state_overlay block_state_;
  int64_t last_committed_height_{};
  steward::schema::hash32_t last_committed_state_root_{};
  steward::schema::timestamp_seconds_t last_committed_block_time_{};
  std::optional<pending_block> pending_;
};

}  // namespace steward::execution
