#pragma once

#include <steward/execution/engine.hpp>
#include <steward/schema/global_state.hpp>
#include <steward/schema/oracle_state.hpp>
#include <steward/schema/policy_proposal.hpp>
#include <steward/schema/primitives.hpp>
#include <steward/schema/vault_health_report.hpp>
#include <steward/schema/vault_state.hpp>
#include <steward/schema/vote_record.hpp>
#include <steward/storage/rocksdb/storage.hpp>
#include <steward/testing/common.hpp>
#include <steward/testing/execution_harness.hpp>

#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace steward::testing {

/// Engine over a scratch RocksDB directory with a block clock.
///
/// Each `submit` runs one block at the next height and commits it. Nonces are
/// read back from committed agent state, so callers only supply instructions.
class execution_fixture final {
 public:
  explicit execution_fixture(
      const std::string_view db_prefix,
      steward::execution::engine_config config = {},
      const bool install_allow_all_verifier = true)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{steward::storage::make_storage<
            steward::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, std::move(config)} {
    if (install_allow_all_verifier) {
      engine_.set_signature_verifier(allow_all_verifier());
    }
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  static steward::execution::signature_verifier_t allow_all_verifier() {
    return [](const steward::schema::bytes_view_t&,
              const steward::schema::public_key_t&,
              const steward::schema::signature_t&) { return true; };
  }

  steward::execution::engine& engine() { return engine_; }
  scale_encoder_t& encoder() { return encoder_; }
  const std::string& db_path() const { return db_path_; }

  const steward::schema::public_key_t authority{make_key(0xA0)};
  const steward::schema::public_key_t oracle{make_key(0xB0)};
  const steward::schema::public_key_t settlement{make_key(0xC0)};
  const steward::schema::public_key_t reserve_vault{make_key(0xD0)};
  const steward::schema::public_key_t token_mint{make_key(0xE0)};

  static steward::schema::public_key_t agent(const uint8_t index) {
    return make_key(static_cast<uint8_t>(0x10 + index));
  }

  steward::schema::timestamp_seconds_t now() const { return now_; }
  uint64_t height() const { return height_; }
  void advance(const steward::schema::duration_seconds_t seconds) {
    now_ += seconds;
  }
  /// Leave `count` heights unused before the next block.
  void skip_heights(const uint64_t count) { height_ += count; }

  /// Build a transaction of signed (verify, instruction) pairs. Nonces start
  /// at the committed nonce and count up per identity.
  steward::schema::transaction_t make_transaction(
      const std::vector<steward::schema::instruction_t>& instructions) {
    auto tx = steward::schema::transaction_t{.chain_id = engine_.chain_id()};
    for (const auto& instruction : instructions) {
      const auto identity = steward::execution::acting_identity(instruction);
      auto& nonce = block_nonces_.try_emplace(
                                     *identity, agent_nonce(engine_, *identity))
                        .first->second;
      append_signed(tx, nonce, instruction);
      ++nonce;
    }
    return tx;
  }

  /// Execute `txs` as one block at the next height and commit.
  steward::schema::block_result_t run_block(
      const std::vector<steward::schema::transaction_t>& txs) {
    auto raw = std::vector<steward::schema::bytes_t>{};
    raw.reserve(txs.size());
    for (const auto& tx : txs) {
      raw.push_back(encode_transaction(tx));
    }
    return run_raw_block(raw);
  }

  steward::schema::block_result_t run_raw_block(
      const std::vector<steward::schema::bytes_t>& raw) {
    ++height_;
    auto block = engine_.finalize_block(height_, now_, raw);
    EXPECT_EQ(block.tx_results.size(), raw.size());
    (void)engine_.commit();
    block_nonces_.clear();
    return block;
  }

  /// One instruction in its own transaction and block.
  steward::schema::transaction_result_t submit(
      steward::schema::instruction_t instruction) {
    auto block = run_block({make_transaction({std::move(instruction)})});
    return block.tx_results.front();
  }

  /// Several single-instruction transactions in one block.
  std::vector<steward::schema::transaction_result_t> submit_block(
      const std::vector<steward::schema::instruction_t>& instructions) {
    auto txs = std::vector<steward::schema::transaction_t>{};
    for (const auto& instruction : instructions) {
      txs.push_back(make_transaction({instruction}));
    }
    return run_block(txs).tx_results;
  }

  steward::schema::initialize_protocol_t make_initialize() const {
    return steward::schema::initialize_protocol_t{
        .authority = authority,
        .oracle = oracle,
        .settlement_service = settlement,
        .reserve_vault = reserve_vault,
        .token_mint = token_mint,
        .parameters = make_default_parameters()};
  }

  void initialize() {
    const auto result = submit(make_initialize());
    ASSERT_EQ(result.code, 0u) << result.log;
  }

  /// Create a mint proposal from `proposer` and return its id.
  steward::schema::proposal_id_t create_proposal(
      const steward::schema::public_key_t& proposer,
      steward::schema::policy_payload_t payload =
          steward::schema::mint_supply_t{.amount = 1'000},
      const steward::schema::duration_seconds_t voting_duration = 86'400) {
    const auto result = submit(steward::schema::create_proposal_t{
        .proposer = proposer,
        .payload = std::move(payload),
        .voting_duration = voting_duration});
    EXPECT_EQ(result.code, 0u) << result.log;
    if (result.code != 0) {
      return std::numeric_limits<steward::schema::proposal_id_t>::max();
    }
    return encoder_.decode<steward::schema::proposal_id_t>(
        steward::schema::bytes_view_t{result.data});
  }

  steward::schema::transaction_result_t vote(
      const steward::schema::public_key_t& voter,
      const steward::schema::proposal_id_t id,
      const bool prediction,
      const steward::schema::stake_t stake) {
    return submit(steward::schema::cast_vote_t{.agent = voter,
                                               .proposal_id = id,
                                               .prediction = prediction,
                                               .stake_amount = stake});
  }

  steward::schema::transaction_result_t finalize(
      const steward::schema::proposal_id_t id) {
    return submit(
        steward::schema::finalize_proposal_t{.caller = agent(0),
                                             .proposal_id = id});
  }

  steward::schema::transaction_result_t report_oracle(
      const uint64_t index_value,
      const uint64_t tvl_usd = 50'000'000) {
    return submit(steward::schema::update_oracle_t{
        .reporter = oracle,
        .reading = steward::schema::oracle_reading_t{
            .index_value = index_value,
            .avg_yield_bps = 450,
            .volatility_bps = 1'200,
            .tvl_usd = tvl_usd,
            .observed_at = now_,
            .observed_slot = height_}});
  }

  std::optional<steward::schema::global_state_t> global() const {
    return query_value<steward::schema::global_state_t>(engine_,
                                                        "/state/global");
  }

  std::optional<steward::schema::policy_proposal_t> proposal(
      const steward::schema::proposal_id_t id) {
    return query_value<steward::schema::policy_proposal_t>(
        engine_, "/state/proposal", encoder_.encode(id));
  }

  std::optional<steward::schema::vote_record_t> vote_record(
      const steward::schema::proposal_id_t id,
      const steward::schema::public_key_t& voter) {
    return query_value<steward::schema::vote_record_t>(
        engine_, "/state/vote", encoder_.encode(std::tuple{id, voter}));
  }

  steward::schema::vault_state_t vault() const {
    return query_value<steward::schema::vault_state_t>(engine_, "/state/vault")
        .value_or(steward::schema::vault_state_t{});
  }

  std::optional<steward::schema::vault_health_report_t> health() const {
    return query_value<steward::schema::vault_health_report_t>(
        engine_, "/state/health");
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  steward::storage::storage<steward::storage::rocksdb_storage_tag> storage_;
  steward::execution::engine engine_;
  steward::schema::timestamp_seconds_t now_{kGenesisTime};
  uint64_t height_{};
  std::map<steward::schema::public_key_t, uint64_t> block_nonces_;
};

}  // namespace steward::testing
