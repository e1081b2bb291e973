#include <spdlog/spdlog.h>
#include <steward/blake3/hash.hpp>
#include <steward/common/critical.hpp>
#include <steward/crypto/verify.hpp>
#include <steward/execution/auth_gate.hpp>
#include <steward/execution/circuit_breaker.hpp>
#include <steward/execution/engine.hpp>
#include <steward/execution/health_monitor.hpp>
#include <steward/execution/oracle_gate.hpp>
#include <steward/execution/proposal_registry.hpp>
#include <steward/execution/protocol_state.hpp>
#include <steward/execution/reserve_custody.hpp>
#include <steward/execution/voting_ledger.hpp>
#include <steward/schema/agent_state.hpp>
#include <steward/schema/key/engine_keys.hpp>
#include <steward/schema/oracle_state.hpp>
#include <steward/schema/policy_proposal.hpp>
#include <steward/schema/query_error_code.hpp>
#include <steward/schema/vault_state.hpp>
#include <steward/schema/vote_record.hpp>
#include <algorithm>
#include <exception>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace steward::schema;

namespace {

constexpr auto kCheckCodespace = std::string_view{"steward.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"steward.finalize"};
constexpr auto kQueryCodespace = std::string_view{"steward.query"};
constexpr int64_t kGasPerInstruction = 1000;

std::optional<transaction_t> decode_transaction(
    steward::execution::encoder_t& encoder,
    const bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  try {
    auto tx = encoder.try_decode<transaction_t>(raw_tx);
    if (!tx) {
      error = "malformed transaction encoding";
    }
    return tx;
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

template <typename T>
std::optional<T> decode_query_key(steward::execution::encoder_t& encoder,
                                  const bytes_view_t& data) {
  try {
    return encoder.try_decode<T>(data);
  } catch (const std::exception& ex) {
    spdlog::debug("Rejecting malformed query key: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace

namespace steward::execution {

std::optional<std::string> validate_config(const engine_config& config) {
  if (config.chain_name.empty()) {
    return "chain name must not be empty";
  }
  if (config.execution_delay <= 0) {
    return "execution delay must be positive";
  }
  if (config.circuit_breaker_delay <= 0) {
    return "circuit breaker delay must be positive";
  }
  if (config.min_voting_period <= 0 ||
      config.min_voting_period > config.max_voting_period) {
    return "voting period bounds must satisfy 0 < min <= max";
  }
  if (config.oracle_min_interval <= 0) {
    return "oracle minimum interval must be positive";
  }
  if (config.oracle_stale_after <= 0) {
    return "oracle staleness window must be positive";
  }
  return std::nullopt;
}

engine::engine(encoder_t& encoder, storage_t& storage, engine_config config)
    : encoder_{encoder},
      storage_{storage},
      config_{std::move(config)},
      chain_id_{steward::blake3::hash(std::string_view{config_.chain_name})},
      signature_verifier_{steward::crypto::verify_signature},
      block_state_{[this](const bytes_view_t& key) { return storage_.get(key); }} {
  if (auto reason = validate_config(config_)) {
    steward::common::critical("Invalid engine configuration: " + *reason);
  }
  if (config_.require_strict_crypto && !steward::crypto::available()) {
    spdlog::warn("Strict crypto requested but OpenSSL lacks Ed25519");
  }
  if (!config_.require_strict_crypto) {
    spdlog::warn("Signature verification disabled; structural checks only");
  }
  load_persisted_state();
  spdlog::info("Execution engine for chain '{}' ready at height {}",
               config_.chain_name, last_committed_height_);
}

transaction_result_t engine::check_transaction(
    const bytes_view_t& raw_tx) const {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kCheckCodespace);
  }
  if (auto rejected = validate_envelope(*maybe_tx, kCheckCodespace)) {
    return *rejected;
  }

  for (std::size_t i = 0; i < maybe_tx->instructions.size(); ++i) {
    const auto& instruction = maybe_tx->instructions[i];
    auto failure =
        std::holds_alternative<verify_signature_t>(instruction)
            ? verify_signature_step(std::get<verify_signature_t>(instruction),
                                    signature_verifier_,
                                    config_.require_strict_crypto)
            : check_preceding_verification(*maybe_tx, i);
    if (failure) {
      return make_error_result(failure->code, failure->log,
                               "instruction " + std::to_string(i),
                               kCheckCodespace);
    }
  }

  auto result = transaction_result_t{};
  result.gas_wanted =
      kGasPerInstruction * static_cast<int64_t>(maybe_tx->instructions.size());
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  if (static_cast<int64_t>(height) <= last_committed_height_ ||
      block_time < last_committed_block_time_) {
    spdlog::error(
        "Rejecting block {} at time {}: last committed height {} time {}",
        height, block_time, last_committed_height_, last_committed_block_time_);
    for (std::size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_block, "invalid block",
          "height and block time must advance", kFinalizeCodespace));
    }
    result.state_root = last_committed_state_root_;
    return result;
  }
  if (pending_) {
    spdlog::warn("Discarding uncommitted block at height {}", pending_->height);
    block_state_.clear();
    pending_.reset();
  }

  auto hasher = steward::blake3::hasher{};
  hasher.update(bytes_view_t{last_committed_state_root_})
      .update(bytes_view_t{encoder_.encode(std::tuple{height, block_time})});

  for (std::size_t i = 0; i < txs.size(); ++i) {
    const auto raw = bytes_view_t{txs[i]};
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(encoder_, raw, decode_error);

    auto tx_result = transaction_result_t{};
    if (!maybe_tx) {
      tx_result = make_error_result(transaction_error_code::invalid_transaction,
                                    "invalid transaction", decode_error,
                                    kFinalizeCodespace);
    } else if (auto rejected =
                   validate_envelope(*maybe_tx, kFinalizeCodespace)) {
      tx_result = std::move(*rejected);
    } else {
      tx_result = execute_transaction(*maybe_tx, height, block_time);
    }

    const auto index = static_cast<uint32_t>(i);
    block_state_.put(
        steward::schema::key::make_history_key(encoder_, height, index),
        encoder_.encode(history_entry_t{.height = height,
                                        .index = index,
                                        .code = tx_result.code,
                                        .block_time = block_time,
                                        .tx = txs[i]}));
    if (tx_result.code == 0) {
      hasher.update(raw).update(bytes_view_t{encoder_.encode(index)});
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  for (const auto& [key, value] : block_state_.writes()) {
    hasher.update(bytes_view_t{key}).update(bytes_view_t{value});
  }
  result.state_root = hasher.finalize();
  pending_ = pending_block{.height = static_cast<int64_t>(height),
                           .block_time = block_time,
                           .state_root = result.state_root};
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

commit_result_t engine::commit() {
  if (pending_) {
    storage_.commit(
        steward::storage::committed_state{.height = pending_->height,
                                          .state_root = pending_->state_root,
                                          .block_time = pending_->block_time},
        block_state_.writes());
    last_committed_height_ = pending_->height;
    last_committed_state_root_ = pending_->state_root;
    last_committed_block_time_ = pending_->block_time;
    block_state_.clear();
    pending_.reset();
    spdlog::info("Committed height {} state root {}", last_committed_height_,
                 to_hex(last_committed_state_root_));
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  const auto not_found = [&](std::string log) {
    return make_query_error(query_error_code::not_found, std::move(log), data,
                            last_committed_height_);
  };
  const auto invalid_key = [&]() {
    return make_query_error(query_error_code::invalid_key,
                            "query key does not decode", data,
                            last_committed_height_);
  };
  const auto load_global = [&]() {
    return storage_.get<global_state_t>(
        encoder_, steward::schema::key::make_global_key(encoder_));
  };
  const auto load_vault = [&]() {
    return storage_
        .get<vault_state_t>(encoder_,
                            steward::schema::key::make_vault_key(encoder_))
        .value_or(vault_state_t{});
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }

  if (path == "/state/global") {
    auto global = load_global();
    if (!global) {
      return not_found("protocol not initialized");
    }
    result.value = encoder_.encode(*global);
    return result;
  }

  if (path == "/state/proposal") {
    auto id = decode_query_key<proposal_id_t>(encoder_, data);
    if (!id) {
      return invalid_key();
    }
    auto proposal = storage_.get<policy_proposal_t>(
        encoder_, steward::schema::key::make_proposal_key(encoder_, *id));
    if (!proposal) {
      return not_found("proposal not found");
    }
    result.value = encoder_.encode(*proposal);
    return result;
  }

  if (path == "/state/vote") {
    auto vote_key =
        decode_query_key<std::tuple<proposal_id_t, agent_id_t>>(encoder_, data);
    if (!vote_key) {
      return invalid_key();
    }
    auto vote = storage_.get<vote_record_t>(
        encoder_, steward::schema::key::make_vote_key(
                      encoder_, std::get<0>(*vote_key), std::get<1>(*vote_key)));
    if (!vote) {
      return not_found("vote not found");
    }
    result.value = encoder_.encode(*vote);
    return result;
  }

  if (path == "/state/votes") {
    auto id = decode_query_key<proposal_id_t>(encoder_, data);
    if (!id) {
      return invalid_key();
    }
    auto votes = std::vector<vote_record_t>{};
    const auto prefix =
        steward::schema::key::make_vote_prefix_key(encoder_, *id);
    for (const auto& [key, value] :
         storage_.list_by_prefix(bytes_view_t{prefix})) {
      votes.push_back(encoder_.decode<vote_record_t>(bytes_view_t{value}));
    }
    result.value = encoder_.encode(votes);
    return result;
  }

  if (path == "/state/agent") {
    auto agent = decode_query_key<public_key_t>(encoder_, data);
    if (!agent) {
      return invalid_key();
    }
    auto state = storage_
                     .get<agent_state_t>(encoder_,
                                         steward::schema::key::make_agent_key(
                                             encoder_, *agent))
                     .value_or(agent_state_t{.agent = *agent});
    result.value = encoder_.encode(state);
    return result;
  }

  if (path == "/state/oracle") {
    auto oracle = storage_.get<oracle_state_t>(
        encoder_, steward::schema::key::make_oracle_key(encoder_));
    if (!oracle) {
      return not_found("no oracle reading admitted");
    }
    result.value = encoder_.encode(*oracle);
    return result;
  }

  if (path == "/state/vault") {
    result.value = encoder_.encode(load_vault());
    return result;
  }

  if (path == "/state/health") {
    auto global = load_global();
    if (!global) {
      return not_found("protocol not initialized");
    }
    result.value = encoder_.encode(health_monitor::report(
        *global, load_vault(), last_committed_block_time_,
        config_.oracle_stale_after));
    return result;
  }

  if (path == "/history/range") {
    auto range = decode_query_key<std::tuple<uint64_t, uint64_t>>(encoder_, data);
    if (!range) {
      return invalid_key();
    }
    if (std::get<0>(*range) > std::get<1>(*range)) {
      return make_query_error(query_error_code::invalid_range,
                              "from_height exceeds to_height", data,
                              last_committed_height_);
    }
    result.value =
        encoder_.encode(history(std::get<0>(*range), std::get<1>(*range)));
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data,
                          last_committed_height_);
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto entries = std::vector<history_entry_t>{};
  const auto prefix = steward::schema::key::make_prefix_key(
      encoder_, steward::schema::key::kHistoryPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    auto entry = encoder_.decode<history_entry_t>(bytes_view_t{value});
    if (entry.height > to_height) {
      break;
    }
    if (entry.height >= from_height) {
      entries.push_back(std::move(entry));
    }
  }
  return entries;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  signature_verifier_ = std::move(verifier);
}

std::optional<transaction_result_t> engine::validate_envelope(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id",
                             "transaction targets another chain", codespace);
  }
  if (tx.instructions.empty()) {
    return make_error_result(transaction_error_code::empty_transaction,
                             "empty transaction", "no instructions",
                             codespace);
  }
  return std::nullopt;
}

tx_status_t engine::execute_instruction(execution_context& ctx,
                                        const transaction_t& tx,
                                        const std::size_t index) const {
  const auto& instruction = tx.instructions[index];
  if (const auto* step = std::get_if<verify_signature_t>(&instruction)) {
    return verify_signature_step(*step, signature_verifier_,
                                 config_.require_strict_crypto);
  }
  if (auto failure = authenticate(ctx, tx, index)) {
    return failure;
  }

  return std::visit(
      overloaded{
          [](const verify_signature_t&) -> tx_status_t { return std::nullopt; },
          [&](const initialize_protocol_t& value) {
            return protocol_state::initialize(ctx, value);
          },
          [&](const update_parameters_t& value) {
            return protocol_state::update_parameters(ctx, value);
          },
          [&](const create_proposal_t& value) {
            return proposal_registry::create(ctx, value);
          },
          [&](const cast_vote_t& value) {
            return voting_ledger::cast(ctx, value);
          },
          [&](const finalize_proposal_t& value) {
            return proposal_registry::finalize(ctx, value);
          },
          [&](const execute_proposal_t& value) {
            return proposal_registry::execute(ctx, value);
          },
          [&](const cancel_proposal_t& value) {
            return proposal_registry::cancel(ctx, value);
          },
          [&](const update_oracle_t& value) {
            return oracle_gate::update(ctx, value);
          },
          [&](const request_circuit_breaker_t& value) {
            return circuit_breaker::request(ctx, value);
          },
          [&](const activate_circuit_breaker_t& value) {
            return circuit_breaker::activate(ctx, value);
          },
          [&](const resume_operations_t& value) {
            return circuit_breaker::resume(ctx, value);
          },
          [&](const settle_vote_t& value) {
            return voting_ledger::settle(ctx, value);
          },
          [&](const deposit_reserve_t& value) {
            return reserve_custody::deposit(ctx, value);
          },
          [&](const withdraw_reserve_t& value) {
            return reserve_custody::withdraw(ctx, value);
          }},
      instruction);
}

transaction_result_t engine::execute_transaction(
    const transaction_t& tx,
    const uint64_t height,
    const timestamp_seconds_t block_time) {
  auto tx_state = state_overlay{
      [this](const bytes_view_t& key) { return block_state_.get(key); }};
  auto ctx = execution_context{tx_state, encoder_, config_,
                               chain_id_, height,   block_time};

  const auto gas =
      kGasPerInstruction * static_cast<int64_t>(tx.instructions.size());
  for (std::size_t i = 0; i < tx.instructions.size(); ++i) {
    if (auto failure = execute_instruction(ctx, tx, i)) {
      spdlog::debug("Transaction rejected at instruction {}: {}", i,
                    failure->log);
      auto result = make_error_result(failure->code, failure->log,
                                      "instruction " + std::to_string(i),
                                      kFinalizeCodespace);
      result.gas_wanted = gas;
      result.gas_used = kGasPerInstruction * static_cast<int64_t>(i + 1);
      return result;
    }
  }

  block_state_.merge(tx_state);
  auto result = transaction_result_t{};
  result.data = std::move(ctx.data());
  result.gas_wanted = gas;
  result.gas_used = gas;
  result.events = std::move(ctx.events());
  return result;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    last_committed_block_time_ = committed->block_time;
  }
}

}  // namespace steward::execution
