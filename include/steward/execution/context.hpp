#pragma once

#include <steward/execution/engine_config.hpp>
#include <steward/execution/state_overlay.hpp>
#include <steward/schema/encoding/scale/encoder.hpp>
#include <steward/schema/global_state.hpp>
#include <steward/schema/primitives.hpp>
#include <steward/schema/transaction_error_code.hpp>
#include <steward/schema/transaction_event.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace steward::execution {

using encoder_t = steward::schema::encoding::encoder<
    steward::schema::encoding::scale_encoder_tag>;

/// Deterministic rejection of one transaction. All of its writes are dropped.
struct tx_failure final {
  steward::schema::transaction_error_code code{};
  std::string log;
};

/// Empty on success.
using tx_status_t = std::optional<tx_failure>;

inline tx_status_t fail(const steward::schema::transaction_error_code code,
                        std::string log) {
  return tx_failure{.code = code, .log = std::move(log)};
}

using event_attributes_t = std::vector<std::pair<std::string, std::string>>;

/// State and block environment handed to every instruction handler.
class execution_context final {
 public:
  execution_context(state_overlay& state,
                    encoder_t& encoder,
                    const engine_config& config,
                    const steward::schema::hash32_t& chain_id,
                    uint64_t height,
                    steward::schema::timestamp_seconds_t now);

  template <typename T>
  std::optional<T> load(const steward::schema::bytes_t& key) const {
    auto raw = state_.get(steward::schema::bytes_view_t{key});
    if (!raw) {
      return std::nullopt;
    }
    return encoder_.decode<T>(steward::schema::bytes_view_t{*raw});
  }

  template <typename T>
  void store(steward::schema::bytes_t key, const T& value) {
    state_.put(std::move(key), encoder_.encode(value));
  }

  bool exists(const steward::schema::bytes_t& key) const;

  std::optional<steward::schema::global_state_t> load_global() const;
  void store_global(const steward::schema::global_state_t& global);

  void emit(std::string type, event_attributes_t attributes);
  void set_data(steward::schema::bytes_t data);

  encoder_t& encoder() { return encoder_; }
  const engine_config& config() const { return config_; }
  const steward::schema::hash32_t& chain_id() const { return chain_id_; }
  uint64_t height() const { return height_; }
  steward::schema::timestamp_seconds_t now() const { return now_; }

  std::vector<steward::schema::transaction_event_t>& events() {
    return events_;
  }
  steward::schema::bytes_t& data() { return data_; }

 private:
  state_overlay& state_;
  encoder_t& encoder_;
  const engine_config& config_;
  steward::schema::hash32_t chain_id_;
  uint64_t height_{};
  steward::schema::timestamp_seconds_t now_{};
  std::vector<steward::schema::transaction_event_t> events_;
  steward::schema::bytes_t data_;
};

/// Fails with protocol_not_initialized when GlobalState is missing.
tx_status_t require_global(const execution_context& ctx,
                           steward::schema::global_state_t& out);

/// Fails with unauthorized unless `caller` is the configured authority.
tx_status_t require_authority(const steward::schema::global_state_t& global,
                              const steward::schema::public_key_t& caller);

std::string to_hex(const steward::schema::public_key_t& key);

}  // namespace steward::execution
