#include <steward/execution/context.hpp>
#include <steward/schema/key/engine_keys.hpp>

namespace steward::execution {

execution_context::execution_context(
    state_overlay& state,
    encoder_t& encoder,
    const engine_config& config,
    const steward::schema::hash32_t& chain_id,
    const uint64_t height,
    const steward::schema::timestamp_seconds_t now)
    : state_{state},
      encoder_{encoder},
      config_{config},
      chain_id_{chain_id},
      height_{height},
      now_{now} {}

bool execution_context::exists(const steward::schema::bytes_t& key) const {
  return state_.contains(steward::schema::bytes_view_t{key});
}

std::optional<steward::schema::global_state_t> execution_context::load_global()
    const {
  return load<steward::schema::global_state_t>(
      steward::schema::key::make_global_key(encoder_));
}

void execution_context::store_global(
    const steward::schema::global_state_t& global) {
  store(steward::schema::key::make_global_key(encoder_), global);
}

void execution_context::emit(std::string type, event_attributes_t attributes) {
  auto event = steward::schema::transaction_event_t{.type = std::move(type)};
  event.attributes.reserve(attributes.size());
  for (auto& [key, value] : attributes) {
    event.attributes.push_back(steward::schema::transaction_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = true});
  }
  events_.push_back(std::move(event));
}

void execution_context::set_data(steward::schema::bytes_t data) {
  data_ = std::move(data);
}

tx_status_t require_global(const execution_context& ctx,
                           steward::schema::global_state_t& out) {
  auto global = ctx.load_global();
  if (!global) {
    return fail(steward::schema::transaction_error_code::protocol_not_initialized,
                "protocol not initialized");
  }
  out = std::move(*global);
  return std::nullopt;
}

tx_status_t require_authority(const steward::schema::global_state_t& global,
                              const steward::schema::public_key_t& caller) {
  if (caller != global.authority) {
    return fail(steward::schema::transaction_error_code::unauthorized,
                "caller is not the protocol authority");
  }
  return std::nullopt;
}

std::string to_hex(const steward::schema::public_key_t& key) {
  return steward::schema::to_hex(steward::schema::bytes_view_t{key});
}

}  // namespace steward::execution
