#pragma once
#include <steward/schema/enum_string.hpp>
#include <steward/schema/primitives.hpp>
#include <array>
#include <optional>
#include <string_view>
#include <variant>

// Schema type: circuit breaker state.
// Reserve safety workflow: idle -> requested(at) -> active(at) -> idle.
namespace steward::schema {

struct breaker_idle_t final {
  std::optional<timestamp_seconds_t> resumed_at;
};

struct breaker_requested_t final {
  timestamp_seconds_t requested_at{};
};

struct breaker_active_t final {
  timestamp_seconds_t requested_at{};
  timestamp_seconds_t activated_at{};
};

using circuit_breaker_state_t =
    std::variant<breaker_idle_t, breaker_requested_t, breaker_active_t>;

enum class breaker_phase_t : uint8_t { idle = 0, requested = 1, active = 2 };

inline constexpr auto kBreakerPhaseMappings = std::array{
    enum_mapping_t<breaker_phase_t>{"idle", breaker_phase_t::idle},
    enum_mapping_t<breaker_phase_t>{"requested", breaker_phase_t::requested},
    enum_mapping_t<breaker_phase_t>{"active", breaker_phase_t::active}};

inline constexpr std::string_view to_string(const breaker_phase_t value) {
  return to_string(value, kBreakerPhaseMappings);
}

inline breaker_phase_t phase_of(const circuit_breaker_state_t& state) {
  return static_cast<breaker_phase_t>(state.index());
}

inline bool is_active(const circuit_breaker_state_t& state) {
  return std::holds_alternative<breaker_active_t>(state);
}

}  // namespace steward::schema
