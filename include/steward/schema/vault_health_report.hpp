#pragma once
#include <steward/schema/circuit_breaker_state.hpp>
#include <steward/schema/health_level.hpp>
#include <steward/schema/primitives.hpp>
#include <optional>

// Schema type: vault health report.
// Answer of the /state/health route. Combines the last assessment with oracle
// staleness at query time.
namespace steward::schema {

template <uint16_t Version>
struct vault_health_report;

template <>
struct vault_health_report<1> final {
  uint16_t version{1};
  std::optional<uint64_t> vhr_bps;
  health_level_t health{health_level_t::healthy};
  breaker_phase_t breaker{breaker_phase_t::idle};
  bool oracle_stale{};
  std::optional<timestamp_seconds_t> last_oracle_update_at;
  bool breaker_request_recommended{};
};

using vault_health_report_t = vault_health_report<1>;

}  // namespace steward::schema
