#pragma once
#include <steward/schema/primitives.hpp>

// Schema type: oracle reading.
// Batch delivered by the oracle feed. index_value is scaled by 1e6.
namespace steward::schema {

template <uint16_t Version>
struct oracle_reading;

template <>
struct oracle_reading<1> final {
  uint16_t version{1};
  uint64_t index_value{};
  basis_points_t avg_yield_bps{};
  basis_points_t volatility_bps{};
  uint64_t tvl_usd{};
  timestamp_seconds_t observed_at{};
  slot_t observed_slot{};
};

using oracle_reading_t = oracle_reading<1>;

inline constexpr uint64_t kIndexValueScale = 1'000'000;

}  // namespace steward::schema
