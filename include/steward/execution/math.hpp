#pragma once

#include <steward/schema/primitives.hpp>
#include <limits>
#include <optional>

namespace steward::execution::math {

template <typename T>
std::optional<T> checked_add(const T& lhs, const T& rhs) {
  if constexpr (std::numeric_limits<T>::is_signed) {
    if (rhs < 0) {
      if (lhs < std::numeric_limits<T>::min() - rhs) {
        return std::nullopt;
      }
      return lhs + rhs;
    }
  }
  if (lhs > std::numeric_limits<T>::max() - rhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

// Unsigned only.
template <typename T>
std::optional<T> checked_sub(const T& lhs, const T& rhs) {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return lhs - rhs;
}

/// yes * 10000 / (yes + no), computed in 256 bits. Empty when no stake was
/// cast.
std::optional<steward::schema::basis_points_t> approval_ratio_bps(
    const steward::schema::stake_total_t& yes_stake,
    const steward::schema::stake_total_t& no_stake);

/// Passing requires a strict majority of stake.
inline constexpr steward::schema::basis_points_t kPassThresholdBps = 5'000;

/// Reserve value over liabilities in basis points. index_value is scaled by
/// 1e6. Empty when there are no liabilities; saturates at uint64 max.
std::optional<uint64_t> vault_health_ratio_bps(
    const steward::schema::amount_t& reserve_units,
    uint64_t index_value,
    const steward::schema::amount_t& liabilities);

/// amount <= base * cap_bps / 10000, without truncation.
bool within_cap(const steward::schema::amount_t& amount,
                const steward::schema::amount_t& base,
                steward::schema::basis_points_t cap_bps);

}  // namespace steward::execution::math
