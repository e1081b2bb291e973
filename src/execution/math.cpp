#include <steward/execution/math.hpp>
#include <steward/schema/oracle_reading.hpp>

namespace steward::execution::math {

using steward::schema::wide_t;

std::optional<steward::schema::basis_points_t> approval_ratio_bps(
    const steward::schema::stake_total_t& yes_stake,
    const steward::schema::stake_total_t& no_stake) {
  const auto total = wide_t{yes_stake} + wide_t{no_stake};
  if (total == 0) {
    return std::nullopt;
  }
  const auto ratio =
      wide_t{yes_stake} * steward::schema::kBasisPointsDenominator / total;
  return static_cast<steward::schema::basis_points_t>(ratio);
}

std::optional<uint64_t> vault_health_ratio_bps(
    const steward::schema::amount_t& reserve_units,
    const uint64_t index_value,
    const steward::schema::amount_t& liabilities) {
  if (liabilities == 0) {
    return std::nullopt;
  }
  const auto reserve_value = wide_t{reserve_units} * index_value /
                             steward::schema::kIndexValueScale;
  const auto ratio = reserve_value * steward::schema::kBasisPointsDenominator /
                     wide_t{liabilities};
  if (ratio > std::numeric_limits<uint64_t>::max()) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(ratio);
}

bool within_cap(const steward::schema::amount_t& amount,
                const steward::schema::amount_t& base,
                const steward::schema::basis_points_t cap_bps) {
  return wide_t{amount} * steward::schema::kBasisPointsDenominator <=
         wide_t{base} * cap_bps;
}

}  // namespace steward::execution::math
