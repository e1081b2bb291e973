#pragma once
#include <steward/schema/primitives.hpp>

// Schema types: reserve custody reports.
// Withdrawals are reserve debits and are refused while the breaker is active.
namespace steward::schema {

template <uint16_t Version>
struct deposit_reserve;

template <>
struct deposit_reserve<1> final {
  uint16_t version{1};
  public_key_t authority{};
  amount_t amount{};
};

using deposit_reserve_t = deposit_reserve<1>;

template <uint16_t Version>
struct withdraw_reserve;

template <>
struct withdraw_reserve<1> final {
  uint16_t version{1};
  public_key_t authority{};
  amount_t amount{};
};

using withdraw_reserve_t = withdraw_reserve<1>;

}  // namespace steward::schema
