#pragma once
#include <steward/schema/oracle_reading.hpp>
#include <steward/schema/primitives.hpp>

namespace steward::schema {

template <uint16_t Version>
struct oracle_state;

template <>
struct oracle_state<1> final {
  uint16_t version{1};
  oracle_reading_t reading{};
  timestamp_seconds_t accepted_at{};
  slot_t accepted_slot{};
  uint64_t update_count{};
};

using oracle_state_t = oracle_state<1>;

}  // namespace steward::schema
