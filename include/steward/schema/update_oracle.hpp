#pragma once
#include <steward/schema/oracle_reading.hpp>
#include <steward/schema/primitives.hpp>

// Schema type: update oracle.
// Submitted by the configured oracle reporter; every field is re-validated.
namespace steward::schema {

template <uint16_t Version>
struct update_oracle;

template <>
struct update_oracle<1> final {
  uint16_t version{1};
  public_key_t reporter{};
  oracle_reading_t reading{};
};

using update_oracle_t = update_oracle<1>;

}  // namespace steward::schema
