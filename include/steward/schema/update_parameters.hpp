#pragma once
#include <steward/schema/primitives.hpp>
#include <steward/schema/protocol_parameters.hpp>

namespace steward::schema {

template <uint16_t Version>
struct update_parameters;

template <>
struct update_parameters<1> final {
  uint16_t version{1};
  public_key_t authority{};
  protocol_parameters_t parameters{};
};

using update_parameters_t = update_parameters<1>;

}  // namespace steward::schema
