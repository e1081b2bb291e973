#pragma once
#include <steward/schema/primitives.hpp>
#include <string>

// Schema types: circuit breaker actions.
// All three are authority-only. Only resume skips the delay.
namespace steward::schema {

template <uint16_t Version>
struct request_circuit_breaker;

template <>
struct request_circuit_breaker<1> final {
  uint16_t version{1};
  public_key_t authority{};
  std::string reason;
};

using request_circuit_breaker_t = request_circuit_breaker<1>;

template <uint16_t Version>
struct activate_circuit_breaker;

template <>
struct activate_circuit_breaker<1> final {
  uint16_t version{1};
  public_key_t authority{};
};

using activate_circuit_breaker_t = activate_circuit_breaker<1>;

template <uint16_t Version>
struct resume_operations;

template <>
struct resume_operations<1> final {
  uint16_t version{1};
  public_key_t authority{};
};

using resume_operations_t = resume_operations<1>;

}  // namespace steward::schema
