#pragma once
#include <steward/schema/primitives.hpp>
#include <steward/schema/protocol_parameters.hpp>

// Schema type: initialize protocol.
// One-time creation of GlobalState. Signed by the authority being installed.
namespace steward::schema {

template <uint16_t Version>
struct initialize_protocol;

template <>
struct initialize_protocol<1> final {
  uint16_t version{1};
  public_key_t authority{};
  public_key_t oracle{};
  public_key_t settlement_service{};
  public_key_t reserve_vault{};
  public_key_t token_mint{};
  protocol_parameters_t parameters{};
};

using initialize_protocol_t = initialize_protocol<1>;

}  // namespace steward::schema
