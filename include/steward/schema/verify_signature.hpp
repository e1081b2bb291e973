#pragma once
#include <steward/schema/primitives.hpp>

// Schema type: verify signature.
// Detached Ed25519 check that must directly precede every mutating
// instruction. `message` carries the canonical signing bytes of the
// instruction it authorizes.
namespace steward::schema {

template <uint16_t Version>
struct verify_signature;

template <>
struct verify_signature<1> final {
  uint16_t version{1};
  public_key_t public_key{};
  signature_t signature{};
  bytes_t message;
};

using verify_signature_t = verify_signature<1>;

}  // namespace steward::schema
