#pragma once

#include <steward/schema/primitives.hpp>
#include <optional>

namespace steward::crypto {

/// True when the linked OpenSSL provides Ed25519.
bool available();

/// Verify a detached Ed25519 signature over `message`.
bool verify_signature(const steward::schema::bytes_view_t& message,
                      const steward::schema::public_key_t& public_key,
                      const steward::schema::signature_t& signature);

/// Ed25519 signing from a raw 32-byte seed. Used by steward-tx and tests;
/// the engine itself only verifies.
std::optional<steward::schema::public_key_t> derive_public_key(
    const steward::schema::hash32_t& seed);

std::optional<steward::schema::signature_t> sign(
    const steward::schema::bytes_view_t& message,
    const steward::schema::hash32_t& seed);

}  // namespace steward::crypto
