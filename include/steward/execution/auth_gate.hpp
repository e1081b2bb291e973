#pragma once

#include <steward/execution/context.hpp>
#include <steward/execution/signature_verifier.hpp>
#include <steward/schema/transaction.hpp>
#include <cstddef>
#include <optional>
#include <string_view>

namespace steward::execution {

inline constexpr auto kSigningDomain = std::string_view{"steward-sign-v1"};

/// Identity a mutating instruction claims to act as. Empty for
/// verify_signature steps.
std::optional<steward::schema::public_key_t> acting_identity(
    const steward::schema::instruction_t& instruction);

/// Canonical bytes the acting identity signs for `instruction`:
/// SCALE(domain, chain_id, nonce, instruction).
steward::schema::bytes_t make_signing_message(
    encoder_t& encoder,
    const steward::schema::hash32_t& chain_id,
    uint64_t nonce,
    const steward::schema::instruction_t& instruction);

/// Cryptographic half of a verify_signature step. Bypassed when strict
/// crypto is disabled.
tx_status_t verify_signature_step(
    const steward::schema::verify_signature_t& step,
    const signature_verifier_t& verifier,
    bool require_strict_crypto);

/// Structural half of the gate, shared with CheckTx: instruction `index` must
/// be directly preceded by a verification step over the claimed identity.
tx_status_t check_preceding_verification(
    const steward::schema::transaction_t& tx,
    std::size_t index);

/// Authentication gate run by the dispatcher before every mutating
/// instruction. On success the acting identity's nonce is consumed.
tx_status_t authenticate(execution_context& ctx,
                         const steward::schema::transaction_t& tx,
                         std::size_t index);

}  // namespace steward::execution
