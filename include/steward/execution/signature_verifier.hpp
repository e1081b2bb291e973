#pragma once

#include <steward/schema/primitives.hpp>
#include <functional>

namespace steward::execution {

using signature_verifier_t =
    std::function<bool(const steward::schema::bytes_view_t& message,
                       const steward::schema::public_key_t& public_key,
                       const steward::schema::signature_t& signature)>;

}  // namespace steward::execution
