#pragma once

#include <steward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: proposal status.
// Governance workflow: active -> passed | failed, passed -> executed,
// active -> cancelled.
namespace steward::schema {

enum class proposal_status_t : uint8_t {
  active = 0,
  passed = 1,
  failed = 2,
  executed = 3,
  cancelled = 4
};

inline constexpr auto kProposalStatusMappings = std::array{
    enum_mapping_t<proposal_status_t>{"active", proposal_status_t::active},
    enum_mapping_t<proposal_status_t>{"passed", proposal_status_t::passed},
    enum_mapping_t<proposal_status_t>{"failed", proposal_status_t::failed},
    enum_mapping_t<proposal_status_t>{"executed", proposal_status_t::executed},
    enum_mapping_t<proposal_status_t>{"cancelled",
                                      proposal_status_t::cancelled}};

template <>
inline std::optional<proposal_status_t> try_from_string<proposal_status_t>(
    const std::string_view value) {
  return from_string(value, kProposalStatusMappings);
}

inline constexpr std::string_view to_string(const proposal_status_t value) {
  return to_string(value, kProposalStatusMappings);
}

// Resolved proposals accept settlement claims.
inline constexpr bool is_resolved(const proposal_status_t value) {
  return value != proposal_status_t::active;
}

}  // namespace steward::schema
