#pragma once

#include <steward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: vault health level.
namespace steward::schema {

enum class health_level_t : uint8_t { healthy = 0, warning = 1, critical = 2 };

inline constexpr auto kHealthLevelMappings = std::array{
    enum_mapping_t<health_level_t>{"healthy", health_level_t::healthy},
    enum_mapping_t<health_level_t>{"warning", health_level_t::warning},
    enum_mapping_t<health_level_t>{"critical", health_level_t::critical}};

template <>
inline std::optional<health_level_t> try_from_string<health_level_t>(
    const std::string_view value) {
  return from_string(value, kHealthLevelMappings);
}

inline constexpr std::string_view to_string(const health_level_t value) {
  return to_string(value, kHealthLevelMappings);
}

}  // namespace steward::schema
