#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace steward::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Ed25519 raw public key. Every identity in the protocol (agents, authority,
// oracle reporter, settlement service, reserve references) is one of these.
using public_key_t = std::array<uint8_t, 32>;
using agent_id_t = public_key_t;
using signature_t = std::array<uint8_t, 64>;

using proposal_id_t = uint64_t;
using stake_t = uint64_t;
using stake_total_t = boost::multiprecision::uint128_t;
using amount_t = boost::multiprecision::uint128_t;
using wide_t = boost::multiprecision::uint256_t;
using basis_points_t = uint32_t;
using timestamp_seconds_t = int64_t;
using duration_seconds_t = int64_t;
using slot_t = uint64_t;

inline constexpr basis_points_t kBasisPointsDenominator = 10'000;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
std::string to_base64(const bytes_view_t& bytes);

std::optional<hash32_t> try_make_hash32(std::string_view hex);
std::optional<public_key_t> try_make_public_key(std::string_view hex);
hash32_t make_zero_hash();

bool is_zero(const public_key_t& key);

}  // namespace steward::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
