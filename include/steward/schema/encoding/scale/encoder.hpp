#pragma once
#include <steward/common/critical.hpp>
#include <steward/schema/encoding/encoder.hpp>
#include <steward/schema/encoding/scale/breaker_phase.hpp>
#include <steward/schema/encoding/scale/health_level.hpp>
#include <steward/schema/encoding/scale/policy_type.hpp>
#include <steward/schema/encoding/scale/proposal_status.hpp>
#include <steward/schema/encoding/scale/protocol_parameter.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace steward::schema::encoding {

struct scale_encoder_tag {};

// Aggregates are encoded field by field in declaration order; enums go
// through the value lists above so unknown discriminants fail to decode.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  steward::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, steward::schema::bytes_t& out);

  template <typename T>
  T decode(const steward::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const steward::schema::bytes_view_t& bytes);
};

template <typename T>
steward::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    steward::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        steward::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const steward::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    steward::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const steward::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace steward::schema::encoding
