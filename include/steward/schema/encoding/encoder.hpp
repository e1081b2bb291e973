#pragma once
#include <steward/schema/primitives.hpp>
#include <optional>
#include <span>

namespace steward::schema::encoding {

// Encoding backend is selected at build time through the tag type; every
// caller is templated on the encoder so the wire format can be swapped
// without touching execution code.
template <typename Library>
struct encoder {
  template <typename T>
  steward::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, steward::schema::bytes_t& out);

  template <typename T>
  T decode(const steward::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const steward::schema::bytes_view_t& bytes);
};

}  // namespace steward::schema::encoding
