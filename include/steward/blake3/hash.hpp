#pragma once
#include <blake3.h>
#include <steward/schema/primitives.hpp>
#include <span>
#include <string_view>

namespace steward::blake3 {

steward::schema::hash32_t hash(const std::string_view& str);
steward::schema::hash32_t hash(const steward::schema::bytes_view_t& bytes);

/// Incremental BLAKE3 over several byte ranges.
class hasher final {
 public:
  hasher();

  hasher& update(const steward::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);
  steward::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

}  // namespace steward::blake3
