#include <steward/blake3/hash.hpp>

namespace steward::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const steward::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

steward::schema::hash32_t hasher::finalize() const {
  auto output = steward::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

steward::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

steward::schema::hash32_t hash(const steward::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace steward::blake3
