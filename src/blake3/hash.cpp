#include <blake3.h>
#include <pledge/blake3/hash.hpp>

namespace pledge::blake3 {

namespace {

pledge::schema::hash32_t finalize(blake3_hasher& hasher) {
  auto output = pledge::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<pledge::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

pledge::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

pledge::schema::hash32_t hash(const pledge::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

}  // namespace pledge::blake3
