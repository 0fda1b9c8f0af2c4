#include <blake3.h>
#include <credo/blake3/hash.hpp>
#include <tuple>

namespace credo::blake3 {

credo::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = credo::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<credo::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

credo::schema::hash32_t hash(const credo::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = credo::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace credo::blake3
