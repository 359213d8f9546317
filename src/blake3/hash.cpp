#include <blake3.h>
#include <guild/blake3/hash.hpp>

namespace guild::blake3 {

guild::schema::hash32_t hash(const guild::schema::bytes_view_t& bytes) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<guild::schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = guild::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace guild::blake3
