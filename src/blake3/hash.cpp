#include <blake3.h>
#include <cosign/blake3/hash.hpp>

namespace cosign::blake3 {

cosign::schema::hash32_t hash(const std::string_view& str) {
  return hash(cosign::schema::make_bytes_view(str));
}

cosign::schema::hash32_t hash(const cosign::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = cosign::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

cosign::schema::hash32_t hash(
    std::initializer_list<cosign::schema::bytes_view_t> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  auto output = cosign::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace cosign::blake3
