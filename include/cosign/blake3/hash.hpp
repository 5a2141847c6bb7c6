#pragma once
#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace cosign::blake3 {

cosign::schema::hash32_t hash(const std::string_view& str);
cosign::schema::hash32_t hash(const cosign::schema::bytes_view_t& bytes);

// Hash of the concatenation of all parts.
cosign::schema::hash32_t hash(
    std::initializer_list<cosign::schema::bytes_view_t> parts);

}  // namespace cosign::blake3
