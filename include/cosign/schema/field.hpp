#pragma once
#include <cosign/schema/field_type.hpp>
#include <cosign/schema/field_value.hpp>
#include <cosign/schema/primitives.hpp>
#include <optional>

// Schema type: field.
// Placement is expressed in basis points of the page (0..10000) measured
// from the top-left corner.
namespace cosign::schema {

struct field_rect_t final {
  uint32_t x{};
  uint32_t y{};
  uint32_t width{};
  uint32_t height{};
};

template <uint16_t Version>
struct field;

template <>
struct field<1> final {
  uint16_t version{1};
  field_id_t id;
  field_type_t type{field_type_t::signature};
  uint32_t page{1};
  field_rect_t rect;
  recipient_id_t recipient_id;
  bool required{true};
  bool completed{};
  std::optional<field_value_t> value;
  std::optional<timestamp_milliseconds_t> completed_at;
};

using field_t = field<1>;

}  // namespace cosign::schema
