#pragma once
#include <cosign/schema/field_type.hpp>
#include <string>
#include <variant>

// Schema type: field value.
// What a recipient entered into a field. Rendering of the value is done
// elsewhere; only references and plain data are kept here.
namespace cosign::schema {

struct drawn_signature_t final {
  std::string image_ref;
};

struct typed_text_t final {
  std::string text;
  std::string font;
};

struct date_value_t final {
  std::string date;
};

struct checkbox_value_t final {
  bool checked{};
};

using field_value_t =
    std::variant<drawn_signature_t, typed_text_t, date_value_t, checkbox_value_t>;

// Signature and initials accept drawn or typed input, text fields take typed
// text, date and checkbox fields take their own kind only.
inline bool accepts(const field_type_t type, const field_value_t& value) {
  switch (type) {
    case field_type_t::signature:
    case field_type_t::initials:
      return std::holds_alternative<drawn_signature_t>(value) ||
             std::holds_alternative<typed_text_t>(value);
    case field_type_t::text:
      return std::holds_alternative<typed_text_t>(value);
    case field_type_t::date:
      return std::holds_alternative<date_value_t>(value);
    case field_type_t::checkbox:
      return std::holds_alternative<checkbox_value_t>(value);
  }
  return false;
}

}  // namespace cosign::schema
