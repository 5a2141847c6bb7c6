#pragma once
#include <cosign/common/critical.hpp>
#include <cosign/schema/encoding/encoder.hpp>
#include <cosign/schema/encoding/scale/audit_action.hpp>
#include <cosign/schema/encoding/scale/audit_event.hpp>
#include <cosign/schema/encoding/scale/cached_session.hpp>
#include <cosign/schema/encoding/scale/field.hpp>
#include <cosign/schema/encoding/scale/field_type.hpp>
#include <cosign/schema/encoding/scale/field_value.hpp>
#include <cosign/schema/encoding/scale/recipient.hpp>
#include <cosign/schema/encoding/scale/recipient_role.hpp>
#include <cosign/schema/encoding/scale/session.hpp>
#include <cosign/schema/encoding/scale/session_status.hpp>
#include <cosign/schema/encoding/scale/signed_submission.hpp>
#include <cosign/schema/encoding/scale/signing_mode.hpp>
#include <cosign/schema/encoding/scale/sync_record.hpp>
#include <cosign/schema/encoding/scale/sync_state.hpp>
#include <cosign/schema/encoding/scale/sync_status.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>
#include <spdlog/spdlog.h>

namespace cosign::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  cosign::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cosign::schema::bytes_t& out);

  template <typename T>
  T decode(const cosign::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cosign::schema::bytes_view_t& bytes);
};

template <typename T>
cosign::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    cosign::common::critical(cosign::common::critical_area::encoding,
                             "failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        cosign::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const cosign::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    cosign::common::critical(cosign::common::critical_area::encoding,
                             "failed to decode SCALE bytes");
  }
  return std::move(decoded).value();
}

// Persisted bytes may predate a schema change or be corrupt; enum decoders
// throw on values outside their range, so both failure paths end here.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const cosign::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded).value();
  } catch (const std::exception& e) {
    spdlog::debug("SCALE decode failed: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace cosign::schema::encoding
