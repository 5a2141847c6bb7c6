#pragma once

#include <cosign/schema/enum_string.hpp>
#include <cosign/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// RFC 3161 time-stamp protocol messages. Nothing in here performs I/O.
namespace cosign::timestamp {

inline constexpr std::string_view kSha256Oid{"2.16.840.1.101.3.4.2.1"};
inline constexpr std::string_view kTimeStampTokenAttributeOid{
    "1.2.840.113549.1.9.16.2.14"};

enum class pki_status_t : uint8_t {
  granted = 0,
  granted_with_mods = 1,
  rejection = 2,
  waiting = 3,
  revocation_warning = 4,
  revocation_notification = 5
};

inline constexpr auto kPkiStatusMappings = std::array{
    std::pair<std::string_view, pki_status_t>{"granted",
                                              pki_status_t::granted},
    std::pair<std::string_view, pki_status_t>{"granted_with_mods",
                                              pki_status_t::granted_with_mods},
    std::pair<std::string_view, pki_status_t>{"rejection",
                                              pki_status_t::rejection},
    std::pair<std::string_view, pki_status_t>{"waiting",
                                              pki_status_t::waiting},
    std::pair<std::string_view, pki_status_t>{
        "revocation_warning", pki_status_t::revocation_warning},
    std::pair<std::string_view, pki_status_t>{
        "revocation_notification", pki_status_t::revocation_notification}};

inline constexpr std::string_view to_string(const pki_status_t value) {
  return cosign::schema::name_of(value, kPkiStatusMappings);
}

/// An encoded TimeStampReq and the values a response must echo.
struct timestamp_request_t final {
  cosign::schema::bytes_t encoded;
  cosign::schema::hash32_t message_imprint{};
  uint64_t nonce{};
  bool cert_req{true};
};

/// A granted response, reduced to what the rest of the system needs.
struct timestamp_token_t final {
  /// DER of the ContentInfo (SignedData) carrying the TSTInfo.
  cosign::schema::bytes_t der;
  pki_status_t status{pki_status_t::granted};
  cosign::schema::timestamp_milliseconds_t gen_time{};
  std::string hash_algorithm_oid;
  cosign::schema::bytes_t message_imprint;
  std::optional<uint64_t> nonce;
  std::string policy_oid;
  std::string serial_hex;
};

/// A well-formed response whose status is not granted.
struct timestamp_rejection_t final {
  pki_status_t status{pki_status_t::rejection};
  std::string status_text;
  /// PKIFailureInfo bits, bit n of the BIT STRING at bit n of the mask.
  uint32_t failure_info{};
};

struct parse_error_t final {
  std::string reason;
};

using parse_result_t =
    std::variant<timestamp_token_t, timestamp_rejection_t, parse_error_t>;

struct validation_policy_t final {
  /// How far genTime may precede the local request time.
  cosign::schema::duration_milliseconds_t max_clock_skew{5 * 60 * 1000};
  /// How far genTime may follow the local request time.
  cosign::schema::duration_milliseconds_t max_response_delay{10 * 60 * 1000};
};

enum class token_check_t : uint8_t {
  ok = 0,
  malformed_token = 1,
  unsupported_algorithm = 2,
  imprint_mismatch = 3,
  nonce_mismatch = 4,
  time_before_request = 5,
  time_after_window = 6
};

struct validation_result_t final {
  token_check_t check{token_check_t::ok};
  std::string reason;
};

/// Random 64-bit nonce. This is the only non-deterministic input of a
/// request; build_request itself is a pure function of its arguments.
uint64_t make_nonce();

/// Build a DER TimeStampReq over SHA-256(message) with certReq set.
timestamp_request_t build_request(const cosign::schema::bytes_view_t& message,
                                  uint64_t nonce);

/// Decode a DER TimeStampResp. Rejections decode to timestamp_rejection_t;
/// malformed, truncated or trailing input yields parse_error_t.
parse_result_t parse_response(const cosign::schema::bytes_view_t& response);

/// Structural and temporal checks of a token against the request it answers.
validation_result_t validate_token(
    const timestamp_token_t& token,
    const timestamp_request_t& request,
    cosign::schema::timestamp_milliseconds_t request_time,
    const validation_policy_t& policy = {});

/// The token as a CMS id-aa-timeStampToken attribute inside the [1]
/// unsignedAttrs set, ready to splice into a SignerInfo.
std::optional<cosign::schema::bytes_t> build_unsigned_attribute(
    const timestamp_token_t& token);

}  // namespace cosign::timestamp
