#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cosign/timestamp/client.hpp>
#include <memory>
#include <openssl/asn1.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pkcs7.h>
#include <openssl/rand.h>
#include <openssl/ts.h>
#include <openssl/x509.h>

namespace cosign::timestamp {

namespace {

using ts_req_ptr = std::unique_ptr<TS_REQ, decltype(&TS_REQ_free)>;
using ts_resp_ptr = std::unique_ptr<TS_RESP, decltype(&TS_RESP_free)>;
using ts_msg_imprint_ptr =
    std::unique_ptr<TS_MSG_IMPRINT, decltype(&TS_MSG_IMPRINT_free)>;
using x509_algor_ptr = std::unique_ptr<X509_ALGOR, decltype(&X509_ALGOR_free)>;
using asn1_integer_ptr =
    std::unique_ptr<ASN1_INTEGER, decltype(&ASN1_INTEGER_free)>;
using asn1_string_ptr =
    std::unique_ptr<ASN1_STRING, decltype(&ASN1_STRING_free)>;
using asn1_time_ptr = std::unique_ptr<ASN1_TIME, decltype(&ASN1_TIME_free)>;
using x509_attribute_ptr =
    std::unique_ptr<X509_ATTRIBUTE, decltype(&X509_ATTRIBUTE_free)>;

constexpr auto kMaxFailureInfoBit = 25;

template <typename T, typename Encode>
std::optional<cosign::schema::bytes_t> to_der(const T* object, Encode encode) {
  auto length = encode(object, nullptr);
  if (length <= 0) {
    return std::nullopt;
  }
  auto out = cosign::schema::bytes_t(static_cast<std::size_t>(length));
  auto* cursor = out.data();
  if (encode(object, &cursor) != length) {
    return std::nullopt;
  }
  return out;
}

cosign::schema::hash32_t sha256(const cosign::schema::bytes_view_t& message) {
  auto digest = cosign::schema::hash32_t{};
  auto length = 0u;
  if (EVP_Digest(message.data(), message.size(), digest.data(), &length,
                 EVP_sha256(), nullptr) != 1 ||
      length != digest.size()) {
    // SHA-256 is always available in a working libcrypto.
    spdlog::error("EVP_Digest(SHA-256) failed");
    return cosign::schema::make_zero_hash();
  }
  return digest;
}

std::string object_to_text(const ASN1_OBJECT* object) {
  if (object == nullptr) {
    return {};
  }
  auto buffer = std::array<char, 128>{};
  auto length = OBJ_obj2txt(buffer.data(), static_cast<int>(buffer.size()),
                            object, 1);
  if (length <= 0) {
    return {};
  }
  return std::string{buffer.data(),
                     std::min<std::size_t>(static_cast<std::size_t>(length),
                                           buffer.size() - 1)};
}

cosign::schema::bytes_t string_bytes(const ASN1_STRING* value) {
  if (value == nullptr) {
    return {};
  }
  const auto* data = ASN1_STRING_get0_data(value);
  return cosign::schema::bytes_t{data, data + ASN1_STRING_length(value)};
}

// GeneralizedTime is YYYYMMDDHHMMSS[.f*]Z. ASN1_TIME_diff resolves whole
// seconds; the fraction is read from the text.
std::optional<cosign::schema::timestamp_milliseconds_t> to_milliseconds(
    const ASN1_GENERALIZEDTIME* time) {
  if (time == nullptr) {
    return std::nullopt;
  }
  auto epoch = asn1_time_ptr{ASN1_TIME_set(nullptr, 0), ASN1_TIME_free};
  if (!epoch) {
    return std::nullopt;
  }
  auto days = 0;
  auto seconds = 0;
  if (ASN1_TIME_diff(&days, &seconds, epoch.get(), time) != 1 || days < 0) {
    return std::nullopt;
  }
  auto milliseconds =
      (static_cast<uint64_t>(days) * 86400u + static_cast<uint64_t>(seconds)) *
      1000u;

  auto raw = string_bytes(time);
  auto text = cosign::schema::make_string_view(raw);
  auto dot = text.find('.');
  if (dot != std::string_view::npos) {
    auto scale = 100u;
    for (auto i = dot + 1; i < text.size() && scale > 0; ++i) {
      if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
        break;
      }
      milliseconds += static_cast<uint64_t>(text[i] - '0') * scale;
      scale /= 10u;
    }
  }
  return milliseconds;
}

std::string status_text(const TS_STATUS_INFO* info) {
  const auto* texts = TS_STATUS_INFO_get0_text(info);
  if (texts == nullptr) {
    return {};
  }
  auto out = std::string{};
  for (auto i = 0; i < sk_ASN1_UTF8STRING_num(texts); ++i) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    auto bytes = string_bytes(sk_ASN1_UTF8STRING_value(texts, i));
    out.append(cosign::schema::make_string_view(bytes));
  }
  return out;
}

uint32_t failure_bits(const TS_STATUS_INFO* info) {
  const auto* bits = TS_STATUS_INFO_get0_failure_info(info);
  if (bits == nullptr) {
    return 0;
  }
  auto mask = uint32_t{0};
  for (auto bit = 0; bit <= kMaxFailureInfoBit; ++bit) {
    if (ASN1_BIT_STRING_get_bit(bits, bit) == 1) {
      mask |= (1u << static_cast<uint32_t>(bit));
    }
  }
  return mask;
}

void append_der_length(cosign::schema::bytes_t& out, std::size_t length) {
  if (length < 0x80) {
    out.push_back(static_cast<uint8_t>(length));
    return;
  }
  auto digits = cosign::schema::bytes_t{};
  for (; length > 0; length >>= 8u) {
    digits.insert(std::begin(digits), static_cast<uint8_t>(length & 0xFFu));
  }
  out.push_back(static_cast<uint8_t>(0x80u | digits.size()));
  out.insert(std::end(out), std::begin(digits), std::end(digits));
}

parse_result_t read_granted(TS_RESP* response, pki_status_t status) {
  auto* token = TS_RESP_get_token(response);
  auto* info = TS_RESP_get_tst_info(response);
  if (token == nullptr || info == nullptr) {
    return parse_error_t{"granted response carries no time-stamp token"};
  }

  auto out = timestamp_token_t{};
  out.status = status;

  auto der = to_der(token, [](const PKCS7* p, unsigned char** cursor) {
    return i2d_PKCS7(const_cast<PKCS7*>(p), cursor);
  });
  if (!der.has_value()) {
    return parse_error_t{"unable to re-encode time-stamp token"};
  }
  out.der = std::move(*der);

  auto gen_time = to_milliseconds(TS_TST_INFO_get_time(info));
  if (!gen_time.has_value()) {
    return parse_error_t{"invalid genTime"};
  }
  out.gen_time = *gen_time;

  auto* imprint = TS_TST_INFO_get_msg_imprint(info);
  if (imprint == nullptr) {
    return parse_error_t{"missing message imprint"};
  }
  const auto* algorithm = static_cast<const ASN1_OBJECT*>(nullptr);
  X509_ALGOR_get0(&algorithm, nullptr, nullptr,
                  TS_MSG_IMPRINT_get_algo(imprint));
  out.hash_algorithm_oid = object_to_text(algorithm);
  out.message_imprint = string_bytes(TS_MSG_IMPRINT_get_msg(imprint));

  if (const auto* nonce = TS_TST_INFO_get_nonce(info); nonce != nullptr) {
    auto value = uint64_t{};
    if (ASN1_INTEGER_get_uint64(&value, nonce) != 1) {
      return parse_error_t{"nonce does not fit 64 bits"};
    }
    out.nonce = value;
  }
  out.policy_oid = object_to_text(TS_TST_INFO_get_policy_id(info));
  out.serial_hex = cosign::schema::to_hex(
      cosign::schema::make_bytes_view(string_bytes(TS_TST_INFO_get_serial(info))));
  return out;
}

}  // namespace

uint64_t make_nonce() {
  auto bytes = std::array<uint8_t, sizeof(uint64_t)>{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    spdlog::warn("RAND_bytes failed, nonce falls back to zero");
    return 0;
  }
  auto nonce = uint64_t{0};
  for (const auto byte : bytes) {
    nonce = (nonce << 8u) | byte;
  }
  return nonce;
}

timestamp_request_t build_request(const cosign::schema::bytes_view_t& message,
                                  uint64_t nonce) {
  auto out = timestamp_request_t{};
  out.message_imprint = sha256(message);
  out.nonce = nonce;

  auto request = ts_req_ptr{TS_REQ_new(), TS_REQ_free};
  auto imprint = ts_msg_imprint_ptr{TS_MSG_IMPRINT_new(), TS_MSG_IMPRINT_free};
  auto algorithm = x509_algor_ptr{X509_ALGOR_new(), X509_ALGOR_free};
  auto asn1_nonce = asn1_integer_ptr{ASN1_INTEGER_new(), ASN1_INTEGER_free};
  if (!request || !imprint || !algorithm || !asn1_nonce) {
    spdlog::error("OpenSSL allocation failed while building TSA request");
    return out;
  }

  // The setters below copy their arguments; ownership stays with the RAII
  // handles.
  auto ok = X509_ALGOR_set0(algorithm.get(), OBJ_nid2obj(NID_sha256),
                            V_ASN1_NULL, nullptr) == 1 &&
            TS_MSG_IMPRINT_set_algo(imprint.get(), algorithm.get()) == 1 &&
            TS_MSG_IMPRINT_set_msg(imprint.get(), out.message_imprint.data(),
                                   static_cast<int>(
                                       out.message_imprint.size())) == 1 &&
            TS_REQ_set_version(request.get(), 1) == 1 &&
            TS_REQ_set_msg_imprint(request.get(), imprint.get()) == 1 &&
            ASN1_INTEGER_set_uint64(asn1_nonce.get(), nonce) == 1 &&
            TS_REQ_set_nonce(request.get(), asn1_nonce.get()) == 1 &&
            TS_REQ_set_cert_req(request.get(), out.cert_req ? 1 : 0) == 1;
  if (!ok) {
    spdlog::error("Failed to populate TSA request");
    return out;
  }

  auto der = to_der(request.get(), [](const TS_REQ* r, unsigned char** cursor) {
    return i2d_TS_REQ(r, cursor);
  });
  if (!der.has_value()) {
    spdlog::error("Failed to encode TSA request");
    return out;
  }
  out.encoded = std::move(*der);
  return out;
}

parse_result_t parse_response(const cosign::schema::bytes_view_t& response) {
  if (response.empty()) {
    return parse_error_t{"empty response"};
  }

  const auto* cursor = response.data();
  auto decoded = ts_resp_ptr{
      d2i_TS_RESP(nullptr, &cursor, static_cast<long>(response.size())),
      TS_RESP_free};
  if (!decoded) {
    return parse_error_t{"malformed or truncated TimeStampResp"};
  }
  if (cursor != response.data() + response.size()) {
    return parse_error_t{"trailing bytes after TimeStampResp"};
  }

  const auto* info = TS_RESP_get_status_info(decoded.get());
  const auto* status_value =
      info == nullptr ? nullptr : TS_STATUS_INFO_get0_status(info);
  if (status_value == nullptr) {
    return parse_error_t{"missing PKIStatus"};
  }
  auto raw_status = ASN1_INTEGER_get(status_value);
  if (raw_status < 0 ||
      raw_status > static_cast<long>(pki_status_t::revocation_notification)) {
    return parse_error_t{"unknown PKIStatus " + std::to_string(raw_status)};
  }

  auto status = static_cast<pki_status_t>(raw_status);
  if (status == pki_status_t::granted ||
      status == pki_status_t::granted_with_mods) {
    return read_granted(decoded.get(), status);
  }
  return timestamp_rejection_t{.status = status,
                               .status_text = status_text(info),
                               .failure_info = failure_bits(info)};
}

validation_result_t validate_token(
    const timestamp_token_t& token,
    const timestamp_request_t& request,
    cosign::schema::timestamp_milliseconds_t request_time,
    const validation_policy_t& policy) {
  // ContentInfo is a DER SEQUENCE.
  if (token.der.size() < 2 || token.der[0] != 0x30) {
    return {token_check_t::malformed_token, "token is not a DER SEQUENCE"};
  }
  if (token.hash_algorithm_oid != kSha256Oid) {
    return {token_check_t::unsupported_algorithm,
            "unexpected imprint algorithm " + token.hash_algorithm_oid};
  }
  if (!std::ranges::equal(token.message_imprint, request.message_imprint)) {
    return {token_check_t::imprint_mismatch,
            "message imprint differs from request"};
  }
  if (token.nonce != std::optional<uint64_t>{request.nonce}) {
    return {token_check_t::nonce_mismatch, "nonce not echoed"};
  }
  if (token.gen_time + policy.max_clock_skew < request_time) {
    return {token_check_t::time_before_request,
            "genTime precedes request by more than the allowed skew"};
  }
  if (token.gen_time > request_time + policy.max_response_delay) {
    return {token_check_t::time_after_window,
            "genTime is too far after the request"};
  }
  return {};
}

std::optional<cosign::schema::bytes_t> build_unsigned_attribute(
    const timestamp_token_t& token) {
  auto value = asn1_string_ptr{ASN1_STRING_type_new(V_ASN1_SEQUENCE),
                               ASN1_STRING_free};
  if (!value || ASN1_STRING_set(value.get(), token.der.data(),
                                static_cast<int>(token.der.size())) != 1) {
    return std::nullopt;
  }
  auto attribute = x509_attribute_ptr{
      X509_ATTRIBUTE_create(NID_id_smime_aa_timeStampToken, V_ASN1_SEQUENCE,
                            value.get()),
      X509_ATTRIBUTE_free};
  if (!attribute) {
    return std::nullopt;
  }
  // Owned by the attribute from here on.
  static_cast<void>(value.release());

  auto der = to_der(attribute.get(),
                    [](const X509_ATTRIBUTE* a, unsigned char** cursor) {
                      return i2d_X509_ATTRIBUTE(a, cursor);
                    });
  if (!der.has_value()) {
    return std::nullopt;
  }

  // [1] IMPLICIT SET OF Attribute
  auto out = cosign::schema::bytes_t{0xA1};
  append_der_length(out, der->size());
  out.insert(std::end(out), std::begin(*der), std::end(*der));
  return out;
}

}  // namespace cosign::timestamp
