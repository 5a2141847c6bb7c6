#pragma once

#include <cosign/common/time_source.hpp>
#include <cosign/schema/field.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/recipient.hpp>
#include <cosign/schema/session.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cosign::testing {

inline constexpr auto kStartTime =
    cosign::schema::timestamp_milliseconds_t{1'700'000'000'000};
inline constexpr auto kHour =
    cosign::schema::duration_milliseconds_t{60 * 60 * 1000};

inline cosign::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = cosign::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Clock that only moves when told to.
class manual_clock final {
 public:
  explicit manual_clock(cosign::schema::timestamp_milliseconds_t start =
                            kStartTime)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  cosign::schema::timestamp_milliseconds_t now() const { return *now_; }
  void advance(cosign::schema::duration_milliseconds_t by) { *now_ += by; }
  void set(cosign::schema::timestamp_milliseconds_t to) { *now_ = to; }

  cosign::common::time_source_t source() const {
    return [now = now_] { return now->load(); };
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

inline cosign::schema::recipient_t make_recipient(
    std::string id,
    uint32_t order,
    cosign::schema::recipient_role_t role =
        cosign::schema::recipient_role_t::signer) {
  auto recipient = cosign::schema::recipient_t{};
  recipient.name = "Recipient " + id;
  recipient.email = id + "@example.com";
  recipient.id = std::move(id);
  recipient.role = role;
  recipient.order = order;
  return recipient;
}

inline cosign::schema::field_t make_field(
    std::string id,
    std::string recipient_id,
    uint32_t page = 1,
    uint32_t y = 1000,
    cosign::schema::field_type_t type = cosign::schema::field_type_t::signature,
    bool required = true) {
  auto field = cosign::schema::field_t{};
  field.id = std::move(id);
  field.recipient_id = std::move(recipient_id);
  field.type = type;
  field.page = page;
  field.rect = cosign::schema::field_rect_t{
      .x = 1000, .y = y, .width = 2000, .height = 500};
  field.required = required;
  return field;
}

/// Session with one required signature field per recipient, ordered by
/// position in `recipients`.
inline cosign::schema::session_t make_session(
    cosign::schema::signing_mode_t mode,
    const std::vector<std::string>& recipients,
    std::string id = "session-1") {
  auto session = cosign::schema::session_t{};
  session.id = std::move(id);
  session.document_name = "Lease Agreement.pdf";
  session.created_by = "owner";
  session.sender_email = "owner@example.com";
  session.signing_mode = mode;
  auto order = uint32_t{1};
  for (const auto& recipient : recipients) {
    session.recipients.push_back(make_recipient(recipient, order));
    session.fields.push_back(
        make_field("sig-" + recipient, recipient, 1, 1000 * order));
    ++order;
  }
  return session;
}

inline cosign::schema::typed_text_t make_typed_signature(
    std::string text = "Jane Doe") {
  return cosign::schema::typed_text_t{.text = std::move(text),
                                      .font = "Dancing Script"};
}

}  // namespace cosign::testing
