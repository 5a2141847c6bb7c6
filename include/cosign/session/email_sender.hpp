#pragma once

#include <string>

namespace cosign::session {

struct email_payload_t final {
  std::string to;
  std::string subject;
  std::string body;
};

struct send_result_t final {
  bool delivered{};
  std::string error;
};

/// Outbound notification channel. Sending is best-effort: a failed
/// notification never reverses the transition that caused it.
class email_sender {
 public:
  virtual ~email_sender() = default;
  virtual send_result_t send(const email_payload_t& payload) = 0;
};

/// Discards every message.
class null_email_sender final : public email_sender {
 public:
  send_result_t send(const email_payload_t& payload) override;
};

}  // namespace cosign::session
