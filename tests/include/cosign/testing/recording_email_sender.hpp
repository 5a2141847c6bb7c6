#pragma once

#include <cosign/session/email_sender.hpp>

#include <stdexcept>
#include <vector>

namespace cosign::testing {

class recording_email_sender final : public cosign::session::email_sender {
 public:
  cosign::session::send_result_t send(
      const cosign::session::email_payload_t& payload) override {
    sent.push_back(payload);
    if (fail) {
      throw std::runtime_error{"smtp unavailable"};
    }
    return cosign::session::send_result_t{.delivered = true, .error = {}};
  }

  std::vector<cosign::session::email_payload_t> sent;
  bool fail{};
};

}  // namespace cosign::testing
