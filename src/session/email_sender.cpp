#include <spdlog/spdlog.h>
#include <cosign/session/email_sender.hpp>

namespace cosign::session {

send_result_t null_email_sender::send(const email_payload_t& payload) {
  spdlog::debug("Dropping notification to {}: {}", payload.to,
                payload.subject);
  return send_result_t{.delivered = true, .error = {}};
}

}  // namespace cosign::session
