#include <spdlog/spdlog.h>
#include <cosign/timestamp/transport.hpp>
#include <utility>

namespace cosign::timestamp {

std::future<transport_response_t> send_request(
    transport& transport,
    const std::string& url,
    const timestamp_request_t& request) {
  if (request.encoded.empty()) {
    spdlog::warn("Not posting an unencoded TSA request to {}", url);
    auto unsent = std::promise<transport_response_t>{};
    unsent.set_value(transport_response_t{
        .http_status = 0, .body = {}, .error = "request was not encoded"});
    return unsent.get_future();
  }
  return transport.post(url, request.encoded);
}

}  // namespace cosign::timestamp
