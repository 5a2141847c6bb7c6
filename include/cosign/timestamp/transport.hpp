#pragma once

#include <cosign/schema/primitives.hpp>
#include <cosign/timestamp/client.hpp>
#include <cstdint>
#include <future>
#include <string>

namespace cosign::timestamp {

struct transport_response_t final {
  /// Zero when the request never produced an HTTP response.
  uint16_t http_status{};
  cosign::schema::bytes_t body;
  std::string error;
};

/// HTTP POST of `application/timestamp-query` bodies to a TSA.
class transport {
 public:
  virtual ~transport() = default;

  virtual std::future<transport_response_t> post(
      const std::string& url,
      const cosign::schema::bytes_t& body) = 0;
};

/// Posts an encoded TimeStampReq. A request whose encoding failed is never
/// sent; the returned future then holds a response with http_status 0.
std::future<transport_response_t> send_request(
    transport& transport,
    const std::string& url,
    const timestamp_request_t& request);

}  // namespace cosign::timestamp
