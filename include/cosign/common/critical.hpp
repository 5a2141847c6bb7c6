#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cosign::common {

/// Failure areas that end the process rather than surface an error code.
enum class critical_area { store, encoding, schema };

constexpr std::string_view to_string(const critical_area area) {
  switch (area) {
    case critical_area::store:
      return "store";
    case critical_area::encoding:
      return "encoding";
    case critical_area::schema:
      return "schema";
  }
  return "unknown";
}

/// Logs `what` (and the backend's `detail` when given), drains the async
/// logger and terminates. Signing state must never outlive a store it could
/// not write.
[[noreturn]] inline void critical(const critical_area area,
                                  const std::string_view what,
                                  const std::string_view detail = {}) {
  if (detail.empty()) {
    spdlog::critical("[{}] {}", to_string(area), what);
  } else {
    spdlog::critical("[{}] {}: {}", to_string(area), what, detail);
  }
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace cosign::common
