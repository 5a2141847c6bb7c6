#pragma once

#include <cosign/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace cosign::common {

// Milliseconds since the Unix epoch. Injected so that recorded times come
// from the authority's clock and tests can pin them.
using time_source_t = std::function<cosign::schema::timestamp_milliseconds_t()>;

inline cosign::schema::timestamp_milliseconds_t system_time_milliseconds() {
  return static_cast<cosign::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace cosign::common
