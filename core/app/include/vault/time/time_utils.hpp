#pragma once

#include "vault/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// ITimeProvider speaks epoch milliseconds; events carry a Timestamp
// (system_clock::time_point). These bridge the two. Stateless.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace vault
