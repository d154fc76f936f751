#pragma once

#include <chrono>

namespace vault {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time carried by every event. Populated from
// ITimeProvider::now_ms() through ms_to_timestamp().
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

}  // namespace vault
