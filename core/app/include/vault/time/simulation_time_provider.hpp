#pragma once

#include "vault/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the simulation driver last
//         set. Starts at 0.
//
// @details
// The vault simulation advances the clock once per simulated block before
// issuing that block's deposits, redeems and rebalances, so every event of
// the block carries the block's timestamp.
//
// Monotonicity is the driver's responsibility; tests may set any value.
//
// Thread model:
//   Backed by std::atomic<int64_t>. advance_time() and now_ms() are safe
//   from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace vault
