#pragma once

#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Supplies "now" to VaultEngine for event timestamps.
//
// @details
// Simulations and tests inject SimulationTimeProvider so that event
// timestamps are deterministic; a deployed engine injects
// LiveTimeProvider. The engine never reads the system clock directly.
//
// Millisecond epoch integers keep persisted and logged values
// language-agnostic.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace vault
