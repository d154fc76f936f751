#pragma once

#include <atomic>
#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// SequenceGenerator: monotonically increasing event sequence ids
// -----------------------------------------------------------------------------
//
// @brief  Hands out 1, 2, 3, ... Every event VaultEngine publishes carries
//         one, giving subscribers a total order across event kinds even
//         when timestamps collide (simulated time rarely moves between
//         calls).
//
// @details
// Ids are drawn while the engine's call lock is held, in the order events
// are buffered. A rolled-back call may consume ids it never publishes, so
// subscribers see gaps but never reordering. 0 is reserved as "unset".
//
// Thread model:
//   next_id() is a relaxed fetch_add; safe from any thread.
//
// Ownership:
//   Value member of VaultEngine. Non-copyable, non-movable.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace vault
