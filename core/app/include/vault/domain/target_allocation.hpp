#pragma once

#include "vault/domain/asset.hpp"

#include <cstdint>
#include <vector>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// AllocationEntry
// -----------------------------------------------------------------------------
// One row of a target allocation: the asset and its weight in whole
// percentage points (1..100).
// -----------------------------------------------------------------------------
struct AllocationEntry {
  AssetId asset;
  std::uint32_t weight{0};
};

// -----------------------------------------------------------------------------
// TargetAllocation: validated desired asset mix
// -----------------------------------------------------------------------------
//
// @brief  Immutable, always-valid list of (asset, weight) pairs.
//
// @details
// The only way to obtain a TargetAllocation is create(), which rejects the
// whole table with ErrorCode::AllocationInvalid unless:
//   - it is non-empty,
//   - no weight is zero,
//   - no asset appears twice,
//   - weights sum to exactly kWeightSum (100).
//
// Entry order is preserved; the drift planner uses it to break ties when
// distributing rounding remainders.
//
// Whether each asset is accepted by the registry is NOT checked here (that
// needs the oracle); VaultEngine::updateTargetAllocation does it.
//
// Thread model:
//   Value type. Copies are independent.
// -----------------------------------------------------------------------------
class TargetAllocation {
 public:
  // -------------------------------------------------------------------------
  // create(entries)
  // -------------------------------------------------------------------------
  // @brief  Validates and wraps an allocation table.
  //
  // @param  entries  Candidate rows.
  // @return A TargetAllocation holding exactly these rows.
  //
  // @throws VaultError(AllocationInvalid) naming the first violated rule.
  // -------------------------------------------------------------------------
  static TargetAllocation create(std::vector<AllocationEntry> entries);

  const std::vector<AllocationEntry>& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }

  bool contains(const AssetId& asset) const;

  // Weight in percentage points; 0 for assets outside the allocation.
  std::uint32_t weightOf(const AssetId& asset) const;

  // Weight expressed in basis points of total value (weight * 100).
  std::uint32_t targetBps(const AssetId& asset) const;

 private:
  explicit TargetAllocation(std::vector<AllocationEntry> entries);

  std::vector<AllocationEntry> entries_;
};

}  // namespace domain
}  // namespace vault
