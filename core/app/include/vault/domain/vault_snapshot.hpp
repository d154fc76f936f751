#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/target_allocation.hpp"
#include "vault/domain/vault_state.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// VenueDescriptor
// -----------------------------------------------------------------------------
// The persistable part of a venue configuration. Quoter and executor
// handles cannot be serialized; on restore they are re-bound by name.
// -----------------------------------------------------------------------------
struct VenueDescriptor {
  std::string name;
  std::uint32_t fee_tier{0};
  bool enabled{true};
  bool wraps_native{false};
};

// -----------------------------------------------------------------------------
// VaultSnapshot: committed vault state as written to durable storage
// -----------------------------------------------------------------------------
//
// @brief  Plain data image of everything VaultEngine owns.
//
// @details
// Produced by VaultEngine after every successful mutating call (when a
// VaultStateStore is attached) and consumed by VaultEngine::restore().
// Total supply is not stored separately; it is the sum of share_balances.
//
// Maps are ordered so the serialized form is deterministic.
// -----------------------------------------------------------------------------
struct VaultSnapshot {
  std::string vault_id;
  VaultState state;
  std::map<AssetId, Uint256> holdings;
  std::map<AccountId, Uint256> share_balances;
  std::optional<std::vector<AllocationEntry>> allocation;
  std::vector<VenueDescriptor> venues;
};

}  // namespace domain
}  // namespace vault
