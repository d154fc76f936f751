#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/target_allocation.hpp"
#include "vault/domain/vault_parameters.hpp"
#include "vault/domain/vault_state.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vault {

// -----------------------------------------------------------------------------
// VaultConfig: construction-time configuration of one vault
// -----------------------------------------------------------------------------
//
// @brief  Identity, roles, guard rails and initial policy of a vault.
//
// @details
//   vault_id         Key prefix for persistence and log tag.
//   manager          Owner account: runs admin operations, earns the owner
//                    fee, is subject to the accountability gate.
//   platform_account Receives the oracle-computed platform fee.
//   wrapped_native   Asset id venues flagged wraps_native use for the
//                    native asset. Empty disables substitution.
//   params           Rebalance thresholds.
//   fee_split        Initial owner/caller split.
//   allocation       Initial target allocation (optional; can be set later
//                    through updateTargetAllocation).
//   min_owner_bps    Accountability threshold. nullopt disables the gate
//                    (the manager is always accountable).
//
// JSON layout (every key except vault_id and manager is optional):
//
//   {
//     "vault_id": "bucket-1",
//     "manager": "alice",
//     "platform_account": "treasury",
//     "wrapped_native": "wnative",
//     "params": {"drift_tolerance_bps": 200, "max_value_loss_bps": 50,
//                "quote_slippage_bps": 500},
//     "fee_split": {"owner_fee_bps": 1000, "caller_fee_bps": 100},
//     "allocation": [{"asset": "A", "weight": 50},
//                    {"asset": "B", "weight": 50}],
//     "min_owner_bps": 500
//   }
//
// "min_owner_bps": null disables the gate explicitly; omitting it keeps the
// 500 bps default.
// -----------------------------------------------------------------------------
struct VaultConfig {
  std::string vault_id;
  domain::AccountId manager;
  domain::AccountId platform_account{"platform"};
  domain::AssetId wrapped_native;
  domain::VaultParameters params;
  domain::FeeSplit fee_split;
  std::optional<std::vector<domain::AllocationEntry>> allocation;
  std::optional<std::uint32_t> min_owner_bps{500};
};

// -----------------------------------------------------------------------------
// loadVaultConfig(json) / loadVaultConfigFile(path)
// -----------------------------------------------------------------------------
// @brief  Builds and validates a VaultConfig.
//
// @throws VaultError(InvalidParameter) when a required key is missing, a
//         value has the wrong type, a basis-point value exceeds 10'000, the
//         fee split sums above 10'000, or the file cannot be read or parsed.
// @throws VaultError(AllocationInvalid) when "allocation" is present but
//         violates the allocation rules.
// -----------------------------------------------------------------------------
VaultConfig loadVaultConfig(const nlohmann::json& document);
VaultConfig loadVaultConfigFile(const std::string& path);

// Inverse of loadVaultConfig (used by the status document and tests).
nlohmann::json toJson(const VaultConfig& config);

}  // namespace vault
