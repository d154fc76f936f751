#pragma once

#include "vault/domain/fixed_point.hpp"
#include "vault/domain/target_allocation.hpp"
#include "vault/domain/vault_parameters.hpp"
#include "vault/domain/vault_snapshot.hpp"
#include "vault/domain/vault_state.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace vault {
namespace domain {

// Parses a non-negative decimal integer. Throws VaultError(InvalidParameter)
// for anything else (sign, whitespace, hex, empty).
Uint256 parseUint256(const std::string& text);

}  // namespace domain
}  // namespace vault

// -----------------------------------------------------------------------------
// nlohmann::json support for Uint256
// -----------------------------------------------------------------------------
// Serialized as a decimal string: JSON numbers are doubles in most readers
// and cannot carry 256-bit values. Deserialization also accepts a
// non-negative JSON integer for hand-written configuration files.
// -----------------------------------------------------------------------------
namespace nlohmann {
template <>
struct adl_serializer<vault::domain::Uint256> {
  static void to_json(json& j, const vault::domain::Uint256& value) {
    j = value.str();
  }

  static void from_json(const json& j, vault::domain::Uint256& value) {
    if (j.is_number_unsigned()) {
      value = vault::domain::Uint256{j.get<std::uint64_t>()};
      return;
    }
    value = vault::domain::parseUint256(j.get<std::string>());
  }
};
}  // namespace nlohmann

namespace vault {
namespace domain {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AllocationEntry, asset, weight)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(VenueDescriptor, name, fee_tier, enabled,
                                   wraps_native)

// FeeSplit and VaultParameters tolerate missing keys (defaults apply).
void to_json(nlohmann::json& j, const FeeSplit& split);
void from_json(const nlohmann::json& j, FeeSplit& split);

void to_json(nlohmann::json& j, const VaultParameters& params);
void from_json(const nlohmann::json& j, VaultParameters& params);

void to_json(nlohmann::json& j, const VaultState& state);
void from_json(const nlohmann::json& j, VaultState& state);

void to_json(nlohmann::json& j, const VaultSnapshot& snapshot);
void from_json(const nlohmann::json& j, VaultSnapshot& snapshot);

}  // namespace domain
}  // namespace vault
