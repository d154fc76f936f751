#include "vault/storage/json_codec.hpp"
#include "vault/errors/vault_error.hpp"

#include <vector>

namespace vault {
namespace domain {

using nlohmann::json;

Uint256 parseUint256(const std::string& text) {
  if (text.empty() || text.size() > 78) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "not a 256-bit decimal: '" + text + "'");
  }
  Uint256 value{0};
  for (char c : text) {
    if (c < '0' || c > '9') {
      throw VaultError(ErrorCode::InvalidParameter,
                       "not a 256-bit decimal: '" + text + "'");
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  return value;
}

// -----------------------------------------------------------------------------
// FeeSplit / VaultParameters
// -----------------------------------------------------------------------------
void to_json(json& j, const FeeSplit& split) {
  j = json{{"owner_fee_bps", split.owner_fee_bps},
           {"caller_fee_bps", split.caller_fee_bps}};
}

void from_json(const json& j, FeeSplit& split) {
  const FeeSplit defaults;
  split.owner_fee_bps = j.value("owner_fee_bps", defaults.owner_fee_bps);
  split.caller_fee_bps = j.value("caller_fee_bps", defaults.caller_fee_bps);
}

void to_json(json& j, const VaultParameters& params) {
  j = json{{"drift_tolerance_bps", params.drift_tolerance_bps},
           {"max_value_loss_bps", params.max_value_loss_bps},
           {"quote_slippage_bps", params.quote_slippage_bps}};
}

void from_json(const json& j, VaultParameters& params) {
  const VaultParameters defaults;
  params.drift_tolerance_bps =
      j.value("drift_tolerance_bps", defaults.drift_tolerance_bps);
  params.max_value_loss_bps =
      j.value("max_value_loss_bps", defaults.max_value_loss_bps);
  params.quote_slippage_bps =
      j.value("quote_slippage_bps", defaults.quote_slippage_bps);
}

// -----------------------------------------------------------------------------
// VaultState
// -----------------------------------------------------------------------------
void to_json(json& j, const VaultState& state) {
  j = json{{"total_deposit_value_usd", state.total_deposit_value_usd},
           {"total_withdraw_value_usd", state.total_withdraw_value_usd},
           {"share_price_usd", state.share_price_usd},
           {"fee_baseline_usd", state.fee_baseline_usd},
           {"paused", state.paused},
           {"rebalancing_paused", state.rebalancing_paused},
           {"fee_split", state.fee_split}};
}

void from_json(const json& j, VaultState& state) {
  j.at("total_deposit_value_usd").get_to(state.total_deposit_value_usd);
  j.at("total_withdraw_value_usd").get_to(state.total_withdraw_value_usd);
  j.at("share_price_usd").get_to(state.share_price_usd);
  j.at("fee_baseline_usd").get_to(state.fee_baseline_usd);
  j.at("paused").get_to(state.paused);
  j.at("rebalancing_paused").get_to(state.rebalancing_paused);
  j.at("fee_split").get_to(state.fee_split);
}

// -----------------------------------------------------------------------------
// VaultSnapshot
// -----------------------------------------------------------------------------
void to_json(json& j, const VaultSnapshot& snapshot) {
  j = json{{"vault_id", snapshot.vault_id},
           {"state", snapshot.state},
           {"holdings", snapshot.holdings},
           {"share_balances", snapshot.share_balances},
           {"venues", snapshot.venues}};
  if (snapshot.allocation) {
    j["allocation"] = *snapshot.allocation;
  } else {
    j["allocation"] = nullptr;
  }
}

void from_json(const json& j, VaultSnapshot& snapshot) {
  j.at("vault_id").get_to(snapshot.vault_id);
  j.at("state").get_to(snapshot.state);
  j.at("holdings").get_to(snapshot.holdings);
  j.at("share_balances").get_to(snapshot.share_balances);
  j.at("venues").get_to(snapshot.venues);

  const auto& allocation = j.at("allocation");
  if (allocation.is_null()) {
    snapshot.allocation.reset();
  } else {
    snapshot.allocation = allocation.get<std::vector<AllocationEntry>>();
  }
}

}  // namespace domain
}  // namespace vault
