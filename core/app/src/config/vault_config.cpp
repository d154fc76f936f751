#include "vault/config/vault_config.hpp"
#include "vault/errors/vault_error.hpp"
#include "vault/storage/json_codec.hpp"

#include <fstream>
#include <iostream>

namespace vault {

using nlohmann::json;

namespace {

void requireBps(const std::string& field, std::uint32_t value) {
  if (value > domain::kBpsDenominator) {
    ErrorDetail detail;
    detail.actual = domain::Uint256{value};
    detail.limit = domain::Uint256{domain::kBpsDenominator};
    throw VaultError(ErrorCode::InvalidParameter,
                     field + " exceeds 10000 bps", detail);
  }
}

VaultConfig parse(const json& document) {
  VaultConfig config;
  document.at("vault_id").get_to(config.vault_id);
  document.at("manager").get_to(config.manager);
  config.platform_account =
      document.value("platform_account", config.platform_account);
  config.wrapped_native =
      document.value("wrapped_native", config.wrapped_native);

  if (document.contains("params")) {
    document.at("params").get_to(config.params);
  }
  if (document.contains("fee_split")) {
    document.at("fee_split").get_to(config.fee_split);
  }
  if (document.contains("allocation") && !document.at("allocation").is_null()) {
    config.allocation =
        document.at("allocation").get<std::vector<domain::AllocationEntry>>();
  }
  if (document.contains("min_owner_bps")) {
    const auto& bps = document.at("min_owner_bps");
    if (bps.is_null()) {
      config.min_owner_bps.reset();
    } else {
      config.min_owner_bps = bps.get<std::uint32_t>();
    }
  }
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// loadVaultConfig: parse, then validate everything the engine relies on
// -----------------------------------------------------------------------------
VaultConfig loadVaultConfig(const json& document) {
  VaultConfig config;
  try {
    config = parse(document);
  } catch (const json::exception& e) {
    throw VaultError(ErrorCode::InvalidParameter,
                     std::string("invalid vault config: ") + e.what());
  }

  if (config.vault_id.empty()) {
    throw VaultError(ErrorCode::InvalidParameter, "vault_id is empty");
  }
  if (config.manager.empty()) {
    throw VaultError(ErrorCode::InvalidParameter, "manager is empty");
  }

  requireBps("drift_tolerance_bps", config.params.drift_tolerance_bps);
  requireBps("max_value_loss_bps", config.params.max_value_loss_bps);
  requireBps("quote_slippage_bps", config.params.quote_slippage_bps);
  requireBps("owner_fee_bps + caller_fee_bps",
             config.fee_split.owner_fee_bps + config.fee_split.caller_fee_bps);
  if (config.min_owner_bps) {
    requireBps("min_owner_bps", *config.min_owner_bps);
  }

  if (config.allocation) {
    // Validates and discards; the engine re-validates against the oracle.
    domain::TargetAllocation::create(*config.allocation);
  }
  return config;
}

VaultConfig loadVaultConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "cannot open vault config " + path);
  }

  json document;
  try {
    in >> document;
  } catch (const json::exception& e) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "cannot parse vault config " + path + ": " + e.what());
  }

  std::cout << "[VaultConfig] Loaded " << path << std::endl;
  return loadVaultConfig(document);
}

json toJson(const VaultConfig& config) {
  json j{{"vault_id", config.vault_id},
         {"manager", config.manager},
         {"platform_account", config.platform_account},
         {"wrapped_native", config.wrapped_native},
         {"params", config.params},
         {"fee_split", config.fee_split}};
  if (config.allocation) {
    j["allocation"] = *config.allocation;
  }
  if (config.min_owner_bps) {
    j["min_owner_bps"] = *config.min_owner_bps;
  } else {
    j["min_owner_bps"] = nullptr;
  }
  return j;
}

}  // namespace vault
