#pragma once

#include "vault/venue/i_venue.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// VenueConfig: one row of the vault's venue table
// -----------------------------------------------------------------------------
//
// @brief  A named quoter/executor pair plus its routing parameters.
//
// @details
//   name          Stable identifier. Used in logs, events and to re-bind the
//                 handles when a persisted vault is restored.
//   executor      Performs the swap. Required.
//   quoter        Prices the swap. Required.
//   fee_tier      Opaque pool selector forwarded to quoter and executor
//                 (e.g. 500 / 3000 / 10000 hundredths of a bip).
//   enabled       Disabled venues are never quoted.
//   wraps_native  The venue only trades the wrapped form of the native
//                 asset. QuoteRouter substitutes the wrapped-native id and
//                 wraps/unwraps around the trade.
//
// Ownership:
//   Handles are shared: the same simulation venue commonly serves as both
//   quoter and executor, and the engine's rollback checkpoint copies the
//   table.
// -----------------------------------------------------------------------------
struct VenueConfig {
  std::string name;
  std::shared_ptr<IVenueExecutor> executor;
  std::shared_ptr<IVenueQuoter> quoter;
  std::uint32_t fee_tier{3000};
  bool enabled{true};
  bool wraps_native{false};
};

}  // namespace vault
