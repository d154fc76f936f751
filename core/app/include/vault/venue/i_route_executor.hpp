#pragma once

#include "vault/domain/asset.hpp"

#include <cstdint>
#include <vector>

namespace vault {

// Opaque, aggregator-encoded swap route. The engine never inspects it.
using RouteData = std::vector<std::uint8_t>;

// -----------------------------------------------------------------------------
// RouteFill
// -----------------------------------------------------------------------------
// What an external route actually did: `amount_in` of `asset_in` left the
// vault and `amount_out` of `asset_out` arrived.
// -----------------------------------------------------------------------------
struct RouteFill {
  domain::AssetId asset_in;
  domain::Uint256 amount_in{0};
  domain::AssetId asset_out;
  domain::Uint256 amount_out{0};
};

// -----------------------------------------------------------------------------
// IRouteExecutor: executes a pre-computed aggregator route
// -----------------------------------------------------------------------------
//
// @brief  Backs VaultEngine::rebalanceByExternalRoute. An off-engine party
//         computes a route (e.g. through an aggregator API) and hands the
//         encoded bytes to the engine, which forwards them here.
//
// @details
// The engine validates the reported fill (accepted assets, amount_in within
// holdings) and then applies the same value-loss bound as a best-quote
// rebalance. Throws on execution failure.
// -----------------------------------------------------------------------------
class IRouteExecutor {
 public:
  virtual ~IRouteExecutor() = default;

  virtual RouteFill executeRoute(const RouteData& route) = 0;
};

}  // namespace vault
