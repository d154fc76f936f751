#pragma once

#include "vault/concurrent/sequence_generator.hpp"
#include "vault/config/vault_config.hpp"
#include "vault/custody/i_asset_custody.hpp"
#include "vault/domain/asset.hpp"
#include "vault/domain/target_allocation.hpp"
#include "vault/domain/vault_snapshot.hpp"
#include "vault/domain/vault_state.hpp"
#include "vault/eventbus/event_bus.hpp"
#include "vault/ledger/share_ledger.hpp"
#include "vault/oracle/i_price_oracle.hpp"
#include "vault/rebalance/drift_planner.hpp"
#include "vault/settlement/accountability_policy.hpp"
#include "vault/settlement/fee_settlement.hpp"
#include "vault/storage/vault_state_store.hpp"
#include "vault/time/i_time_provider.hpp"
#include "vault/venue/i_native_wrapper.hpp"
#include "vault/venue/i_route_executor.hpp"
#include "vault/venue/quote_router.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace vault {

// One asset transfer made by redeem().
struct RedeemPayout {
  domain::AssetId asset;
  domain::Uint256 amount{0};
};

// Per-asset line of currentAllocation().
struct AllocationView {
  domain::AssetId asset;
  domain::Uint256 balance{0};
  domain::Uint256 value_usd{0};
  std::uint32_t actual_bps{0};
  std::uint32_t target_bps{0};
};

// -----------------------------------------------------------------------------
// RebalanceResult
// -----------------------------------------------------------------------------
// traded == false: every weight was within tolerance and no venue was
// touched. value_after then equals value_before.
//
// value_before / value_after bound the value-loss check of this call.
// Fees settle on fee_baseline → value_after, which also captures oracle
// drift since the previous rebalance.
// -----------------------------------------------------------------------------
struct RebalanceResult {
  domain::Uint256 value_before{0};
  domain::Uint256 value_after{0};
  domain::Uint256 fee_baseline{0};
  std::vector<TradeFill> trades;
  SettlementOutcome settlement;
  bool traded{false};
};

// Re-binds quoter/executor handles to a persisted venue row. Returning
// nullopt fails the restore with NotConfigured.
using VenueResolver =
    std::function<std::optional<VenueConfig>(const domain::VenueDescriptor&)>;

// -----------------------------------------------------------------------------
// VaultEngine
// -----------------------------------------------------------------------------
//
// @brief  Share accounting and rebalancing engine of one vault. Owns the
//         vault's holdings book, share ledger, target allocation, venue
//         table and scalar state, and is the only component that mutates
//         them.
//
// @details
// Holder operations:
//   deposit / depositNative       asset in → shares minted at share price
//   redeem                        shares burned → pro-rata physical payout
//   rebalanceByBestQuote          drift correction through the venue table
//   rebalanceByExternalRoute      one pre-computed aggregator route
//
// Manager operations (caller must equal config.manager, else Unauthorized):
//   updateTargetAllocation, configureVenue, setFeeSplit, pause/unpause,
//   pauseRebalancing/unpauseRebalancing, sweep, setRouteExecutor.
//   pause, pauseRebalancing and updateTargetAllocation additionally require
//   the manager to be accountable (Unaccountable otherwise).
//
// Check order in every mutating call:
//   1. PlatformHalted   oracle reports the platform halted
//   2. role / pause / argument checks, per operation
//
// Transaction model:
//   Every mutating call runs inside mutate():
//     - takes the call lock (std::recursive_mutex) for its full duration,
//     - rejects a nested mutating call from an external callback on the
//       same thread with ReentrantCall,
//     - checkpoints engine-owned state and restores it if anything throws,
//     - recomputes the share price from current oracle prices once the
//       operation body has succeeded,
//     - writes the committed snapshot to the attached VaultStateStore (a
//       failing store rolls the call back too),
//     - publishes the buffered events on the EventBus after the lock is
//       released.
//   External collaborators (custody, venues, wrapper, route executor) are
//   assumed to be transactional with the call: the engine restores its own
//   books, not theirs.
//
// Thread model:
//   Any thread may call any method. Mutating calls are serialized by the
//   call lock; other threads wait. Views take the same (recursive) lock, so
//   they are consistent and may be called from inside an external callback.
//   No background threads, timers or retries.
//
// Ownership:
//   VaultEngine
//    ├── router_          (QuoteRouter: venue table, shared handles)
//    ├── ledger_          (ShareLedger)
//    ├── holdings_        (asset → physical balance)
//    ├── allocation_      (optional TargetAllocation)
//    ├── state_           (VaultState)
//    ├── bus_             (EventBus)
//    ├── oracle_          (const IPriceOracle&, non-owning)
//    ├── custody_         (IAssetCustody&, non-owning)
//    ├── clock_           (const ITimeProvider&, non-owning)
//    └── store_           (VaultStateStore*, optional, non-owning)
// -----------------------------------------------------------------------------
class VaultEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config   Identity, roles, thresholds and optional initial
  //                  allocation. Copied.
  // @param  oracle   Price feed and registry. Must outlive the engine.
  // @param  custody  Transfer layer. Must outlive the engine.
  // @param  clock    Timestamp source for events. Must outlive the engine.
  // @param  wrapper  Optional native wrap/unwrap hook for venues flagged
  //                  wraps_native.
  //
  // @throws VaultError(InvalidParameter) for out-of-range thresholds or an
  //         empty manager; AllocationInvalid / InvalidAsset for a bad
  //         initial allocation.
  // -------------------------------------------------------------------------
  VaultEngine(const VaultConfig& config, const IPriceOracle& oracle,
              IAssetCustody& custody, const ITimeProvider& clock,
              std::shared_ptr<INativeWrapper> wrapper = nullptr);

  VaultEngine(const VaultEngine&) = delete;
  VaultEngine& operator=(const VaultEngine&) = delete;
  VaultEngine(VaultEngine&&) = delete;
  VaultEngine& operator=(VaultEngine&&) = delete;

  // -------------------------------------------------------------------------
  // deposit(holder, asset, amount)
  // -------------------------------------------------------------------------
  //
  // @brief  Pulls `amount` of `asset` from `holder` and mints shares worth
  //         its oracle value at the current share price.
  //
  // @return Shares minted.
  //
  // @details
  // Checks, in order: PlatformHalted, Paused, ZeroAmount (amount == 0),
  // InvalidAsset (not accepted or zero price). An empty vault (supply 0)
  // first resets the share price to $1.00. ZeroShares when the deposit is
  // too small to mint a single share unit.
  // -------------------------------------------------------------------------
  domain::Uint256 deposit(const domain::AccountId& holder,
                          const domain::AssetId& asset,
                          const domain::Uint256& amount);

  // deposit() with the native asset id.
  domain::Uint256 depositNative(const domain::AccountId& holder,
                                const domain::Uint256& amount);

  // -------------------------------------------------------------------------
  // redeem(holder, share_amount)
  // -------------------------------------------------------------------------
  //
  // @brief  Burns `share_amount` of the holder's shares and pays out the
  //         same fraction of every accepted asset the vault holds.
  //
  // @return The non-zero transfers made, in registry order.
  //
  // @details
  // payout(asset) = floor(holding(asset) * share_amount / totalSupply).
  // Physical pro-rata: no price is read for the split. Shares are burned
  // before any transfer. The lifetime withdraw counter grows by
  // share_amount * storedSharePrice / SCALE.
  //
  // Errors: PlatformHalted, Paused, ZeroAmount, InsufficientBalance,
  // InvalidAsset while an accepted asset is priced at zero.
  // -------------------------------------------------------------------------
  std::vector<RedeemPayout> redeem(const domain::AccountId& holder,
                                   const domain::Uint256& share_amount);

  // -------------------------------------------------------------------------
  // rebalanceByBestQuote(caller)
  // -------------------------------------------------------------------------
  //
  // @brief  Moves the vault back to its target allocation by trading
  //         overweight assets into underweight ones through the best venue
  //         for each leg, then settles fees on the value change.
  //
  // @details
  // Steps:
  //   1. Value every accepted asset (totalValueBefore).
  //   2. If every weight is within drift tolerance, skip to step 6.
  //   3. DriftPlanner::plan() → seller×buyer legs.
  //   4. Each leg: QuoteRouter::execute() → book holdings.
  //   5. Re-value. Abort with ValueLossExceeded when below the loss budget,
  //      then with AllocationStillOutOfTolerance when any weight is still
  //      off target.
  //   6. FeeSettlement on VaultState::fee_baseline_usd → after, reset the
  //      baseline to after, refresh the share price. Runs on the no-trade
  //      path too, so oracle drift since the last rebalance is settled.
  //
  // Errors: PlatformHalted, Paused, RebalancingPaused, InsufficientBalance
  // (caller holds no shares), NotConfigured (no allocation), InvalidAsset
  // (a target asset is no longer accepted), NoQuoteAvailable,
  // ExecutionFailed, ValueLossExceeded, AllocationStillOutOfTolerance.
  // Any of them rolls back every leg already booked.
  // -------------------------------------------------------------------------
  RebalanceResult rebalanceByBestQuote(const domain::AccountId& caller);

  // -------------------------------------------------------------------------
  // rebalanceByExternalRoute(caller, route)
  // -------------------------------------------------------------------------
  //
  // @brief  Executes one opaque aggregator route through the configured
  //         IRouteExecutor and books the reported fill.
  //
  // @details
  // Same caller and pause checks as rebalanceByBestQuote. NotConfigured
  // without a route executor. The fill must name two distinct accepted
  // assets (InvalidAsset / InvalidParameter) and spend no more than the
  // vault holds (InsufficientBalance). The value-loss bound always
  // applies; the tolerance check applies when an allocation is configured.
  // -------------------------------------------------------------------------
  RebalanceResult rebalanceByExternalRoute(const domain::AccountId& caller,
                                           const RouteData& route);

  // --- Manager operations ---------------------------------------------------

  void updateTargetAllocation(const domain::AccountId& caller,
                              std::vector<domain::AllocationEntry> table);

  // id == venueCount() appends; an existing id replaces; anything else is
  // InvalidParameter.
  void configureVenue(const domain::AccountId& caller, std::size_t id,
                      VenueConfig config);

  // owner_fee_bps + caller_fee_bps must not exceed 10'000.
  void setFeeSplit(const domain::AccountId& caller,
                   std::uint32_t owner_fee_bps, std::uint32_t caller_fee_bps);

  void pause(const domain::AccountId& caller);
  void unpause(const domain::AccountId& caller);
  void pauseRebalancing(const domain::AccountId& caller);
  void unpauseRebalancing(const domain::AccountId& caller);

  // -------------------------------------------------------------------------
  // sweep(caller, asset, amount, to)
  // -------------------------------------------------------------------------
  // Recovers holdings of an asset the registry no longer accepts (and that
  // therefore no longer counts toward vault value). InvalidAsset for an
  // accepted asset, ZeroAmount, InsufficientBalance above the holding.
  // -------------------------------------------------------------------------
  void sweep(const domain::AccountId& caller, const domain::AssetId& asset,
             const domain::Uint256& amount, const domain::AccountId& to);

  // Installs (or, with nullptr, removes) the external route executor.
  void setRouteExecutor(const domain::AccountId& caller,
                        std::shared_ptr<IRouteExecutor> executor);

  // --- Views ----------------------------------------------------------------

  // Σ over accepted assets of holding * price / 10^decimals.
  // currentTotalValue, currentAllocation and statusJson throw InvalidAsset
  // while any accepted asset is priced at zero, as does every mutating call.
  domain::Uint256 currentTotalValue() const;
  std::vector<AllocationView> currentAllocation() const;
  domain::Uint256 sharePrice() const;
  domain::Uint256 totalSupply() const;
  domain::Uint256 balanceOf(const domain::AccountId& holder) const;
  domain::Uint256 holdingOf(const domain::AssetId& asset) const;
  bool isManagerAccountable() const;
  domain::VaultState state() const;
  std::optional<domain::TargetAllocation> targetAllocation() const;
  std::size_t targetAllocationCount() const;
  std::size_t venueCount() const;

  // Throws InvalidParameter for an unknown id.
  VenueConfig venue(std::size_t id) const;

  std::optional<VenueQuote> bestQuote(const domain::AssetId& in,
                                      const domain::AssetId& out,
                                      const domain::Uint256& amount_in) const;

  // Oracle price (8-decimal USD). InvalidAsset when not accepted.
  domain::Uint256 assetPrice(const domain::AssetId& asset) const;

  // Machine-readable status document (nlohmann::json).
  nlohmann::json statusJson() const;

  domain::VaultSnapshot snapshot() const;
  const VaultConfig& config() const { return config_; }

  // --- Persistence ----------------------------------------------------------

  // Every later successful mutating call is written to `store`. Pass
  // nullptr to detach. The store must outlive the engine (or be detached).
  void attachStateStore(VaultStateStore* store);

  // -------------------------------------------------------------------------
  // restore(store, resolver)
  // -------------------------------------------------------------------------
  // @brief  Replaces the engine's state with the snapshot stored for
  //         config().vault_id.
  //
  // @return false when the store holds no snapshot for this vault (state
  //         unchanged).
  //
  // @throws VaultError(InvalidParameter) for a malformed or mismatched
  //         snapshot, NotConfigured when the resolver cannot bind a venue.
  //         The engine is unchanged on failure.
  // -------------------------------------------------------------------------
  bool restore(const VaultStateStore& store, const VenueResolver& resolver);

  // Committed-event stream. Subscribe here for logging or indexing.
  EventBus& eventBus() { return bus_; }

 private:
  // Engine-owned state captured before every mutating call.
  struct Checkpoint {
    domain::VaultState state;
    std::map<domain::AssetId, domain::Uint256> holdings;
    ShareLedger ledger;
    std::optional<domain::TargetAllocation> allocation;
    std::vector<VenueConfig> venues;
    std::shared_ptr<IRouteExecutor> route_executor;
  };

  // Runs `body` as one atomic, serialized, non-reentrant call (see the
  // class comment). Returns whatever body returns.
  template <typename Fn>
  std::invoke_result_t<Fn&> mutate(const char* operation, Fn&& body);

  Checkpoint capture() const;
  void rollback(Checkpoint checkpoint);

  // Queues an event for publication after commit.
  template <typename EventType>
  void emit(EventType event);

  // Precondition checks. All require mutex_ held.
  void requireOperational() const;
  void requireNotPaused() const;
  void requireManager(const domain::AccountId& caller) const;
  void requireAccountable() const;
  void requireRebalanceAllowed(const domain::AccountId& caller) const;
  void requireTargetAssetsAccepted() const;
  // Every accepted asset has a nonzero price. Checked before any transfer
  // leaves or enters custody.
  void requireAcceptedAssetsPriced() const;

  // Valuation helpers. All require mutex_ held.
  std::vector<domain::AssetValuation> valuate() const;
  domain::Uint256 totalValueLocked() const;
  bool accountableLocked() const;
  void refreshSharePrice(const domain::Uint256& total_value);
  void enforceValueLoss(const domain::Uint256& value_before,
                        const domain::Uint256& value_after) const;
  void enforceTolerance(const std::vector<domain::AssetValuation>& valuations,
                        const domain::Uint256& value_before) const;
  void settleAndPrice(const domain::AccountId& caller, RebalanceResult& result);
  domain::Uint256 holdingLocked(const domain::AssetId& asset) const;
  domain::VaultSnapshot snapshotLocked() const;

  const VaultConfig config_;
  const IPriceOracle& oracle_;
  IAssetCustody& custody_;
  const ITimeProvider& clock_;

  std::optional<AccountabilityPolicy> policy_;
  DriftPlanner planner_;
  FeeSettlement fees_;
  QuoteRouter router_;
  std::shared_ptr<IRouteExecutor> route_executor_;

  domain::VaultState state_;
  std::map<domain::AssetId, domain::Uint256> holdings_;
  ShareLedger ledger_;
  std::optional<domain::TargetAllocation> allocation_;

  EventBus bus_;
  SequenceGenerator sequence_;
  VaultStateStore* store_{nullptr};

  // Call lock. Recursive so views work from inside external callbacks;
  // in_call_ turns nested mutating calls into ReentrantCall.
  mutable std::recursive_mutex mutex_;
  bool in_call_{false};
  std::vector<Event> pending_events_;
};

}  // namespace vault
