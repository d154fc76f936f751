#include "vault/engine/vault_engine.hpp"
#include "vault/errors/vault_error.hpp"
#include "vault/storage/json_codec.hpp"
#include "vault/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace vault {

using domain::AccountId;
using domain::AssetId;
using domain::AssetValuation;
using domain::Uint256;

namespace {

// Marks the engine as inside a mutating call for the lifetime of the scope.
class CallScope {
 public:
  explicit CallScope(bool& flag) : flag_(flag) { flag_ = true; }
  ~CallScope() { flag_ = false; }

  CallScope(const CallScope&) = delete;
  CallScope& operator=(const CallScope&) = delete;

 private:
  bool& flag_;
};

void checkBps(const char* field, std::uint32_t value) {
  if (value > domain::kBpsDenominator) {
    throw VaultError(ErrorCode::InvalidParameter,
                     std::string(field) + " exceeds 10000 bps");
  }
}

std::optional<AccountabilityPolicy> makePolicy(const VaultConfig& config) {
  if (!config.min_owner_bps) {
    return std::nullopt;
  }
  return AccountabilityPolicy(*config.min_owner_bps);
}

ErrorDetail assetDetail(const AssetId& asset) {
  ErrorDetail detail;
  detail.asset = asset;
  return detail;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
VaultEngine::VaultEngine(const VaultConfig& config, const IPriceOracle& oracle,
                         IAssetCustody& custody, const ITimeProvider& clock,
                         std::shared_ptr<INativeWrapper> wrapper)
    : config_(config),
      oracle_(oracle),
      custody_(custody),
      clock_(clock),
      policy_(makePolicy(config)),
      planner_(config.params.drift_tolerance_bps),
      fees_(oracle),
      router_(config.params.quote_slippage_bps, config.wrapped_native,
              std::move(wrapper)) {
  if (config_.manager.empty()) {
    throw VaultError(ErrorCode::InvalidParameter, "manager is empty");
  }
  checkBps("drift_tolerance_bps", config_.params.drift_tolerance_bps);
  checkBps("max_value_loss_bps", config_.params.max_value_loss_bps);
  checkBps("owner_fee_bps + caller_fee_bps",
           config_.fee_split.owner_fee_bps + config_.fee_split.caller_fee_bps);

  state_.fee_split = config_.fee_split;

  if (config_.allocation) {
    allocation_ = domain::TargetAllocation::create(*config_.allocation);
    requireTargetAssetsAccepted();
  }

  std::cout << "[VaultEngine] Vault " << config_.vault_id
            << " created. manager=" << config_.manager
            << " accountability="
            << (policy_ ? std::to_string(policy_->minOwnerBps()) + "bps"
                        : std::string("off"))
            << std::endl;
}

// -----------------------------------------------------------------------------
// mutate: lock, reentrancy guard, checkpoint/rollback, persist, publish
// -----------------------------------------------------------------------------
template <typename Fn>
std::invoke_result_t<Fn&> VaultEngine::mutate(const char* operation,
                                              Fn&& body) {
  using Result = std::invoke_result_t<Fn&>;

  std::vector<Event> committed;
  std::optional<std::conditional_t<std::is_void_v<Result>, bool, Result>>
      result;
  {
    std::lock_guard lock(mutex_);
    if (in_call_) {
      std::cerr << "[VaultEngine] Rejected nested " << operation
                << " from an external callback" << std::endl;
      throw VaultError(ErrorCode::ReentrantCall,
                       std::string(operation) +
                           " called while another operation is in progress");
    }
    CallScope scope(in_call_);
    Checkpoint checkpoint = capture();
    pending_events_.clear();

    try {
      if constexpr (std::is_void_v<Result>) {
        body();
        result.emplace(true);
      } else {
        result.emplace(body());
      }
      refreshSharePrice(totalValueLocked());
      if (store_ != nullptr) {
        store_->save(snapshotLocked());
      }
    } catch (const std::exception& e) {
      rollback(std::move(checkpoint));
      std::cerr << "[VaultEngine] " << operation << " rolled back: " << e.what()
                << std::endl;
      throw;
    } catch (...) {
      rollback(std::move(checkpoint));
      throw;
    }
    committed.swap(pending_events_);
  }

  for (const auto& event : committed) {
    bus_.publish(event);
  }

  if constexpr (!std::is_void_v<Result>) {
    return std::move(*result);
  }
}

VaultEngine::Checkpoint VaultEngine::capture() const {
  return Checkpoint{state_,           holdings_,          ledger_,
                    allocation_,      router_.venues(),   route_executor_};
}

void VaultEngine::rollback(Checkpoint checkpoint) {
  state_ = std::move(checkpoint.state);
  holdings_ = std::move(checkpoint.holdings);
  ledger_ = std::move(checkpoint.ledger);
  allocation_ = std::move(checkpoint.allocation);
  router_.setVenues(std::move(checkpoint.venues));
  route_executor_ = std::move(checkpoint.route_executor);
  pending_events_.clear();
}

template <typename EventType>
void VaultEngine::emit(EventType event) {
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  event.sequence_id = sequence_.next_id();
  pending_events_.emplace_back(std::move(event));
}

// -----------------------------------------------------------------------------
// Preconditions
// -----------------------------------------------------------------------------
void VaultEngine::requireOperational() const {
  if (!oracle_.isPlatformOperational()) {
    throw VaultError(ErrorCode::PlatformHalted, "platform is halted");
  }
}

void VaultEngine::requireNotPaused() const {
  if (state_.paused) {
    throw VaultError(ErrorCode::Paused, "vault " + config_.vault_id +
                                            " is paused");
  }
}

void VaultEngine::requireManager(const AccountId& caller) const {
  requireOperational();
  if (caller != config_.manager) {
    throw VaultError(ErrorCode::Unauthorized,
                     caller + " is not the manager of " + config_.vault_id);
  }
}

void VaultEngine::requireAccountable() const {
  if (!accountableLocked()) {
    ErrorDetail detail;
    detail.asset = config_.manager;
    detail.actual = ledger_.balanceOf(config_.manager);
    detail.limit = ledger_.totalSupply();
    throw VaultError(ErrorCode::Unaccountable,
                     "manager stake below the accountability threshold",
                     detail);
  }
}

void VaultEngine::requireRebalanceAllowed(const AccountId& caller) const {
  requireOperational();
  requireNotPaused();
  if (state_.rebalancing_paused) {
    throw VaultError(ErrorCode::RebalancingPaused,
                     "rebalancing is paused on " + config_.vault_id);
  }
  if (ledger_.balanceOf(caller) == 0) {
    ErrorDetail detail;
    detail.asset = caller;
    throw VaultError(ErrorCode::InsufficientBalance,
                     caller + " holds no shares and cannot rebalance", detail);
  }
}

void VaultEngine::requireTargetAssetsAccepted() const {
  for (const auto& entry : allocation_->entries()) {
    if (!oracle_.isAssetAccepted(entry.asset)) {
      throw VaultError(ErrorCode::InvalidAsset,
                       "target asset " + entry.asset + " is not accepted",
                       assetDetail(entry.asset));
    }
  }
}

void VaultEngine::requireAcceptedAssetsPriced() const {
  for (const auto& asset : oracle_.acceptedAssets()) {
    if (oracle_.getPrice(asset) == 0) {
      throw VaultError(ErrorCode::InvalidAsset,
                       "accepted asset " + asset + " has no price",
                       assetDetail(asset));
    }
  }
}

// -----------------------------------------------------------------------------
// Valuation helpers
// -----------------------------------------------------------------------------
std::vector<AssetValuation> VaultEngine::valuate() const {
  requireAcceptedAssetsPriced();
  std::vector<AssetValuation> valuations;
  for (const auto& asset : oracle_.acceptedAssets()) {
    AssetValuation v;
    v.asset = asset;
    v.balance = holdingLocked(asset);
    v.price = oracle_.getPrice(asset);
    v.decimals = oracle_.decimals(asset);
    v.value_usd = domain::toUsdValue(v.balance, v.price, v.decimals);
    valuations.push_back(std::move(v));
  }
  return valuations;
}

Uint256 VaultEngine::totalValueLocked() const {
  return DriftPlanner::totalValue(valuate());
}

Uint256 VaultEngine::holdingLocked(const AssetId& asset) const {
  auto it = holdings_.find(asset);
  return it == holdings_.end() ? Uint256{0} : it->second;
}

bool VaultEngine::accountableLocked() const {
  return !policy_ || policy_->isAccountable(ledger_, config_.manager);
}

void VaultEngine::refreshSharePrice(const Uint256& total_value) {
  state_.share_price_usd =
      domain::computeSharePrice(total_value, ledger_.totalSupply());
}

void VaultEngine::enforceValueLoss(const Uint256& value_before,
                                   const Uint256& value_after) const {
  const Uint256 floor = domain::applyBps(
      value_before, domain::kBpsDenominator - config_.params.max_value_loss_bps);
  if (value_after < floor) {
    ErrorDetail detail;
    detail.actual = value_after;
    detail.limit = floor;
    detail.value_before = value_before;
    throw VaultError(ErrorCode::ValueLossExceeded,
                     "value fell from " + value_before.str() + " to " +
                         value_after.str() + " (floor " + floor.str() + ")",
                     detail);
  }
}

void VaultEngine::enforceTolerance(
    const std::vector<AssetValuation>& valuations,
    const Uint256& value_before) const {
  auto off = planner_.firstOutOfTolerance(valuations, *allocation_);
  if (off) {
    ErrorDetail detail;
    detail.asset = off->asset;
    detail.actual = Uint256{off->actual_bps};
    detail.limit = Uint256{off->target_bps};
    detail.value_before = value_before;
    throw VaultError(ErrorCode::AllocationStillOutOfTolerance,
                     off->asset + " at " + std::to_string(off->actual_bps) +
                         " bps, target " + std::to_string(off->target_bps) +
                         " bps",
                     detail);
  }
}

// -----------------------------------------------------------------------------
// settleAndPrice: fee settlement on baseline → after, then the new price
// -----------------------------------------------------------------------------
void VaultEngine::settleAndPrice(const AccountId& caller,
                                 RebalanceResult& result) {
  const bool accountable = accountableLocked();
  result.fee_baseline = state_.fee_baseline_usd;
  result.settlement = fees_.settle(
      ledger_, result.fee_baseline, result.value_after,
      SettlementParties{config_.manager, config_.platform_account, caller},
      state_.fee_split, accountable);
  state_.fee_baseline_usd = result.value_after;
  refreshSharePrice(result.value_after);

  const auto& s = result.settlement;
  if (s.platform_shares > 0 || s.owner_shares > 0 || s.caller_shares > 0 ||
      s.penalty_shares > 0) {
    FeeSettlementEvent event;
    event.gain = s.gain;
    event.loss = s.loss;
    event.platform_shares = s.platform_shares;
    event.owner_shares = s.owner_shares;
    event.caller_shares = s.caller_shares;
    event.penalty_shares = s.penalty_shares;
    event.accountable = s.accountable;
    emit(std::move(event));
  }

  RebalanceEvent event;
  event.caller = caller;
  event.value_before = result.value_before;
  event.value_after = result.value_after;
  event.trade_count = result.trades.size();
  event.traded = result.traded;
  event.share_price = state_.share_price_usd;
  emit(std::move(event));
}

// -----------------------------------------------------------------------------
// deposit
// -----------------------------------------------------------------------------
Uint256 VaultEngine::deposit(const AccountId& holder, const AssetId& asset,
                             const Uint256& amount) {
  return mutate("deposit", [&]() -> Uint256 {
    requireOperational();
    requireNotPaused();
    if (amount == 0) {
      throw VaultError(ErrorCode::ZeroAmount, "deposit amount is zero",
                       assetDetail(asset));
    }
    if (!oracle_.isAssetAccepted(asset)) {
      throw VaultError(ErrorCode::InvalidAsset,
                       asset + " is not accepted for deposit",
                       assetDetail(asset));
    }
    const Uint256 price = oracle_.getPrice(asset);
    if (price == 0) {
      throw VaultError(ErrorCode::InvalidAsset, asset + " has no price",
                       assetDetail(asset));
    }
    requireAcceptedAssetsPriced();

    const Uint256 value =
        domain::toUsdValue(amount, price, oracle_.decimals(asset));

    if (ledger_.totalSupply() == 0) {
      state_.share_price_usd = Uint256{domain::kInitialSharePrice};
    } else if (state_.share_price_usd == 0) {
      throw VaultError(ErrorCode::ZeroShares,
                       "share price is zero with shares outstanding",
                       assetDetail(asset));
    }

    const Uint256 mint_price = state_.share_price_usd;
    const Uint256 shares = domain::sharesForValue(value, mint_price);
    if (shares == 0) {
      ErrorDetail detail = assetDetail(asset);
      detail.actual = value;
      throw VaultError(ErrorCode::ZeroShares,
                       "deposit too small to mint a share unit", detail);
    }

    custody_.collect(holder, asset, amount);

    holdings_[asset] += amount;
    state_.total_deposit_value_usd += value;
    state_.fee_baseline_usd += value;
    ledger_.mint(holder, shares);

    DepositEvent event;
    event.holder = holder;
    event.asset = asset;
    event.amount = amount;
    event.value_usd = value;
    event.shares_minted = shares;
    event.share_price = mint_price;
    emit(std::move(event));
    return shares;
  });
}

Uint256 VaultEngine::depositNative(const AccountId& holder,
                                   const Uint256& amount) {
  return deposit(holder, domain::kNativeAsset, amount);
}

// -----------------------------------------------------------------------------
// redeem: burn first, then pay out every accepted asset pro rata
// -----------------------------------------------------------------------------
std::vector<RedeemPayout> VaultEngine::redeem(const AccountId& holder,
                                              const Uint256& share_amount) {
  return mutate("redeem", [&]() -> std::vector<RedeemPayout> {
    requireOperational();
    requireNotPaused();
    if (share_amount == 0) {
      throw VaultError(ErrorCode::ZeroAmount, "redeem amount is zero");
    }
    const Uint256 balance = ledger_.balanceOf(holder);
    if (share_amount > balance) {
      ErrorDetail detail;
      detail.asset = holder;
      detail.actual = balance;
      detail.limit = share_amount;
      throw VaultError(ErrorCode::InsufficientBalance,
                       holder + " redeems more shares than held", detail);
    }
    requireAcceptedAssetsPriced();

    const Uint256 supply = ledger_.totalSupply();
    std::vector<RedeemPayout> payouts;
    for (const auto& asset : oracle_.acceptedAssets()) {
      const Uint256 amount =
          domain::mulDiv(holdingLocked(asset), share_amount, supply);
      if (amount > 0) {
        payouts.push_back({asset, amount});
      }
    }

    const Uint256 withdraw_value =
        domain::valueOfShares(share_amount, state_.share_price_usd);
    state_.fee_baseline_usd -=
        domain::mulDiv(state_.fee_baseline_usd, share_amount, supply);
    ledger_.burn(holder, share_amount);

    RedeemEvent redeem_event;
    redeem_event.holder = holder;
    redeem_event.shares_burned = share_amount;
    redeem_event.value_usd = withdraw_value;
    emit(std::move(redeem_event));

    for (const auto& payout : payouts) {
      holdings_[payout.asset] -= payout.amount;
      custody_.release(holder, payout.asset, payout.amount);

      PayoutEvent event;
      event.recipient = holder;
      event.asset = payout.asset;
      event.amount = payout.amount;
      event.reason = "redeem";
      emit(std::move(event));
    }

    state_.total_withdraw_value_usd += withdraw_value;
    return payouts;
  });
}

// -----------------------------------------------------------------------------
// rebalanceByBestQuote
// -----------------------------------------------------------------------------
RebalanceResult VaultEngine::rebalanceByBestQuote(const AccountId& caller) {
  return mutate("rebalanceByBestQuote", [&]() -> RebalanceResult {
    requireRebalanceAllowed(caller);
    if (!allocation_) {
      throw VaultError(ErrorCode::NotConfigured,
                       "no target allocation configured");
    }
    requireTargetAssetsAccepted();

    RebalanceResult result;
    const auto before = valuate();
    result.value_before = DriftPlanner::totalValue(before);
    result.value_after = result.value_before;
    result.traded =
        planner_.firstOutOfTolerance(before, *allocation_).has_value();

    if (result.traded) {
      const CorrectionPlan plan = planner_.plan(before, *allocation_);
      for (const auto& leg : plan.legs) {
        TradeFill fill =
            router_.execute(leg.sell_asset, leg.buy_asset, leg.amount_in);
        holdings_[leg.sell_asset] -= fill.amount_in;
        holdings_[leg.buy_asset] += fill.amount_out;

        TradeEvent event;
        event.venue = fill.venue_name;
        event.asset_in = fill.asset_in;
        event.asset_out = fill.asset_out;
        event.amount_in = fill.amount_in;
        event.quoted_out = fill.quoted_out;
        event.amount_out = fill.amount_out;
        emit(std::move(event));

        result.trades.push_back(std::move(fill));
      }

      const auto after = valuate();
      result.value_after = DriftPlanner::totalValue(after);
      enforceValueLoss(result.value_before, result.value_after);
      enforceTolerance(after, result.value_before);
    }

    settleAndPrice(caller, result);

    std::cout << "[VaultEngine] Rebalance by " << caller << ": "
              << result.trades.size() << " trade(s), value "
              << result.value_before << " -> " << result.value_after
              << std::endl;
    return result;
  });
}

// -----------------------------------------------------------------------------
// rebalanceByExternalRoute
// -----------------------------------------------------------------------------
RebalanceResult VaultEngine::rebalanceByExternalRoute(const AccountId& caller,
                                                      const RouteData& route) {
  return mutate("rebalanceByExternalRoute", [&]() -> RebalanceResult {
    requireRebalanceAllowed(caller);
    if (!route_executor_) {
      throw VaultError(ErrorCode::NotConfigured,
                       "no route executor configured");
    }
    if (allocation_) {
      requireTargetAssetsAccepted();
    }

    RebalanceResult result;
    result.value_before = totalValueLocked();

    RouteFill fill;
    try {
      fill = route_executor_->executeRoute(route);
    } catch (const VaultError&) {
      throw;
    } catch (const std::exception& e) {
      throw VaultError(ErrorCode::ExecutionFailed,
                       std::string("external route failed: ") + e.what());
    }

    if (fill.asset_in == fill.asset_out) {
      throw VaultError(ErrorCode::InvalidParameter,
                       "route swaps " + fill.asset_in + " for itself",
                       assetDetail(fill.asset_in));
    }
    for (const auto* asset : {&fill.asset_in, &fill.asset_out}) {
      if (!oracle_.isAssetAccepted(*asset)) {
        throw VaultError(ErrorCode::InvalidAsset,
                         "route touches unaccepted asset " + *asset,
                         assetDetail(*asset));
      }
    }
    const Uint256 held = holdingLocked(fill.asset_in);
    if (fill.amount_in > held) {
      ErrorDetail detail = assetDetail(fill.asset_in);
      detail.actual = held;
      detail.limit = fill.amount_in;
      throw VaultError(ErrorCode::InsufficientBalance,
                       "route spends more " + fill.asset_in + " than held",
                       detail);
    }

    holdings_[fill.asset_in] -= fill.amount_in;
    holdings_[fill.asset_out] += fill.amount_out;
    result.traded = true;

    TradeFill trade;
    trade.venue_name = "external-route";
    trade.asset_in = fill.asset_in;
    trade.asset_out = fill.asset_out;
    trade.amount_in = fill.amount_in;
    trade.quoted_out = fill.amount_out;
    trade.amount_out = fill.amount_out;

    TradeEvent event;
    event.venue = trade.venue_name;
    event.asset_in = trade.asset_in;
    event.asset_out = trade.asset_out;
    event.amount_in = trade.amount_in;
    event.quoted_out = trade.quoted_out;
    event.amount_out = trade.amount_out;
    emit(std::move(event));
    result.trades.push_back(std::move(trade));

    const auto after = valuate();
    result.value_after = DriftPlanner::totalValue(after);
    enforceValueLoss(result.value_before, result.value_after);
    if (allocation_) {
      enforceTolerance(after, result.value_before);
    }

    settleAndPrice(caller, result);
    return result;
  });
}

// -----------------------------------------------------------------------------
// Manager operations
// -----------------------------------------------------------------------------
void VaultEngine::updateTargetAllocation(
    const AccountId& caller, std::vector<domain::AllocationEntry> table) {
  mutate("updateTargetAllocation", [&]() {
    requireManager(caller);
    requireAccountable();
    allocation_ = domain::TargetAllocation::create(std::move(table));
    requireTargetAssetsAccepted();

    std::string detail;
    for (const auto& entry : allocation_->entries()) {
      detail += entry.asset + "=" + std::to_string(entry.weight) + " ";
    }
    emit(AdminEvent{caller, "update_target_allocation", detail, {}, 0});
    std::cout << "[VaultEngine] Target allocation of " << config_.vault_id
              << " updated: " << detail << std::endl;
  });
}

void VaultEngine::configureVenue(const AccountId& caller, std::size_t id,
                                 VenueConfig config) {
  mutate("configureVenue", [&]() {
    requireManager(caller);
    const std::string name = config.name;
    router_.configureVenue(id, std::move(config));
    emit(AdminEvent{caller, "configure_venue",
                    std::to_string(id) + ":" + name, {}, 0});
  });
}

void VaultEngine::setFeeSplit(const AccountId& caller,
                              std::uint32_t owner_fee_bps,
                              std::uint32_t caller_fee_bps) {
  mutate("setFeeSplit", [&]() {
    requireManager(caller);
    if (static_cast<std::uint64_t>(owner_fee_bps) + caller_fee_bps >
        domain::kBpsDenominator) {
      ErrorDetail detail;
      detail.actual = Uint256{owner_fee_bps} + caller_fee_bps;
      detail.limit = Uint256{domain::kBpsDenominator};
      throw VaultError(ErrorCode::InvalidParameter,
                       "fee split exceeds 10000 bps", detail);
    }
    state_.fee_split = domain::FeeSplit{owner_fee_bps, caller_fee_bps};
    emit(AdminEvent{caller, "set_fee_split",
                    "owner=" + std::to_string(owner_fee_bps) +
                        " caller=" + std::to_string(caller_fee_bps),
                    {}, 0});
  });
}

void VaultEngine::pause(const AccountId& caller) {
  mutate("pause", [&]() {
    requireManager(caller);
    requireAccountable();
    state_.paused = true;
    emit(AdminEvent{caller, "pause", "", {}, 0});
    std::cout << "[VaultEngine] Vault " << config_.vault_id << " paused"
              << std::endl;
  });
}

void VaultEngine::unpause(const AccountId& caller) {
  mutate("unpause", [&]() {
    requireManager(caller);
    state_.paused = false;
    emit(AdminEvent{caller, "unpause", "", {}, 0});
    std::cout << "[VaultEngine] Vault " << config_.vault_id << " unpaused"
              << std::endl;
  });
}

void VaultEngine::pauseRebalancing(const AccountId& caller) {
  mutate("pauseRebalancing", [&]() {
    requireManager(caller);
    requireAccountable();
    state_.rebalancing_paused = true;
    emit(AdminEvent{caller, "pause_rebalancing", "", {}, 0});
  });
}

void VaultEngine::unpauseRebalancing(const AccountId& caller) {
  mutate("unpauseRebalancing", [&]() {
    requireManager(caller);
    state_.rebalancing_paused = false;
    emit(AdminEvent{caller, "unpause_rebalancing", "", {}, 0});
  });
}

void VaultEngine::sweep(const AccountId& caller, const AssetId& asset,
                        const Uint256& amount, const AccountId& to) {
  mutate("sweep", [&]() {
    requireManager(caller);
    if (oracle_.isAssetAccepted(asset)) {
      throw VaultError(ErrorCode::InvalidAsset,
                       asset + " is accepted and cannot be swept",
                       assetDetail(asset));
    }
    if (amount == 0) {
      throw VaultError(ErrorCode::ZeroAmount, "sweep amount is zero",
                       assetDetail(asset));
    }
    const Uint256 held = holdingLocked(asset);
    if (amount > held) {
      ErrorDetail detail = assetDetail(asset);
      detail.actual = held;
      detail.limit = amount;
      throw VaultError(ErrorCode::InsufficientBalance,
                       "sweep exceeds holding of " + asset, detail);
    }
    requireAcceptedAssetsPriced();

    holdings_[asset] -= amount;
    if (holdings_[asset] == 0) {
      holdings_.erase(asset);
    }
    custody_.release(to, asset, amount);

    PayoutEvent event;
    event.recipient = to;
    event.asset = asset;
    event.amount = amount;
    event.reason = "sweep";
    emit(std::move(event));
  });
}

void VaultEngine::setRouteExecutor(const AccountId& caller,
                                   std::shared_ptr<IRouteExecutor> executor) {
  mutate("setRouteExecutor", [&]() {
    requireManager(caller);
    const bool installed = executor != nullptr;
    route_executor_ = std::move(executor);
    emit(AdminEvent{caller, "set_route_executor",
                    installed ? "installed" : "removed", {}, 0});
  });
}

// -----------------------------------------------------------------------------
// Views
// -----------------------------------------------------------------------------
Uint256 VaultEngine::currentTotalValue() const {
  std::lock_guard lock(mutex_);
  return totalValueLocked();
}

std::vector<AllocationView> VaultEngine::currentAllocation() const {
  std::lock_guard lock(mutex_);
  const auto valuations = valuate();
  const Uint256 total = DriftPlanner::totalValue(valuations);

  std::vector<AllocationView> views;
  for (const auto& v : valuations) {
    AllocationView view;
    view.asset = v.asset;
    view.balance = v.balance;
    view.value_usd = v.value_usd;
    view.actual_bps =
        total == 0 ? 0
                   : domain::mulDiv(v.value_usd,
                                    Uint256{domain::kBpsDenominator}, total)
                         .convert_to<std::uint32_t>();
    view.target_bps = allocation_ ? allocation_->targetBps(v.asset) : 0;
    views.push_back(std::move(view));
  }
  return views;
}

Uint256 VaultEngine::sharePrice() const {
  std::lock_guard lock(mutex_);
  return state_.share_price_usd;
}

Uint256 VaultEngine::totalSupply() const {
  std::lock_guard lock(mutex_);
  return ledger_.totalSupply();
}

Uint256 VaultEngine::balanceOf(const AccountId& holder) const {
  std::lock_guard lock(mutex_);
  return ledger_.balanceOf(holder);
}

Uint256 VaultEngine::holdingOf(const AssetId& asset) const {
  std::lock_guard lock(mutex_);
  return holdingLocked(asset);
}

bool VaultEngine::isManagerAccountable() const {
  std::lock_guard lock(mutex_);
  return accountableLocked();
}

domain::VaultState VaultEngine::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::optional<domain::TargetAllocation> VaultEngine::targetAllocation() const {
  std::lock_guard lock(mutex_);
  return allocation_;
}

std::size_t VaultEngine::targetAllocationCount() const {
  std::lock_guard lock(mutex_);
  return allocation_ ? allocation_->size() : 0;
}

std::size_t VaultEngine::venueCount() const {
  std::lock_guard lock(mutex_);
  return router_.venueCount();
}

VenueConfig VaultEngine::venue(std::size_t id) const {
  std::lock_guard lock(mutex_);
  if (id >= router_.venueCount()) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "unknown venue id " + std::to_string(id));
  }
  return router_.venues()[id];
}

std::optional<VenueQuote> VaultEngine::bestQuote(
    const AssetId& in, const AssetId& out, const Uint256& amount_in) const {
  std::lock_guard lock(mutex_);
  return router_.bestQuote(in, out, amount_in);
}

Uint256 VaultEngine::assetPrice(const AssetId& asset) const {
  if (!oracle_.isAssetAccepted(asset)) {
    throw VaultError(ErrorCode::InvalidAsset, asset + " is not accepted",
                     assetDetail(asset));
  }
  return oracle_.getPrice(asset);
}

// -----------------------------------------------------------------------------
// statusJson: one document with everything an operator dashboard shows
// -----------------------------------------------------------------------------
nlohmann::json VaultEngine::statusJson() const {
  std::lock_guard lock(mutex_);

  nlohmann::json status;
  status["vault_id"] = config_.vault_id;
  status["manager"] = config_.manager;
  status["state"] = state_;
  status["total_supply"] = ledger_.totalSupply();
  status["total_value_usd"] = totalValueLocked();
  status["holder_count"] = ledger_.holderCount();
  status["manager_accountable"] = accountableLocked();
  status["platform_operational"] = oracle_.isPlatformOperational();

  nlohmann::json allocation = nlohmann::json::array();
  for (const auto& view : currentAllocation()) {
    allocation.push_back({{"asset", view.asset},
                          {"balance", view.balance},
                          {"value_usd", view.value_usd},
                          {"actual_bps", view.actual_bps},
                          {"target_bps", view.target_bps}});
  }
  status["allocation"] = std::move(allocation);

  nlohmann::json venues = nlohmann::json::array();
  for (const auto& venue : router_.venues()) {
    venues.push_back({{"name", venue.name},
                      {"fee_tier", venue.fee_tier},
                      {"enabled", venue.enabled},
                      {"wraps_native", venue.wraps_native}});
  }
  status["venues"] = std::move(venues);
  status["route_executor"] = route_executor_ != nullptr;
  return status;
}

domain::VaultSnapshot VaultEngine::snapshot() const {
  std::lock_guard lock(mutex_);
  return snapshotLocked();
}

domain::VaultSnapshot VaultEngine::snapshotLocked() const {
  domain::VaultSnapshot snapshot;
  snapshot.vault_id = config_.vault_id;
  snapshot.state = state_;
  for (const auto& [asset, amount] : holdings_) {
    if (amount > 0) {
      snapshot.holdings.emplace(asset, amount);
    }
  }
  snapshot.share_balances = ledger_.balances();
  if (allocation_) {
    snapshot.allocation = allocation_->entries();
  }
  for (const auto& venue : router_.venues()) {
    snapshot.venues.push_back(
        {venue.name, venue.fee_tier, venue.enabled, venue.wraps_native});
  }
  return snapshot;
}

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------
void VaultEngine::attachStateStore(VaultStateStore* store) {
  std::lock_guard lock(mutex_);
  store_ = store;
}

bool VaultEngine::restore(const VaultStateStore& store,
                          const VenueResolver& resolver) {
  return mutate("restore", [&]() -> bool {
    auto loaded = store.load(config_.vault_id);
    if (!loaded) {
      return false;
    }
    if (loaded->vault_id != config_.vault_id) {
      throw VaultError(ErrorCode::InvalidParameter,
                       "snapshot belongs to vault " + loaded->vault_id);
    }

    std::vector<VenueConfig> venues;
    for (const auto& descriptor : loaded->venues) {
      std::optional<VenueConfig> bound =
          resolver ? resolver(descriptor) : std::nullopt;
      if (!bound || !bound->quoter || !bound->executor) {
        throw VaultError(ErrorCode::NotConfigured,
                         "cannot bind handles for venue " + descriptor.name);
      }
      bound->name = descriptor.name;
      bound->fee_tier = descriptor.fee_tier;
      bound->enabled = descriptor.enabled;
      bound->wraps_native = descriptor.wraps_native;
      venues.push_back(std::move(*bound));
    }

    state_ = loaded->state;
    holdings_ = loaded->holdings;
    ledger_ = ShareLedger::fromBalances(loaded->share_balances);
    if (loaded->allocation) {
      allocation_ = domain::TargetAllocation::create(*loaded->allocation);
    } else {
      allocation_.reset();
    }
    router_.setVenues(std::move(venues));

    emit(AdminEvent{config_.manager, "restore",
                    std::to_string(ledger_.holderCount()) + " holder(s)",
                    {}, 0});
    std::cout << "[VaultEngine] Vault " << config_.vault_id
              << " restored: supply=" << ledger_.totalSupply()
              << " venues=" << router_.venueCount() << std::endl;
    return true;
  });
}

}  // namespace vault
