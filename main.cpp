// -----------------------------------------------------------------------------
// vault_sim: single executable entry point.
//
// Simulation mode: drives one value-rebalancing vault through a short,
// scripted session against in-memory collaborators.
// Usage: vault_sim [--live-clock] [config.json]
//
//   1) Load the VaultConfig (the path if given, otherwise the built-in one).
//   2) Register assets and prices in an InMemoryPriceOracle and fund holder
//      wallets in an InMemoryCustody.
//   3) Create the VaultEngine, two OracleRateVenue venues, and a persistent
//      VaultStateStore over an InMemoryKeyValueStore.
//   4) Subscribe logging callbacks on the engine's EventBus.
//   5) Deposits → price move → rebalance → redeem, advancing the
//      SimulationTimeProvider between steps. With --live-clock events are
//      stamped by the LiveTimeProvider instead and the steps do not advance
//      anything.
//   6) Restore the persisted snapshot into a second engine, then print the
//      status document.
//
// Thread layout:
//   main thread only. VaultEngine has no background threads; every event
//   callback runs on the main thread after the call that produced it.
// -----------------------------------------------------------------------------

#include "vault/config/vault_config.hpp"
#include "vault/custody/in_memory_custody.hpp"
#include "vault/domain/fixed_point.hpp"
#include "vault/engine/vault_engine.hpp"
#include "vault/errors/vault_error.hpp"
#include "vault/events/event.hpp"
#include "vault/oracle/in_memory_price_oracle.hpp"
#include "vault/storage/in_memory_key_value_store.hpp"
#include "vault/storage/vault_state_store.hpp"
#include "vault/time/live_time_provider.hpp"
#include "vault/time/simulation_time_provider.hpp"
#include "vault/venue/oracle_rate_venue.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>

using vault::domain::Uint256;

namespace {

// Default configuration when no file is passed on the command line.
const char* const kDefaultConfig = R"({
  "vault_id": "balanced-1",
  "manager": "manager",
  "platform_account": "treasury",
  "wrapped_native": "wnative",
  "params": {
    "drift_tolerance_bps": 200,
    "max_value_loss_bps": 50,
    "quote_slippage_bps": 500
  },
  "fee_split": {"owner_fee_bps": 1000, "caller_fee_bps": 100},
  "allocation": [
    {"asset": "usdc", "weight": 50},
    {"asset": "weth", "weight": 50}
  ],
  "min_owner_bps": 500
})";

// Whole units → native units.
Uint256 units(std::uint64_t whole, unsigned decimals) {
  return Uint256{whole} * vault::domain::pow10(decimals);
}

// Whole dollars → 8-decimal oracle price.
Uint256 dollars(std::uint64_t whole) {
  return Uint256{whole} * vault::domain::kPriceScale;
}

void subscribeLoggers(vault::EventBus& bus) {
  bus.subscribe<vault::DepositEvent>([](const vault::DepositEvent& e) {
    std::cout << "[Deposit] seq=" << e.sequence_id << " holder=" << e.holder
              << " asset=" << e.asset << " amount=" << e.amount
              << " value_usd=" << e.value_usd
              << " shares=" << e.shares_minted << "\n";
  });

  bus.subscribe<vault::RedeemEvent>([](const vault::RedeemEvent& e) {
    std::cout << "[Redeem] seq=" << e.sequence_id << " holder=" << e.holder
              << " shares=" << e.shares_burned
              << " value_usd=" << e.value_usd << "\n";
  });

  bus.subscribe<vault::PayoutEvent>([](const vault::PayoutEvent& e) {
    std::cout << "[Payout] seq=" << e.sequence_id << " to=" << e.recipient
              << " asset=" << e.asset << " amount=" << e.amount
              << " reason=" << e.reason << "\n";
  });

  bus.subscribe<vault::TradeEvent>([](const vault::TradeEvent& e) {
    std::cout << "[Trade] seq=" << e.sequence_id << " venue=" << e.venue
              << " " << e.amount_in << " " << e.asset_in << " -> "
              << e.amount_out << " " << e.asset_out
              << " (quoted " << e.quoted_out << ")\n";
  });

  bus.subscribe<vault::FeeSettlementEvent>(
      [](const vault::FeeSettlementEvent& e) {
        std::cout << "[FeeSettlement] seq=" << e.sequence_id
                  << " gain=" << e.gain << " loss=" << e.loss
                  << " platform=" << e.platform_shares
                  << " owner=" << e.owner_shares
                  << " caller=" << e.caller_shares
                  << " penalty=" << e.penalty_shares << "\n";
      });

  bus.subscribe<vault::RebalanceEvent>([](const vault::RebalanceEvent& e) {
    std::cout << "[Rebalance] seq=" << e.sequence_id << " caller=" << e.caller
              << " value " << e.value_before << " -> " << e.value_after
              << " trades=" << e.trade_count
              << " share_price=" << e.share_price << "\n";
  });

  bus.subscribe<vault::AdminEvent>([](const vault::AdminEvent& e) {
    std::cout << "[Admin] seq=" << e.sequence_id << " actor=" << e.actor
              << " action=" << e.action << " " << e.detail << "\n";
  });
}

}  // namespace

int main(int argc, char** argv) {
  try {
    // -----------------------------------------------------------------------
    // 1) Configuration.
    // -----------------------------------------------------------------------
    bool live = false;
    const char* config_path = nullptr;
    for (int i = 1; i < argc; ++i) {
      if (std::strcmp(argv[i], "--live-clock") == 0) {
        live = true;
      } else {
        config_path = argv[i];
      }
    }

    const vault::VaultConfig config =
        config_path != nullptr
            ? vault::loadVaultConfigFile(config_path)
            : vault::loadVaultConfig(nlohmann::json::parse(kDefaultConfig));

    // -----------------------------------------------------------------------
    // 2) Oracle, custody, clock.
    // -----------------------------------------------------------------------
    vault::InMemoryPriceOracle oracle;
    oracle.setAsset("usdc", 6, dollars(1));
    oracle.setAsset("weth", 18, dollars(2000));
    oracle.setPerformanceFeeBps(500);

    vault::InMemoryCustody custody;
    custody.credit(config.manager, "usdc", units(2'000, 6));
    custody.credit("alice", "usdc", units(10'000, 6));
    custody.credit("bob", "weth", units(5, 18));

    vault::SimulationTimeProvider sim_clock(1'700'000'000'000);
    vault::LiveTimeProvider live_clock;
    const vault::ITimeProvider& clock =
        live ? static_cast<const vault::ITimeProvider&>(live_clock)
             : sim_clock;
    auto step = [&](std::int64_t ms) {
      if (!live) {
        sim_clock.advance_by(ms);
      }
    };
    std::cout << "[main] Clock: " << (live ? "live" : "simulation") << "\n";

    // -----------------------------------------------------------------------
    // 3) Engine, venues, persistence.
    // -----------------------------------------------------------------------
    vault::InMemoryKeyValueStore kv;
    vault::VaultStateStore store(kv);

    vault::VaultEngine engine(config, oracle, custody, clock);
    subscribeLoggers(engine.eventBus());
    engine.attachStateStore(&store);

    auto deep_pool = std::make_shared<vault::OracleRateVenue>(oracle, 9'990);
    auto thin_pool = std::make_shared<vault::OracleRateVenue>(oracle, 9'950);

    vault::VenueConfig deep{"deep-pool", deep_pool, deep_pool, 500};
    vault::VenueConfig thin{"thin-pool", thin_pool, thin_pool, 3000};
    engine.configureVenue(config.manager, 0, deep);
    engine.configureVenue(config.manager, 1, thin);

    // -----------------------------------------------------------------------
    // 4) Deposits.
    // -----------------------------------------------------------------------
    engine.deposit(config.manager, "usdc", units(2'000, 6));
    step(60'000);
    engine.deposit("alice", "usdc", units(10'000, 6));
    step(60'000);
    engine.deposit("bob", "weth", units(5, 18));

    // -----------------------------------------------------------------------
    // 5) Price move and rebalance.
    // -----------------------------------------------------------------------
    step(3'600'000);
    oracle.setPrice("weth", dollars(1'800));
    std::cout << "[main] weth repriced to $1800. Vault value="
              << engine.currentTotalValue() << "\n";

    const vault::RebalanceResult result = engine.rebalanceByBestQuote("alice");
    std::cout << "[main] Rebalance traded=" << std::boolalpha << result.traded
              << " legs=" << result.trades.size() << "\n";

    // -----------------------------------------------------------------------
    // 6) Redeem half of alice's shares.
    // -----------------------------------------------------------------------
    step(60'000);
    const Uint256 half = engine.balanceOf("alice") / 2;
    engine.redeem("alice", half);
    std::cout << "[main] alice wallet: usdc=" << custody.balanceOf("alice", "usdc")
              << " weth=" << custody.balanceOf("alice", "weth") << "\n";

    // -----------------------------------------------------------------------
    // 7) Restore the persisted snapshot into a fresh engine.
    // -----------------------------------------------------------------------
    vault::VaultEngine restored(config, oracle, custody, clock);
    const bool found = restored.restore(
        store, [&](const vault::domain::VenueDescriptor& d)
                   -> std::optional<vault::VenueConfig> {
          if (d.name == deep.name) return deep;
          if (d.name == thin.name) return thin;
          return std::nullopt;
        });
    std::cout << "[main] Snapshot restored=" << found
              << " supply matches="
              << (restored.totalSupply() == engine.totalSupply()) << "\n";

    std::cout << engine.statusJson().dump(2) << std::endl;
  } catch (const vault::VaultError& e) {
    std::cerr << "[main] Vault error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] Fatal: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
