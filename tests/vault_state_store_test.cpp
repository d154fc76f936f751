// =============================================================================
// vault_state_store_test.cpp
// =============================================================================
// Unit tests for the persistence and configuration layer.
//
// Validates:
//   - VaultStateStore: snapshot documents keep 256-bit values exact, missing
//     keys load as nullopt, malformed documents raise InvalidParameter
//   - VaultEngine::restore: a fresh engine picks up a persisted vault, an
//     absent snapshot is reported, an unbindable venue leaves it untouched
//   - loadVaultConfig: defaults, validation errors, null accountability gate
//   - parseUint256 input checks
// =============================================================================

#include "test_doubles.hpp"

#include "vault/config/vault_config.hpp"
#include "vault/domain/fixed_point.hpp"
#include "vault/engine/vault_engine.hpp"
#include "vault/errors/vault_error.hpp"
#include "vault/oracle/in_memory_price_oracle.hpp"
#include "vault/storage/in_memory_key_value_store.hpp"
#include "vault/storage/json_codec.hpp"
#include "vault/storage/vault_state_store.hpp"
#include "vault/time/simulation_time_provider.hpp"
#include "vault/venue/oracle_rate_venue.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

using nlohmann::json;
using vault::ErrorCode;
using vault::VaultConfig;
using vault::VaultEngine;
using vault::VaultError;
using vault::VaultStateStore;
using vault::VenueConfig;
using vault::domain::Uint256;
using vault::domain::VaultSnapshot;
using vault::domain::VenueDescriptor;

namespace {

template <typename Fn>
ErrorCode errorOf(Fn&& call) {
  try {
    call();
  } catch (const VaultError& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected a VaultError";
  return ErrorCode::InvalidParameter;
}

Uint256 units(std::uint64_t whole) {
  return Uint256{whole} * vault::domain::pow10(18);
}

json minimalConfig() {
  return json{{"vault_id", "v1"}, {"manager", "manager"}};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. A snapshot survives the document round trip, including values far
//    beyond 64 bits.
// -----------------------------------------------------------------------------
TEST(VaultStateStoreTest, SnapshotDocumentKeepsFullPrecision) {
  const Uint256 huge = vault::domain::pow10(70) + 7;

  VaultSnapshot snapshot;
  snapshot.vault_id = "v1";
  snapshot.state.share_price_usd = vault::domain::kPriceScale;
  snapshot.state.total_deposit_value_usd = huge;
  snapshot.state.fee_baseline_usd = huge - 1;
  snapshot.state.rebalancing_paused = true;
  snapshot.state.fee_split = {1'000, 100};
  snapshot.holdings["A"] = huge;
  snapshot.share_balances["alice"] = Uint256{42};
  snapshot.allocation =
      std::vector<vault::domain::AllocationEntry>{{"A", 60}, {"B", 40}};
  snapshot.venues.push_back(VenueDescriptor{"pool", 3'000, false, true});

  const std::string document = VaultStateStore::serialize(snapshot);
  EXPECT_NE(document.find("\"10000000000000000000000000000000000000000000000"
                          "000000000000000000000007\""),
            std::string::npos);

  VaultSnapshot back = VaultStateStore::deserialize(document);
  EXPECT_EQ(back.vault_id, "v1");
  EXPECT_EQ(back.state.total_deposit_value_usd, huge);
  EXPECT_EQ(back.state.fee_baseline_usd, huge - 1);
  EXPECT_TRUE(back.state.rebalancing_paused);
  EXPECT_EQ(back.state.fee_split.caller_fee_bps, 100u);
  EXPECT_EQ(back.holdings.at("A"), huge);
  EXPECT_EQ(back.share_balances.at("alice"), Uint256{42});
  ASSERT_TRUE(back.allocation.has_value());
  EXPECT_EQ((*back.allocation)[1].weight, 40u);
  ASSERT_EQ(back.venues.size(), 1u);
  EXPECT_EQ(back.venues[0].fee_tier, 3'000u);
  EXPECT_FALSE(back.venues[0].enabled);
  EXPECT_TRUE(back.venues[0].wraps_native);
}

// -----------------------------------------------------------------------------
// 2. Missing keys load as nullopt; broken documents are InvalidParameter.
// -----------------------------------------------------------------------------
TEST(VaultStateStoreTest, MissingAndMalformedDocuments) {
  vault::InMemoryKeyValueStore kv;
  VaultStateStore store(kv);

  EXPECT_FALSE(store.load("v1").has_value());
  EXPECT_EQ(VaultStateStore::keyFor("v1"), "vault/v1/snapshot");

  kv.put(VaultStateStore::keyFor("v1"), "{not json");
  EXPECT_EQ(errorOf([&] { store.load("v1"); }), ErrorCode::InvalidParameter);

  kv.put(VaultStateStore::keyFor("v1"), R"({"vault_id":"v1"})");
  EXPECT_EQ(errorOf([&] { store.load("v1"); }), ErrorCode::InvalidParameter);
}

// =============================================================================
// Fixture: two engines over the same oracle, custody and key-value store.
// The first one trades and persists; the second one restores from it.
// =============================================================================
class VaultRestoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    oracle.setAsset("A", 18, vault::domain::kPriceScale);
    oracle.setAsset("B", 18, vault::domain::kPriceScale);

    config.vault_id = "v1";
    config.manager = "manager";
    config.allocation =
        std::vector<vault::domain::AllocationEntry>{{"A", 50}, {"B", 50}};

    original = std::make_unique<VaultEngine>(config, oracle, custody, clock);
    original->attachStateStore(&store);

    VenueConfig pool;
    pool.name = "pool";
    pool.fee_tier = 500;
    pool.quoter = venue;
    pool.executor = venue;
    original->configureVenue("manager", 0, pool);

    custody.credit("manager", "A", units(700));
    custody.credit("alice", "B", units(300));
    original->deposit("manager", "A", units(700));
    original->deposit("alice", "B", units(300));
  }

  std::optional<VenueConfig> resolve(const VenueDescriptor& descriptor) {
    if (descriptor.name != "pool") {
      return std::nullopt;
    }
    VenueConfig bound;
    bound.quoter = venue;
    bound.executor = venue;
    return bound;
  }

  vault::InMemoryPriceOracle oracle;
  vault::InMemoryCustody custody;
  vault::SimulationTimeProvider clock{5'000};
  vault::InMemoryKeyValueStore kv;
  VaultStateStore store{kv};
  VaultConfig config;
  std::shared_ptr<vault::OracleRateVenue> venue =
      std::make_shared<vault::OracleRateVenue>(oracle, 9'990);
  std::unique_ptr<VaultEngine> original;
};

// -----------------------------------------------------------------------------
// 3. Every committed call is persisted; a fresh engine restores it all.
// -----------------------------------------------------------------------------
TEST_F(VaultRestoreTest, FreshEngineRestoresPersistedVault) {
  original->rebalanceByBestQuote("alice");
  original->setFeeSplit("manager", 800, 50);

  VaultEngine restored(config, oracle, custody, clock);
  const bool found = restored.restore(
      store, [this](const VenueDescriptor& d) { return resolve(d); });

  ASSERT_TRUE(found);
  const VaultSnapshot expected = original->snapshot();
  const VaultSnapshot actual = restored.snapshot();
  EXPECT_EQ(actual.share_balances, expected.share_balances);
  EXPECT_EQ(actual.holdings, expected.holdings);
  EXPECT_EQ(actual.state.share_price_usd, expected.state.share_price_usd);
  EXPECT_EQ(actual.state.fee_baseline_usd, expected.state.fee_baseline_usd);
  EXPECT_EQ(actual.state.fee_split.owner_fee_bps, 800u);

  EXPECT_EQ(restored.totalSupply(), original->totalSupply());
  EXPECT_EQ(restored.currentTotalValue(), original->currentTotalValue());
  ASSERT_EQ(restored.venueCount(), 1u);
  EXPECT_EQ(restored.venue(0).name, "pool");
  EXPECT_EQ(restored.venue(0).fee_tier, 500u);

  // The restored vault is live: the next redeem pays out of the restored book.
  const Uint256 alice_shares = restored.balanceOf("alice");
  restored.redeem("alice", alice_shares);
  EXPECT_EQ(restored.balanceOf("alice"), Uint256{0});
}

// -----------------------------------------------------------------------------
// 4. No snapshot: restore reports false and the engine keeps its state.
// -----------------------------------------------------------------------------
TEST_F(VaultRestoreTest, MissingSnapshotReturnsFalse) {
  vault::InMemoryKeyValueStore empty_kv;
  VaultStateStore empty(empty_kv);

  const Uint256 supply = original->totalSupply();
  EXPECT_FALSE(original->restore(
      empty, [this](const VenueDescriptor& d) { return resolve(d); }));
  EXPECT_EQ(original->totalSupply(), supply);
}

// -----------------------------------------------------------------------------
// 5. A venue the resolver cannot bind fails the restore with NotConfigured
//    and leaves the target engine untouched.
// -----------------------------------------------------------------------------
TEST_F(VaultRestoreTest, UnresolvableVenueIsNotConfigured) {
  VaultEngine restored(config, oracle, custody, clock);

  EXPECT_EQ(errorOf([&] {
              restored.restore(store, [](const VenueDescriptor&) {
                return std::optional<VenueConfig>{};
              });
            }),
            ErrorCode::NotConfigured);

  EXPECT_EQ(restored.totalSupply(), Uint256{0});
  EXPECT_EQ(restored.venueCount(), 0u);
}

// -----------------------------------------------------------------------------
// 6. A snapshot stored under another vault's id is rejected.
// -----------------------------------------------------------------------------
TEST_F(VaultRestoreTest, ForeignSnapshotRejected) {
  VaultSnapshot foreign = original->snapshot();
  foreign.vault_id = "v2";
  kv.put(VaultStateStore::keyFor("v1"), VaultStateStore::serialize(foreign));

  VaultEngine restored(config, oracle, custody, clock);
  EXPECT_EQ(errorOf([&] {
              restored.restore(store, [this](const VenueDescriptor& d) {
                return resolve(d);
              });
            }),
            ErrorCode::InvalidParameter);
}

// -----------------------------------------------------------------------------
// 7. A minimal config takes the documented defaults.
// -----------------------------------------------------------------------------
TEST(VaultConfigTest, MinimalDocumentUsesDefaults) {
  VaultConfig config = vault::loadVaultConfig(minimalConfig());

  EXPECT_EQ(config.vault_id, "v1");
  EXPECT_EQ(config.platform_account, "platform");
  EXPECT_EQ(config.params.drift_tolerance_bps, 200u);
  EXPECT_EQ(config.params.max_value_loss_bps, 50u);
  EXPECT_EQ(config.params.quote_slippage_bps, 500u);
  EXPECT_EQ(config.fee_split.owner_fee_bps, 0u);
  EXPECT_FALSE(config.allocation.has_value());
  ASSERT_TRUE(config.min_owner_bps.has_value());
  EXPECT_EQ(*config.min_owner_bps, 500u);
}

// -----------------------------------------------------------------------------
// 8. Full document, then back through toJson.
// -----------------------------------------------------------------------------
TEST(VaultConfigTest, FullDocumentRoundTrips) {
  json document = minimalConfig();
  document["wrapped_native"] = "wnative";
  document["params"] = {{"drift_tolerance_bps", 300}};
  document["fee_split"] = {{"owner_fee_bps", 1'000}, {"caller_fee_bps", 100}};
  document["allocation"] = json::array(
      {{{"asset", "usdc"}, {"weight", 70}}, {{"asset", "weth"}, {"weight", 30}}});
  document["min_owner_bps"] = nullptr;

  VaultConfig config = vault::loadVaultConfig(document);
  EXPECT_EQ(config.wrapped_native, "wnative");
  EXPECT_EQ(config.params.drift_tolerance_bps, 300u);
  EXPECT_EQ(config.params.max_value_loss_bps, 50u);
  EXPECT_EQ(config.fee_split.caller_fee_bps, 100u);
  ASSERT_TRUE(config.allocation.has_value());
  EXPECT_EQ(config.allocation->size(), 2u);
  EXPECT_FALSE(config.min_owner_bps.has_value());

  json written = vault::toJson(config);
  EXPECT_TRUE(written.at("min_owner_bps").is_null());

  VaultConfig again = vault::loadVaultConfig(written);
  EXPECT_EQ(again.params.drift_tolerance_bps, 300u);
  EXPECT_EQ((*again.allocation)[0].asset, "usdc");
  EXPECT_FALSE(again.min_owner_bps.has_value());
}

// -----------------------------------------------------------------------------
// 9. Validation: missing or empty identity fields, oversized bps, bad
//    allocations.
// -----------------------------------------------------------------------------
TEST(VaultConfigTest, RejectsInvalidDocuments) {
  EXPECT_EQ(errorOf([] { vault::loadVaultConfig(json{{"vault_id", "v1"}}); }),
            ErrorCode::InvalidParameter);

  json empty_manager = minimalConfig();
  empty_manager["manager"] = "";
  EXPECT_EQ(errorOf([&] { vault::loadVaultConfig(empty_manager); }),
            ErrorCode::InvalidParameter);

  json loose = minimalConfig();
  loose["params"] = {{"max_value_loss_bps", 10'001}};
  EXPECT_EQ(errorOf([&] { vault::loadVaultConfig(loose); }),
            ErrorCode::InvalidParameter);

  json greedy = minimalConfig();
  greedy["fee_split"] = {{"owner_fee_bps", 9'000}, {"caller_fee_bps", 1'001}};
  EXPECT_EQ(errorOf([&] { vault::loadVaultConfig(greedy); }),
            ErrorCode::InvalidParameter);

  json lopsided = minimalConfig();
  lopsided["allocation"] = json::array(
      {{{"asset", "usdc"}, {"weight", 70}}, {{"asset", "weth"}, {"weight", 20}}});
  EXPECT_EQ(errorOf([&] { vault::loadVaultConfig(lopsided); }),
            ErrorCode::AllocationInvalid);

  EXPECT_EQ(errorOf([] { vault::loadVaultConfigFile("/nonexistent/v.json"); }),
            ErrorCode::InvalidParameter);
}

// -----------------------------------------------------------------------------
// 10. parseUint256 accepts plain decimal digits only.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, ParseUint256) {
  EXPECT_EQ(vault::domain::parseUint256("0"), Uint256{0});
  EXPECT_EQ(vault::domain::parseUint256("18446744073709551616"),
            Uint256{1} << 64);

  EXPECT_EQ(errorOf([] { vault::domain::parseUint256(""); }),
            ErrorCode::InvalidParameter);
  EXPECT_EQ(errorOf([] { vault::domain::parseUint256("-1"); }),
            ErrorCode::InvalidParameter);
  EXPECT_EQ(errorOf([] { vault::domain::parseUint256("12a"); }),
            ErrorCode::InvalidParameter);
  EXPECT_EQ(errorOf([] { vault::domain::parseUint256(std::string(79, '9')); }),
            ErrorCode::InvalidParameter);

  // Plain JSON numbers are accepted on read.
  EXPECT_EQ(json(12u).get<Uint256>(), Uint256{12});
}
