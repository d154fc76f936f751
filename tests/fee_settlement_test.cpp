// =============================================================================
// fee_settlement_test.cpp
// =============================================================================
// Unit tests for vault::FeeSettlement and vault::AccountabilityPolicy.
//
// Validates:
//   - Gain: platform, owner and caller shares minted at the post-rebalance
//     price; owner share withheld when the manager is unaccountable
//   - Loss: penalty burned from the manager, capped at the manager's
//     balance; no burn when unaccountable
//   - No change and zero supply settle nothing
//   - Accountability threshold is inclusive and trivially met at supply 0
//
// Ledger: 1000 shares (manager 100, alice 900), vault worth $1000 before.
// Performance fee 10 %, owner fee 10 %, caller fee 1 %.
// =============================================================================

#include "vault/domain/fixed_point.hpp"
#include "vault/errors/vault_error.hpp"
#include "vault/oracle/in_memory_price_oracle.hpp"
#include "vault/settlement/accountability_policy.hpp"
#include "vault/settlement/fee_settlement.hpp"

#include <gtest/gtest.h>

using vault::AccountabilityPolicy;
using vault::FeeSettlement;
using vault::SettlementOutcome;
using vault::SettlementParties;
using vault::ShareLedger;
using vault::domain::FeeSplit;
using vault::domain::Uint256;

namespace {

Uint256 shares(std::uint64_t whole) {
  return Uint256{whole} * vault::domain::kShareScale;
}

Uint256 usd(std::uint64_t whole) {
  return Uint256{whole} * vault::domain::kPriceScale;
}

}  // namespace

class FeeSettlementTest : public ::testing::Test {
 protected:
  void SetUp() override {
    oracle.setPerformanceFeeBps(1'000);
    ledger.mint("manager", shares(100));
    ledger.mint("alice", shares(900));
  }

  SettlementOutcome settle(const Uint256& before, const Uint256& after,
                           bool accountable) {
    return fees.settle(ledger, before, after, parties, split, accountable);
  }

  vault::InMemoryPriceOracle oracle;
  FeeSettlement fees{oracle};
  ShareLedger ledger;
  SettlementParties parties{"manager", "platform", "keeper"};
  FeeSplit split{1'000, 100};
};

// -----------------------------------------------------------------------------
// 1. A doubling of value mints fees at the doubled price ($2.00 / share).
// -----------------------------------------------------------------------------
TEST_F(FeeSettlementTest, GainMintsFeeShares) {
  SettlementOutcome out = settle(usd(1'000), usd(2'000), true);

  EXPECT_EQ(out.gain, usd(1'000));
  EXPECT_EQ(out.loss, Uint256{0});
  EXPECT_EQ(out.share_price, usd(2));
  EXPECT_EQ(out.platform_shares, shares(50));
  EXPECT_EQ(out.owner_shares, shares(50));
  EXPECT_EQ(out.caller_shares, shares(5));

  EXPECT_EQ(ledger.balanceOf("platform"), shares(50));
  EXPECT_EQ(ledger.balanceOf("manager"), shares(150));
  EXPECT_EQ(ledger.balanceOf("keeper"), shares(5));
  EXPECT_EQ(ledger.totalSupply(), shares(1'105));
}

// -----------------------------------------------------------------------------
// 2. An unaccountable manager forfeits the owner fee; others are still paid.
// -----------------------------------------------------------------------------
TEST_F(FeeSettlementTest, UnaccountableManagerGetsNoOwnerFee) {
  SettlementOutcome out = settle(usd(1'000), usd(2'000), false);

  EXPECT_FALSE(out.accountable);
  EXPECT_EQ(out.owner_shares, Uint256{0});
  EXPECT_EQ(out.platform_shares, shares(50));
  EXPECT_EQ(out.caller_shares, shares(5));
  EXPECT_EQ(ledger.balanceOf("manager"), shares(100));
}

// -----------------------------------------------------------------------------
// 3. A loss burns (owner + caller) bps of it from the manager.
//    $200 loss * 11 % = $22 at $0.80 → 27.5 shares.
// -----------------------------------------------------------------------------
TEST_F(FeeSettlementTest, LossBurnsManagerPenalty) {
  SettlementOutcome out = settle(usd(1'000), usd(800), true);

  const Uint256 expected = shares(275) / 10;
  EXPECT_EQ(out.loss, usd(200));
  EXPECT_EQ(out.penalty_shares, expected);
  EXPECT_EQ(ledger.balanceOf("manager"), shares(100) - expected);
  EXPECT_EQ(ledger.balanceOf("alice"), shares(900));
  EXPECT_EQ(ledger.balanceOf("keeper"), Uint256{0});
}

// -----------------------------------------------------------------------------
// 4. The penalty never exceeds the manager's balance.
//    $500 loss * 11 % = $55 at $0.50 → 110 shares, capped at 100.
// -----------------------------------------------------------------------------
TEST_F(FeeSettlementTest, PenaltyCappedAtManagerBalance) {
  SettlementOutcome out = settle(usd(1'000), usd(500), true);

  EXPECT_EQ(out.penalty_shares, shares(100));
  EXPECT_EQ(ledger.balanceOf("manager"), Uint256{0});
  EXPECT_EQ(ledger.totalSupply(), shares(900));
}

// -----------------------------------------------------------------------------
// 5. No penalty when the manager is unaccountable.
// -----------------------------------------------------------------------------
TEST_F(FeeSettlementTest, UnaccountableManagerNotPenalized) {
  SettlementOutcome out = settle(usd(1'000), usd(800), false);

  EXPECT_EQ(out.loss, usd(200));
  EXPECT_EQ(out.penalty_shares, Uint256{0});
  EXPECT_EQ(ledger.balanceOf("manager"), shares(100));
}

// -----------------------------------------------------------------------------
// 6. No value change, or no shares outstanding: nothing happens.
// -----------------------------------------------------------------------------
TEST_F(FeeSettlementTest, NoChangeOrEmptyLedgerIsNoOp) {
  SettlementOutcome flat = settle(usd(1'000), usd(1'000), true);
  EXPECT_EQ(flat.gain, Uint256{0});
  EXPECT_EQ(flat.loss, Uint256{0});
  EXPECT_EQ(ledger.totalSupply(), shares(1'000));

  ShareLedger empty;
  SettlementOutcome none =
      fees.settle(empty, usd(0), usd(10), parties, split, true);
  EXPECT_EQ(none.platform_shares, Uint256{0});
  EXPECT_EQ(empty.totalSupply(), Uint256{0});
}

// -----------------------------------------------------------------------------
// 7. Accountability: balance * 10000 >= supply * min_owner_bps.
// -----------------------------------------------------------------------------
TEST(AccountabilityPolicyTest, ThresholdIsInclusive) {
  AccountabilityPolicy policy(500);
  ShareLedger ledger;

  EXPECT_TRUE(policy.isAccountable(ledger, "manager"));

  ledger.mint("manager", 5);
  ledger.mint("alice", 95);
  EXPECT_TRUE(policy.isAccountable(ledger, "manager"));

  ledger.mint("alice", 1);
  EXPECT_FALSE(policy.isAccountable(ledger, "manager"));

  EXPECT_EQ(policy.minOwnerBps(), 500u);
  EXPECT_THROW(AccountabilityPolicy(10'001), vault::VaultError);
}
