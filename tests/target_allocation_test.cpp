// =============================================================================
// target_allocation_test.cpp
// =============================================================================
// Unit tests for vault::domain::TargetAllocation.
//
// Validates:
//   - A well-formed table is accepted with its order preserved
//   - Each broken rule (empty, zero weight, duplicate, sum != 100) is
//     rejected with AllocationInvalid
//   - weightOf / targetBps / contains lookups
// =============================================================================

#include "vault/domain/target_allocation.hpp"
#include "vault/errors/vault_error.hpp"

#include <gtest/gtest.h>

using vault::ErrorCode;
using vault::VaultError;
using vault::domain::AllocationEntry;
using vault::domain::TargetAllocation;

namespace {

ErrorCode codeOf(std::vector<AllocationEntry> entries) {
  try {
    TargetAllocation::create(std::move(entries));
  } catch (const VaultError& e) {
    return e.code();
  }
  ADD_FAILURE() << "create() accepted an invalid table";
  return ErrorCode::InvalidParameter;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. A valid table is kept as given.
// -----------------------------------------------------------------------------
TEST(TargetAllocationTest, AcceptsValidTable) {
  auto allocation =
      TargetAllocation::create({{"usdc", 60}, {"weth", 30}, {"wbtc", 10}});

  ASSERT_EQ(allocation.size(), 3u);
  EXPECT_EQ(allocation.entries()[0].asset, "usdc");
  EXPECT_EQ(allocation.entries()[2].asset, "wbtc");
  EXPECT_EQ(allocation.weightOf("weth"), 30u);
  EXPECT_EQ(allocation.targetBps("weth"), 3000u);
  EXPECT_TRUE(allocation.contains("wbtc"));
}

// -----------------------------------------------------------------------------
// 2. A single 100 % asset is valid.
// -----------------------------------------------------------------------------
TEST(TargetAllocationTest, SingleAssetIsValid) {
  auto allocation = TargetAllocation::create({{"usdc", 100}});
  EXPECT_EQ(allocation.targetBps("usdc"), 10'000u);
}

// -----------------------------------------------------------------------------
// 3. Every structural rule is enforced.
// -----------------------------------------------------------------------------
TEST(TargetAllocationTest, RejectsBrokenTables) {
  EXPECT_EQ(codeOf({}), ErrorCode::AllocationInvalid);
  EXPECT_EQ(codeOf({{"usdc", 100}, {"weth", 0}}),
            ErrorCode::AllocationInvalid);
  EXPECT_EQ(codeOf({{"usdc", 50}, {"usdc", 50}}),
            ErrorCode::AllocationInvalid);
  EXPECT_EQ(codeOf({{"usdc", 50}, {"weth", 49}}),
            ErrorCode::AllocationInvalid);
  EXPECT_EQ(codeOf({{"usdc", 60}, {"weth", 41}}),
            ErrorCode::AllocationInvalid);
}

// -----------------------------------------------------------------------------
// 4. Assets outside the table report zero weight.
// -----------------------------------------------------------------------------
TEST(TargetAllocationTest, UnknownAssetHasZeroWeight) {
  auto allocation = TargetAllocation::create({{"usdc", 50}, {"weth", 50}});

  EXPECT_FALSE(allocation.contains("dai"));
  EXPECT_EQ(allocation.weightOf("dai"), 0u);
  EXPECT_EQ(allocation.targetBps("dai"), 0u);
}
