// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for vault::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - Payload fields survive the variant dispatch path
//
// All tests are single-threaded (EventBus in isolation). Delivery from the
// engine is covered in vault_engine_test.cpp.
// =============================================================================

#include "vault/eventbus/event_bus.hpp"
#include "vault/events/event.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  vault::EventBus bus;

  static vault::DepositEvent makeDeposit(const std::string& holder,
                                         std::uint64_t amount) {
    vault::DepositEvent e;
    e.holder = holder;
    e.asset = "usdc";
    e.amount = amount;
    e.value_usd = amount;
    e.shares_minted = amount;
    e.sequence_id = 0;
    return e;
  }

  static vault::AdminEvent makeAdmin(const std::string& action) {
    vault::AdminEvent e;
    e.actor = "manager";
    e.action = action;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const vault::Event&) { ++call_count; });

  bus.publish(makeDeposit("alice", 10));
  bus.publish(makeAdmin("pause"));
  bus.publish(vault::TradeEvent{});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int deposit_count = 0;
  bus.subscribe<vault::DepositEvent>(
      [&deposit_count](const vault::DepositEvent&) { ++deposit_count; });

  bus.publish(makeDeposit("alice", 10));
  bus.publish(makeAdmin("pause"));

  EXPECT_EQ(deposit_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers must all receive the same published event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  int count_c = 0;

  bus.subscribe<vault::AdminEvent>(
      [&count_a](const vault::AdminEvent&) { ++count_a; });
  bus.subscribe<vault::AdminEvent>(
      [&count_b](const vault::AdminEvent&) { ++count_b; });
  bus.subscribe([&count_c](const vault::Event&) { ++count_c; });

  bus.publish(makeAdmin("unpause"));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(count_c, 1);
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback must not fire for future publishes.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<vault::DepositEvent>(
      [&call_count](const vault::DepositEvent&) { ++call_count; });

  bus.publish(makeDeposit("alice", 1));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeDeposit("alice", 2));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unsubscribing an unknown id and publishing to an empty bus are no-ops.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, EmptyBusEdgeCases) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeDeposit("alice", 1)));
}

// -----------------------------------------------------------------------------
// 6. A subscriber that calls publish() inside its callback must not deadlock.
// Scenario: a deposit subscriber publishes an AdminEvent that a second
//           subscriber receives.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int admin_received = 0;

  bus.subscribe<vault::AdminEvent>(
      [&admin_received](const vault::AdminEvent&) { ++admin_received; });

  bus.subscribe<vault::DepositEvent>([this](const vault::DepositEvent& d) {
    bus.publish(makeAdmin("large_deposit:" + d.holder));
  });

  bus.publish(makeDeposit("whale", 1'000'000));

  EXPECT_EQ(admin_received, 1);
}

// -----------------------------------------------------------------------------
// 7. 256-bit payload fields survive publish → dispatch unchanged.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  vault::domain::Uint256 received_amount{0};
  std::string received_holder;

  bus.subscribe<vault::DepositEvent>([&](const vault::DepositEvent& e) {
    received_holder = e.holder;
    received_amount = e.amount;
  });

  vault::DepositEvent big = makeDeposit("bob", 1);
  big.amount = vault::domain::Uint256{1} << 200;
  bus.publish(big);

  EXPECT_EQ(received_holder, "bob");
  EXPECT_EQ(received_amount, vault::domain::Uint256{1} << 200);
}
