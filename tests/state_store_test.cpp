// =============================================================================
// state_store_test.cpp
// =============================================================================
// Unit tests for tradeledger::StateStore.
//
// Validates:
//   - createTrade writes a Created snapshot and rejects bad input in order
//   - The legal transition graph, and that Settled is terminal
//   - Snapshot chains and transition history link back to creation
//   - Age and maturity queries against the simulated clock
//   - Rollback of an uncommitted transaction leaves no trace
// =============================================================================

#include "ledger_fixture.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <utility>
#include <variant>
#include <vector>

using ledger_test::kEffective;
using ledger_test::kMaturity;
using ledger_test::kStart;
using tradeledger::LedgerTransaction;
using tradeledger::StateStore;
using tradeledger::domain::ProductType;
using tradeledger::domain::TradeState;

class StateStoreTest : public ledger_test::LedgerFixture {};

// -----------------------------------------------------------------------------
// 1. A new trade starts in Created with a root snapshot.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, CreateTradeWritesCreationSnapshot) {
  const auto snap = states.createTrade("IRS-1", ProductType::InterestRateSwap,
                                       {"PARTY-A", "PARTY-B"}, kEffective,
                                       kMaturity);

  EXPECT_EQ(snap.snapshot_id, 1u);
  EXPECT_EQ(snap.trade_id, "IRS-1");
  EXPECT_EQ(snap.state, TradeState::Created);
  EXPECT_EQ(snap.product_type, ProductType::InterestRateSwap);
  EXPECT_EQ(snap.timestamp, kStart);
  EXPECT_TRUE(snap.causing_event_id.empty());
  EXPECT_EQ(snap.previous_snapshot_id, tradeledger::domain::kNoSnapshot);
  EXPECT_EQ(snap.effective_date, kEffective);
  EXPECT_EQ(snap.maturity_date, kMaturity);

  EXPECT_TRUE(states.exists("IRS-1"));
  EXPECT_EQ(states.currentState("IRS-1"), TradeState::Created);
  EXPECT_EQ(states.createdAt("IRS-1"), kStart);
  EXPECT_EQ(states.tradeCount(), 1u);
  EXPECT_TRUE(states.transitionHistory("IRS-1").empty());
}

// -----------------------------------------------------------------------------
// 2. Input validation: each failure carries its own code.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, CreateTradeRejectsBadInput) {
  const tradeledger::domain::PartyList parties{"PARTY-A", "PARTY-B"};

  EXPECT_LEDGER_ERROR(states.createTrade("", ProductType::FxForward, parties,
                                         kEffective, kMaturity),
                      InvalidIdentifier);
  EXPECT_LEDGER_ERROR(states.createTrade("T", ProductType::Unspecified,
                                         parties, kEffective, kMaturity),
                      InvalidProductType);
  EXPECT_LEDGER_ERROR(states.createTrade("T", ProductType::FxForward, {},
                                         kEffective, kMaturity),
                      InvalidParties);
  EXPECT_LEDGER_ERROR(states.createTrade("T", ProductType::FxForward,
                                         {"PARTY-A", ""}, kEffective,
                                         kMaturity),
                      InvalidParties);
  EXPECT_LEDGER_ERROR(states.createTrade("T", ProductType::FxForward, parties,
                                         kMaturity, kEffective),
                      InvalidDates);
  EXPECT_LEDGER_ERROR(states.createTrade("T", ProductType::FxForward, parties,
                                         kEffective, kEffective),
                      InvalidDates);

  EXPECT_EQ(states.tradeCount(), 0u);
  EXPECT_EQ(states.snapshotCount(), 0u);
}

TEST_F(StateStoreTest, DuplicateTradeIdRejected) {
  createTrade("IRS-1");
  EXPECT_LEDGER_ERROR(states.createTrade("IRS-1", ProductType::EquitySwap,
                                         {"PARTY-C"}, kEffective, kMaturity),
                      TradeAlreadyExists);
  EXPECT_EQ(states.currentSnapshot("IRS-1").product_type,
            ProductType::InterestRateSwap);
}

// -----------------------------------------------------------------------------
// 3. The transition table: exactly these ten edges are legal.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, TransitionTableMatchesLifecycleGraph) {
  const std::vector<TradeState> all{
      TradeState::Created,   TradeState::Pending, TradeState::Confirmed,
      TradeState::Active,    TradeState::Matured, TradeState::Terminated,
      TradeState::Settled};

  const std::vector<std::pair<TradeState, TradeState>> legal{
      {TradeState::Created, TradeState::Pending},
      {TradeState::Created, TradeState::Confirmed},
      {TradeState::Pending, TradeState::Confirmed},
      {TradeState::Pending, TradeState::Created},
      {TradeState::Confirmed, TradeState::Active},
      {TradeState::Confirmed, TradeState::Terminated},
      {TradeState::Active, TradeState::Matured},
      {TradeState::Active, TradeState::Terminated},
      {TradeState::Matured, TradeState::Settled},
      {TradeState::Terminated, TradeState::Settled}};

  for (TradeState from : all) {
    for (TradeState to : all) {
      const bool expected =
          std::find(legal.begin(), legal.end(), std::make_pair(from, to)) !=
          legal.end();
      EXPECT_EQ(StateStore::isValidTransition(from, to), expected)
          << tradeledger::domain::tradeStateName(from) << " -> "
          << tradeledger::domain::tradeStateName(to);
    }
  }

  EXPECT_TRUE(StateStore::isTerminal(TradeState::Settled));
  EXPECT_FALSE(StateStore::isTerminal(TradeState::Terminated));
  EXPECT_FALSE(StateStore::isTerminal(TradeState::Matured));
}

TEST_F(StateStoreTest, IllegalTransitionLeavesTradeUntouched) {
  createTrade("IRS-1");

  EXPECT_LEDGER_ERROR(states.transitionState("IRS-1", TradeState::Active, "",
                                             "OPS"),
                      IllegalTransition);
  EXPECT_LEDGER_ERROR(states.transitionState("IRS-1", TradeState::Created, "",
                                             "OPS"),
                      IllegalTransition);

  EXPECT_EQ(states.currentState("IRS-1"), TradeState::Created);
  EXPECT_EQ(states.snapshotCount(), 1u);
  EXPECT_TRUE(states.transitionHistory("IRS-1").empty());
}

TEST_F(StateStoreTest, UnknownTradeReportsNotFound) {
  EXPECT_LEDGER_ERROR(states.transitionState("NOPE", TradeState::Pending, "",
                                             "OPS"),
                      TradeNotFound);
  EXPECT_LEDGER_ERROR(states.currentSnapshot("NOPE"), TradeNotFound);
  EXPECT_LEDGER_ERROR(states.snapshotChain("NOPE"), TradeNotFound);
  EXPECT_FALSE(states.isInState("NOPE", TradeState::Created));
  EXPECT_FALSE(states.isInAnyState("NOPE", {TradeState::Created}));
  EXPECT_FALSE(states.findSnapshot(0).has_value());
  EXPECT_FALSE(states.findSnapshot(42).has_value());
}

// -----------------------------------------------------------------------------
// 4. Each transition appends a snapshot linked to its predecessor and a
//    transition row carrying the initiator and causing event.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, SnapshotChainLinksBackToCreation) {
  createTrade("IRS-1");
  clock.advance_by(1000);
  states.transitionState("IRS-1", TradeState::Pending, "EVT-P", "PARTY-A");
  clock.advance_by(1000);
  states.transitionState("IRS-1", TradeState::Confirmed, "EVT-C", "PARTY-B");

  const auto chain = states.snapshotChain("IRS-1");
  ASSERT_EQ(chain.size(), 3u);
  EXPECT_EQ(chain[0].state, TradeState::Created);
  EXPECT_EQ(chain[1].state, TradeState::Pending);
  EXPECT_EQ(chain[2].state, TradeState::Confirmed);
  EXPECT_EQ(chain[1].previous_snapshot_id, chain[0].snapshot_id);
  EXPECT_EQ(chain[2].previous_snapshot_id, chain[1].snapshot_id);
  EXPECT_EQ(chain[2].causing_event_id, "EVT-C");
  EXPECT_EQ(chain[2].timestamp, kStart + 2000);
  EXPECT_EQ(chain[2].parties, chain[0].parties);

  const auto history = states.transitionHistory("IRS-1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].from_state, TradeState::Created);
  EXPECT_EQ(history[0].to_state, TradeState::Pending);
  EXPECT_EQ(history[0].initiator, "PARTY-A");
  EXPECT_EQ(history[0].event_id, "EVT-P");
  EXPECT_EQ(history[1].initiator, "PARTY-B");
  EXPECT_EQ(history[1].validity.valid_from, kStart + 2000);
  EXPECT_FALSE(history[1].validity.valid_to.has_value());

  const auto found = states.findSnapshot(chain[1].snapshot_id);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->state, TradeState::Pending);
}

TEST_F(StateStoreTest, PendingCanReturnToCreated) {
  createTrade("IRS-1");
  states.transitionState("IRS-1", TradeState::Pending, "", "OPS");
  states.transitionState("IRS-1", TradeState::Created, "", "OPS");
  EXPECT_EQ(states.currentState("IRS-1"), TradeState::Created);
  EXPECT_EQ(states.snapshotChain("IRS-1").size(), 3u);
}

TEST_F(StateStoreTest, SettledIsTerminal) {
  createTrade("IRS-1");
  states.transitionState("IRS-1", TradeState::Confirmed, "", "OPS");
  states.transitionState("IRS-1", TradeState::Terminated, "", "OPS");
  states.transitionState("IRS-1", TradeState::Settled, "", "OPS");

  for (TradeState target :
       {TradeState::Created, TradeState::Pending, TradeState::Confirmed,
        TradeState::Active, TradeState::Matured, TradeState::Terminated,
        TradeState::Settled}) {
    EXPECT_LEDGER_ERROR(states.transitionState("IRS-1", target, "", "OPS"),
                        IllegalTransition);
  }
  EXPECT_TRUE(states.isInState("IRS-1", TradeState::Settled));
  EXPECT_TRUE(states.isInAnyState(
      "IRS-1", {TradeState::Matured, TradeState::Settled}));
}

// -----------------------------------------------------------------------------
// 5. Time queries read the clock value passed in.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, AgeAndMaturityQueries) {
  createTrade("IRS-1");

  EXPECT_EQ(states.tradeAgeMs("IRS-1", kStart), 0);
  EXPECT_EQ(states.tradeAgeDays("IRS-1", kStart + tradeledger::days_to_ms(3) +
                                             5000),
            3);
  EXPECT_FALSE(states.hasReachedEffectiveDate("IRS-1", kStart));
  EXPECT_TRUE(states.hasReachedEffectiveDate("IRS-1", kEffective));
  EXPECT_FALSE(states.hasReachedMaturity("IRS-1", kEffective));
  EXPECT_TRUE(states.hasReachedMaturity("IRS-1", kMaturity));

  EXPECT_EQ(states.timeToMaturityMs("IRS-1", kMaturity - 10), 10);
  EXPECT_EQ(states.timeToMaturityMs("IRS-1", kMaturity + 10), 0);
}

// -----------------------------------------------------------------------------
// 6. Writes inside a transaction disappear when it is not committed.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, RollbackRemovesCreatedTrade) {
  {
    LedgerTransaction txn;
    states.createTrade("IRS-1", ProductType::InterestRateSwap,
                       {"PARTY-A", "PARTY-B"}, kEffective, kMaturity, &txn);
    EXPECT_TRUE(states.exists("IRS-1"));
  }
  EXPECT_FALSE(states.exists("IRS-1"));
  EXPECT_EQ(states.tradeCount(), 0u);
  EXPECT_EQ(states.snapshotCount(), 0u);
  EXPECT_TRUE(states.tradeIds().empty());

  // The id is free again after the rollback.
  createTrade("IRS-1");
  EXPECT_EQ(states.currentSnapshot("IRS-1").snapshot_id, 1u);
}

TEST_F(StateStoreTest, RollbackRestoresPreviousState) {
  createTrade("IRS-1");
  {
    LedgerTransaction txn;
    states.transitionState("IRS-1", TradeState::Pending, "EVT-1", "OPS", &txn);
    states.transitionState("IRS-1", TradeState::Confirmed, "EVT-2", "OPS",
                           &txn);
    txn.rollback();
  }
  EXPECT_EQ(states.currentState("IRS-1"), TradeState::Created);
  EXPECT_EQ(states.snapshotCount(), 1u);
  EXPECT_TRUE(states.transitionHistory("IRS-1").empty());
}

TEST_F(StateStoreTest, CommittedTransactionQueuesStateUpdates) {
  LedgerTransaction txn;
  states.createTrade("IRS-1", ProductType::InterestRateSwap,
                     {"PARTY-A", "PARTY-B"}, kEffective, kMaturity, &txn);
  states.transitionState("IRS-1", TradeState::Confirmed, "EVT-1", "OPS", &txn);
  txn.commit();

  auto updates = txn.takeUpdates();
  ASSERT_EQ(updates.size(), 2u);

  const auto* created = std::get_if<tradeledger::TradeStateUpdate>(&updates[0]);
  ASSERT_NE(created, nullptr);
  EXPECT_FALSE(created->previous_state.has_value());
  EXPECT_EQ(created->snapshot.state, TradeState::Created);

  const auto* confirmed =
      std::get_if<tradeledger::TradeStateUpdate>(&updates[1]);
  ASSERT_NE(confirmed, nullptr);
  ASSERT_TRUE(confirmed->previous_state.has_value());
  EXPECT_EQ(*confirmed->previous_state, TradeState::Created);
  EXPECT_EQ(confirmed->snapshot.state, TradeState::Confirmed);
}
