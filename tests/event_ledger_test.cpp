// =============================================================================
// event_ledger_test.cpp
// =============================================================================
// Unit tests for tradeledger::EventLedger.
//
// Validates:
//   - validateBasics check order and the NotBeforeNow date rule
//   - store links each record to the previous event of its trade
//   - Pending → Processed / Failed, and that a finalized record is immutable
//   - Per-trade queries with and without a type filter
// =============================================================================

#include "ledger_fixture.hpp"

#include <gtest/gtest.h>

using ledger_test::kEffective;
using ledger_test::kStart;
using tradeledger::EventLedger;
using tradeledger::LedgerTransaction;
using tradeledger::domain::EventStatus;
using tradeledger::domain::EventType;

class EventLedgerTest : public ledger_test::LedgerFixture {
 protected:
  void SetUp() override { createTrade("IRS-1"); }

  tradeledger::domain::EventRecord storeDraft(const std::string& event_id,
                                              EventType type) {
    return events.store(events.draft(event_id, type, "IRS-1", kEffective,
                                     {"PARTY-A", "PARTY-B"}, "PARTY-A",
                                     states.currentSnapshot("IRS-1")
                                         .snapshot_id));
  }
};

// -----------------------------------------------------------------------------
// 1. Shared validation, first failure wins.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, ValidateBasicsRejectsInOrder) {
  storeDraft("EVT-1", EventType::Reset);

  EXPECT_LEDGER_ERROR(events.validateBasics("", "NOPE", kEffective, {}),
                      InvalidIdentifier);
  EXPECT_LEDGER_ERROR(events.validateBasics("EVT-1", "NOPE", kEffective, {}),
                      EventAlreadyExists);
  EXPECT_LEDGER_ERROR(events.validateBasics("EVT-2", "NOPE", kEffective, {}),
                      TradeNotFound);
  EXPECT_LEDGER_ERROR(events.validateBasics("EVT-2", "IRS-1", kEffective, {}),
                      InvalidParties);
  EXPECT_LEDGER_ERROR(
      events.validateBasics("EVT-2", "IRS-1", kEffective, {"PARTY-A", ""}),
      InvalidParties);

  EXPECT_NO_THROW(
      events.validateBasics("EVT-2", "IRS-1", kEffective, {"PARTY-A"}));
}

TEST_F(EventLedgerTest, NotBeforeNowRejectsBackDatedEvents) {
  EXPECT_LEDGER_ERROR(
      events.validateBasics("EVT-1", "IRS-1", kStart - 1, {"PARTY-A"},
                            EventLedger::DateRule::NotBeforeNow),
      InvalidEffectiveDate);
  EXPECT_NO_THROW(events.validateBasics("EVT-1", "IRS-1", kStart,
                                        {"PARTY-A"},
                                        EventLedger::DateRule::NotBeforeNow));
  // The default rule accepts back-dated events.
  EXPECT_NO_THROW(
      events.validateBasics("EVT-1", "IRS-1", kStart - 1, {"PARTY-A"}));
}

// -----------------------------------------------------------------------------
// 2. draft + store
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, DraftIsPendingAndStoreChainsRecords) {
  clock.advance_by(500);
  const auto first = storeDraft("EVT-1", EventType::Reset);
  EXPECT_EQ(first.status, EventStatus::Pending);
  EXPECT_EQ(first.timestamp, kStart + 500);
  EXPECT_EQ(first.effective_date, kEffective);
  EXPECT_EQ(first.validity.valid_from, kEffective);
  EXPECT_EQ(first.before_state_id, 1u);
  EXPECT_EQ(first.after_state_id, tradeledger::domain::kNoSnapshot);
  EXPECT_TRUE(first.previous_event_id.empty());

  const auto second = storeDraft("EVT-2", EventType::Transfer);
  EXPECT_EQ(second.previous_event_id, "EVT-1");

  EXPECT_EQ(events.eventCount(), 2u);
  EXPECT_TRUE(events.exists("EVT-2"));
  EXPECT_EQ(events.lastEventForTrade("IRS-1")->event_id, "EVT-2");
}

TEST_F(EventLedgerTest, StoreRejectsDuplicatesAndUnknownTrades) {
  storeDraft("EVT-1", EventType::Reset);
  EXPECT_LEDGER_ERROR(storeDraft("EVT-1", EventType::Reset),
                      EventAlreadyExists);
  EXPECT_LEDGER_ERROR(
      events.store(events.draft("EVT-9", EventType::Reset, "NOPE", kEffective,
                                {"PARTY-A"}, "PARTY-A", 0)),
      TradeNotFound);
  EXPECT_EQ(events.eventCount(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Finalization
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, MarkProcessedRecordsAfterState) {
  storeDraft("EVT-1", EventType::Execution);
  const auto processed = events.markProcessed("EVT-1", 7);
  EXPECT_EQ(processed.status, EventStatus::Processed);
  EXPECT_EQ(processed.after_state_id, 7u);
  EXPECT_TRUE(events.isProcessed("EVT-1"));
  EXPECT_EQ(events.get("EVT-1").after_state_id, 7u);
}

TEST_F(EventLedgerTest, MarkFailedKeepsReason) {
  storeDraft("EVT-1", EventType::Execution);
  const auto failed = events.markFailed("EVT-1", "counterparty rejected");
  EXPECT_EQ(failed.status, EventStatus::Failed);
  EXPECT_EQ(failed.message, "counterparty rejected");
  EXPECT_EQ(failed.after_state_id, tradeledger::domain::kNoSnapshot);
  EXPECT_FALSE(events.isProcessed("EVT-1"));
}

TEST_F(EventLedgerTest, FinalizedRecordCannotChangeAgain) {
  storeDraft("EVT-1", EventType::Reset);
  storeDraft("EVT-2", EventType::Reset);
  events.markProcessed("EVT-1", 1);
  events.markFailed("EVT-2", "bad fixing");

  EXPECT_LEDGER_ERROR(events.markProcessed("EVT-1", 2),
                      EventAlreadyFinalized);
  EXPECT_LEDGER_ERROR(events.markFailed("EVT-1", "late"),
                      EventAlreadyFinalized);
  EXPECT_LEDGER_ERROR(events.markProcessed("EVT-2", 1),
                      EventAlreadyFinalized);
  EXPECT_LEDGER_ERROR(events.markProcessed("EVT-X", 1), EventNotFound);
  EXPECT_LEDGER_ERROR(events.get("EVT-X"), EventNotFound);

  EXPECT_EQ(events.get("EVT-1").after_state_id, 1u);
  EXPECT_EQ(events.get("EVT-2").message, "bad fixing");
}

// -----------------------------------------------------------------------------
// 4. Queries
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, EventsForTradeFiltersByType) {
  storeDraft("EVT-1", EventType::Reset);
  storeDraft("EVT-2", EventType::Transfer);
  storeDraft("EVT-3", EventType::Reset);

  const auto all = events.eventsForTrade("IRS-1");
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].event_id, "EVT-1");
  EXPECT_EQ(all[2].event_id, "EVT-3");

  const auto resets = events.eventsForTrade("IRS-1", EventType::Reset);
  ASSERT_EQ(resets.size(), 2u);
  EXPECT_EQ(resets[1].event_id, "EVT-3");

  EXPECT_TRUE(events.eventsForTrade("IRS-1", EventType::Termination).empty());
  EXPECT_TRUE(events.eventsForTrade("NOPE").empty());
  EXPECT_FALSE(events.lastEventForTrade("NOPE").has_value());
  EXPECT_FALSE(events.find("EVT-X").has_value());
}

// -----------------------------------------------------------------------------
// 5. Rollback undoes both the store and the status change.
// -----------------------------------------------------------------------------
TEST_F(EventLedgerTest, RollbackRestoresTablesAndChain) {
  storeDraft("EVT-1", EventType::Reset);
  {
    LedgerTransaction txn;
    events.markProcessed("EVT-1", 1, &txn);
    events.store(events.draft("EVT-2", EventType::Transfer, "IRS-1",
                              kEffective, {"PARTY-A"}, "PARTY-A", 1),
                 &txn);
  }
  EXPECT_FALSE(events.exists("EVT-2"));
  EXPECT_EQ(events.get("EVT-1").status, EventStatus::Pending);
  EXPECT_EQ(events.lastEventForTrade("IRS-1")->event_id, "EVT-1");
  EXPECT_EQ(events.eventCount(), 1u);
}
