// =============================================================================
// execution_recorder_test.cpp
// =============================================================================
// Unit tests for tradeledger::ExecutionRecorder.
//
// Validates:
//   - executeTrade stores the payload, a Processed envelope and moves the
//     trade Created → Confirmed in one transaction
//   - Every validation rule, and that a rejection leaves nothing behind
//   - A second execution of the same trade is refused
// =============================================================================

#include "ledger_fixture.hpp"

#include <gtest/gtest.h>

using ledger_test::kEffective;
using ledger_test::kStart;
using ledger_test::makeExecution;
using tradeledger::ExecutionRequest;
using tradeledger::LedgerTransaction;
using tradeledger::domain::EventStatus;
using tradeledger::domain::EventType;
using tradeledger::domain::TradeState;

class ExecutionRecorderTest : public ledger_test::LedgerFixture {
 protected:
  void SetUp() override { createTrade("IRS-1"); }

  tradeledger::domain::EventRecord execute(const ExecutionRequest& request) {
    LedgerTransaction txn;
    auto record = executions.executeTrade(request, txn);
    txn.commit();
    return record;
  }

  void expectNothingRecorded() {
    EXPECT_FALSE(executions.hasExecution("IRS-1"));
    EXPECT_EQ(events.eventCount(), 0u);
    EXPECT_EQ(states.currentState("IRS-1"), TradeState::Created);
    EXPECT_EQ(states.snapshotCount(), 1u);
  }
};

// -----------------------------------------------------------------------------
// 1. Happy path
// -----------------------------------------------------------------------------
TEST_F(ExecutionRecorderTest, ExecuteConfirmsTrade) {
  auto request = makeExecution("EXE-1", "IRS-1");
  request.broker = "BROKER-X";

  const auto record = execute(request);

  EXPECT_EQ(record.event_type, EventType::Execution);
  EXPECT_EQ(record.status, EventStatus::Processed);
  EXPECT_EQ(record.effective_date, kStart);
  EXPECT_EQ(record.initiator, "PARTY-A");
  EXPECT_EQ(record.involved_parties,
            (tradeledger::domain::PartyList{"PARTY-A", "PARTY-B", "BROKER-X"}));
  EXPECT_EQ(record.before_state_id, 1u);
  EXPECT_EQ(record.after_state_id, 2u);

  EXPECT_EQ(states.currentState("IRS-1"), TradeState::Confirmed);
  const auto history = states.transitionHistory("IRS-1");
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].event_id, "EXE-1");
  EXPECT_EQ(history[0].initiator, "PARTY-A");

  const auto data = executions.executionForTrade("IRS-1");
  ASSERT_TRUE(data.has_value());
  EXPECT_EQ(data->details.venue, "MTF-1");
  EXPECT_DOUBLE_EQ(data->terms.notional, 10'000'000.0);
  EXPECT_EQ(data->broker, std::optional<std::string>("BROKER-X"));
  EXPECT_EQ(executions.findByEvent("EXE-1")->trade_id, "IRS-1");
  EXPECT_EQ(executions.executionCount(), 1u);
}

TEST_F(ExecutionRecorderTest, SecondExecutionRejected) {
  execute(makeExecution("EXE-1", "IRS-1"));
  EXPECT_LEDGER_ERROR(execute(makeExecution("EXE-2", "IRS-1")),
                      AlreadyExecuted);
  EXPECT_FALSE(events.exists("EXE-2"));
}

// -----------------------------------------------------------------------------
// 2. Validation. Each case changes one field of an otherwise valid request.
// -----------------------------------------------------------------------------
TEST_F(ExecutionRecorderTest, RejectsInvalidRequests) {
  {
    auto r = makeExecution("", "IRS-1");
    EXPECT_LEDGER_ERROR(execute(r), InvalidIdentifier);
  }
  {
    auto r = makeExecution("EXE-1", "NOPE");
    EXPECT_LEDGER_ERROR(execute(r), TradeNotFound);
  }
  {
    auto r = makeExecution("EXE-1", "IRS-1");
    r.seller = "PARTY-A";
    EXPECT_LEDGER_ERROR(execute(r), InvalidParties);
  }
  {
    auto r = makeExecution("EXE-1", "IRS-1");
    r.seller.clear();
    EXPECT_LEDGER_ERROR(execute(r), InvalidParties);
  }
  {
    auto r = makeExecution("EXE-1", "IRS-1");
    r.broker = "";
    EXPECT_LEDGER_ERROR(execute(r), InvalidParties);
  }
  {
    auto r = makeExecution("EXE-1", "IRS-1");
    r.trade_date = 0;
    EXPECT_LEDGER_ERROR(execute(r), InvalidDates);
  }
  {
    auto r = makeExecution("EXE-1", "IRS-1");
    r.terms.maturity_date = r.terms.effective_date;
    EXPECT_LEDGER_ERROR(execute(r), InvalidDates);
  }
  {
    auto r = makeExecution("EXE-1", "IRS-1");
    r.details.timestamp = kEffective + 1;
    EXPECT_LEDGER_ERROR(execute(r), InvalidDates);
  }
  {
    auto r = makeExecution("EXE-1", "IRS-1");
    r.terms.notional = 0.0;
    EXPECT_LEDGER_ERROR(execute(r), InvalidNotional);
  }
  {
    auto r = makeExecution("EXE-1", "IRS-1");
    r.terms.notional = -5.0;
    EXPECT_LEDGER_ERROR(execute(r), InvalidNotional);
  }
  expectNothingRecorded();
}

TEST_F(ExecutionRecorderTest, RequiresCreatedState) {
  states.transitionState("IRS-1", TradeState::Pending, "", "OPS");
  EXPECT_LEDGER_ERROR(execute(makeExecution("EXE-1", "IRS-1")),
                      WrongTradeState);
  EXPECT_FALSE(executions.hasExecution("IRS-1"));
  EXPECT_EQ(states.currentState("IRS-1"), TradeState::Pending);
}

TEST_F(ExecutionRecorderTest, EventIdReusedAcrossTradesRejected) {
  createTrade("IRS-2");
  execute(makeExecution("EXE-1", "IRS-1"));
  EXPECT_LEDGER_ERROR(execute(makeExecution("EXE-1", "IRS-2")),
                      EventAlreadyExists);
  EXPECT_FALSE(executions.hasExecution("IRS-2"));
}

// -----------------------------------------------------------------------------
// 3. An uncommitted execution disappears from all three tables.
// -----------------------------------------------------------------------------
TEST_F(ExecutionRecorderTest, RollbackUndoesPayloadEnvelopeAndState) {
  {
    LedgerTransaction txn;
    executions.executeTrade(makeExecution("EXE-1", "IRS-1"), txn);
    EXPECT_EQ(states.currentState("IRS-1"), TradeState::Confirmed);
  }
  expectNothingRecorded();
  EXPECT_FALSE(executions.findByEvent("EXE-1").has_value());

  execute(makeExecution("EXE-1", "IRS-1"));
  EXPECT_TRUE(executions.hasExecution("IRS-1"));
}
