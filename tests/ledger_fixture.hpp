// =============================================================================
// ledger_fixture.hpp
// =============================================================================
// Shared wiring for the component tests: one simulated clock, the two stores
// and all four recorders, plus request builders for a plain USD interest
// rate swap between PARTY-A and PARTY-B.
//
// The clock starts at day 20000 since the epoch. The trade becomes effective
// two days later and matures five years after that.
// =============================================================================

#pragma once

#include "tradeledger/domain/ledger_error.hpp"
#include "tradeledger/domain/trade_state.hpp"
#include "tradeledger/recorders/execution_recorder.hpp"
#include "tradeledger/recorders/reset_recorder.hpp"
#include "tradeledger/recorders/termination_recorder.hpp"
#include "tradeledger/recorders/transfer_recorder.hpp"
#include "tradeledger/store/event_ledger.hpp"
#include "tradeledger/store/ledger_transaction.hpp"
#include "tradeledger/store/state_store.hpp"
#include "tradeledger/time/simulation_time_provider.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>

namespace ledger_test {

inline constexpr std::int64_t kStart = tradeledger::days_to_ms(20000);
inline constexpr std::int64_t kEffective = kStart + tradeledger::days_to_ms(2);
inline constexpr std::int64_t kMaturity =
    kEffective + tradeledger::days_to_ms(5 * 365);

inline const tradeledger::domain::PartyList& defaultParties() {
  static const tradeledger::domain::PartyList parties{"PARTY-A", "PARTY-B"};
  return parties;
}

inline tradeledger::ExecutionRequest makeExecution(
    const std::string& event_id, const std::string& trade_id) {
  tradeledger::ExecutionRequest r;
  r.event_id = event_id;
  r.trade_id = trade_id;
  r.details.venue = "MTF-1";
  r.details.price = 0.0425;
  r.details.confirmation_method =
      tradeledger::domain::ConfirmationMethod::Electronic;
  r.details.timestamp = kStart;
  r.terms.notional = 10'000'000.0;
  r.terms.currency = "USD";
  r.terms.effective_date = kEffective;
  r.terms.maturity_date = kMaturity;
  r.buyer = "PARTY-A";
  r.seller = "PARTY-B";
  r.trade_date = kStart;
  return r;
}

inline tradeledger::ResetRequest makeReset(const std::string& event_id,
                                           const std::string& trade_id,
                                           std::uint32_t reset_number) {
  tradeledger::ResetRequest r;
  r.event_id = event_id;
  r.trade_id = trade_id;
  r.payout_reference = "FLOAT-LEG";
  r.reset_number = reset_number;
  r.observation.rate_index = "SOFR";
  r.observation.source = "FRBNY";
  r.observation.observation_date = kEffective;
  r.observation.observed_rate = 0.0525;
  r.calculation.period_start = kEffective;
  r.calculation.period_end = kEffective + tradeledger::days_to_ms(90);
  r.calculation.notional = 10'000'000.0;
  r.calculation.day_count_fraction = 0.25;
  r.calculation.accrual_amount = 131'250.0;
  r.initiator = "CALC-AGENT";
  return r;
}

inline tradeledger::TransferRequest makeTransfer(const std::string& event_id,
                                                 const std::string& trade_id) {
  tradeledger::TransferRequest r;
  r.event_id = event_id;
  r.trade_id = trade_id;
  r.transfer_type = tradeledger::domain::TransferType::Coupon;
  r.payment.gross_amount = 131'250.0;
  r.payment.net_amount = 131'250.0;
  r.payment.currency = "USD";
  r.payment.direction = tradeledger::domain::TransferDirection::Pay;
  r.payment.value_date = kEffective + tradeledger::days_to_ms(90);
  r.parties.payer = "PARTY-A";
  r.parties.receiver = "PARTY-B";
  r.initiator = "PARTY-A";
  return r;
}

inline tradeledger::TerminationRequest makeTermination(
    const std::string& event_id, const std::string& trade_id) {
  tradeledger::TerminationRequest r;
  r.event_id = event_id;
  r.trade_id = trade_id;
  r.details.type = tradeledger::domain::TerminationType::MutualAgreement;
  r.details.termination_date = kEffective + tradeledger::days_to_ms(30);
  r.details.notification_date = kEffective;
  r.details.reason = "portfolio compression";
  r.payment.method = tradeledger::domain::PaymentMethod::AgreedAmount;
  r.payment.value = 50'000.0;
  r.payment.currency = "USD";
  r.payment.payer = "PARTY-A";
  r.payment.receiver = "PARTY-B";
  r.initiator = "PARTY-A";
  return r;
}

// -----------------------------------------------------------------------------
// LedgerFixture: every component wired to the same clock
// -----------------------------------------------------------------------------
class LedgerFixture : public ::testing::Test {
 protected:
  tradeledger::SimulationTimeProvider clock{kStart};
  tradeledger::StateStore states{clock};
  tradeledger::EventLedger events{states, clock};
  tradeledger::ExecutionRecorder executions{states, events};
  tradeledger::ResetRecorder resets{states, events, clock};
  tradeledger::TransferRecorder transfers{states, events, clock};
  tradeledger::TerminationRecorder terminations{states, events, transfers,
                                                clock};

  void createTrade(const std::string& trade_id) {
    tradeledger::LedgerTransaction txn;
    states.createTrade(trade_id,
                       tradeledger::domain::ProductType::InterestRateSwap,
                       defaultParties(), kEffective, kMaturity, &txn);
    txn.commit();
  }

  // Created → Confirmed through a recorded execution.
  void executeTrade(const std::string& trade_id,
                    const std::string& event_id = "EXE-1") {
    tradeledger::LedgerTransaction txn;
    executions.executeTrade(makeExecution(event_id, trade_id), txn);
    txn.commit();
  }

  // Created → Confirmed → Active, with the clock moved to the effective date.
  void activateTrade(const std::string& trade_id) {
    createTrade(trade_id);
    executeTrade(trade_id, "EXE-" + trade_id);
    clock.advance_time(kEffective);
    tradeledger::LedgerTransaction txn;
    states.transitionState(trade_id, tradeledger::domain::TradeState::Active,
                           "", "OPS", &txn);
    txn.commit();
  }
};

}  // namespace ledger_test

// Runs stmt and expects a LedgerError carrying the given ErrorCode.
#define EXPECT_LEDGER_ERROR(stmt, expected_code)                          \
  do {                                                                    \
    try {                                                                 \
      stmt;                                                               \
      ADD_FAILURE() << "expected LedgerError " #expected_code;            \
    } catch (const tradeledger::LedgerError& e) {                         \
      EXPECT_EQ(e.code(), tradeledger::ErrorCode::expected_code)          \
          << e.what();                                                    \
    }                                                                     \
  } while (0)
