#pragma once

#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/execution_data.hpp"
#include "tradeledger/store/event_ledger.hpp"
#include "tradeledger/store/ledger_transaction.hpp"
#include "tradeledger/store/state_store.hpp"

#include <optional>
#include <unordered_map>

namespace tradeledger {

// Inputs of executeTrade(), grouped so call sites name every field.
struct ExecutionRequest {
  domain::EventId event_id;
  domain::TradeId trade_id;
  domain::ExecutionDetails details;
  domain::EconomicTerms terms;
  domain::PartyId buyer;
  domain::PartyId seller;
  std::optional<domain::PartyId> broker;
  domain::EpochMillis trade_date{0};
};

// -----------------------------------------------------------------------------
// ExecutionRecorder: a trade's single inception event
// -----------------------------------------------------------------------------
//
// @brief  Records the execution of a Created trade and confirms it.
//
// @details
// executeTrade() runs every check before the first write:
//
//   1. No execution already recorded for the trade  → AlreadyExecuted
//   2. EventLedger::validateBasics over {buyer, seller, [broker]}
//   3. buyer and seller non-empty and distinct;
//      broker, if given, non-empty                   → InvalidParties
//   4. trade date set; maturity after effective;
//      execution time not after effective date       → InvalidDates
//   5. notional > 0                                  → InvalidNotional
//   6. trade currently Created                       → WrongTradeState
//
// then, inside the caller's transaction: stores the ExecutionEventData,
// stores a Pending EventRecord whose before_state_id is the current
// snapshot, transitions the trade Created → Confirmed with the buyer as
// initiator, and marks the event Processed with the new snapshot id.
//
// Thread model / ownership: as StateStore. References to the StateStore and
// EventLedger must outlive the recorder.
// -----------------------------------------------------------------------------
class ExecutionRecorder {
 public:
  ExecutionRecorder(StateStore& states, EventLedger& events);

  ExecutionRecorder(const ExecutionRecorder&) = delete;
  ExecutionRecorder& operator=(const ExecutionRecorder&) = delete;

  // @return The processed EventRecord.
  // @throws LedgerError (see class comment).
  domain::EventRecord executeTrade(const ExecutionRequest& request,
                                   LedgerTransaction& txn);

  bool hasExecution(const domain::TradeId& trade_id) const;

  std::optional<domain::ExecutionEventData> executionForTrade(
      const domain::TradeId& trade_id) const;

  std::optional<domain::ExecutionEventData> findByEvent(
      const domain::EventId& event_id) const;

  std::size_t executionCount() const { return by_trade_.size(); }

 private:
  void validate(const ExecutionRequest& request,
                const domain::PartyList& parties) const;

  StateStore& states_;
  EventLedger& events_;

  std::unordered_map<domain::TradeId, domain::ExecutionEventData> by_trade_;
  std::unordered_map<domain::EventId, domain::TradeId> trade_of_event_;
};

}  // namespace tradeledger
