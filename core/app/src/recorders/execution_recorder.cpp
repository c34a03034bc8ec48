#include "tradeledger/recorders/execution_recorder.hpp"

#include "tradeledger/domain/ledger_error.hpp"

namespace tradeledger {

ExecutionRecorder::ExecutionRecorder(StateStore& states, EventLedger& events)
    : states_(states), events_(events) {}

// -----------------------------------------------------------------------------
// executeTrade: validate, persist payload + envelope, confirm the trade
// -----------------------------------------------------------------------------
domain::EventRecord ExecutionRecorder::executeTrade(
    const ExecutionRequest& request, LedgerTransaction& txn) {
  domain::PartyList parties{request.buyer, request.seller};
  if (request.broker) {
    parties.push_back(*request.broker);
  }

  validate(request, parties);

  domain::ExecutionEventData data;
  data.event_id = request.event_id;
  data.trade_id = request.trade_id;
  data.details = request.details;
  data.terms = request.terms;
  data.buyer = request.buyer;
  data.seller = request.seller;
  data.broker = request.broker;
  data.trade_date = request.trade_date;

  by_trade_.emplace(request.trade_id, data);
  trade_of_event_.emplace(request.event_id, request.trade_id);
  txn.onRollback([this, trade_id = request.trade_id,
                  event_id = request.event_id] {
    trade_of_event_.erase(event_id);
    by_trade_.erase(trade_id);
  });

  const domain::SnapshotId before =
      states_.currentSnapshot(request.trade_id).snapshot_id;

  events_.store(events_.draft(request.event_id, domain::EventType::Execution,
                              request.trade_id, request.trade_date,
                              std::move(parties), request.buyer, before),
                &txn);

  const domain::TradeStateSnapshot confirmed = states_.transitionState(
      request.trade_id, domain::TradeState::Confirmed, request.event_id,
      request.buyer, &txn);

  return events_.markProcessed(request.event_id, confirmed.snapshot_id, &txn);
}

// -----------------------------------------------------------------------------
// validate: every precondition, no side effects
// -----------------------------------------------------------------------------
void ExecutionRecorder::validate(const ExecutionRequest& request,
                                 const domain::PartyList& parties) const {
  if (by_trade_.count(request.trade_id) != 0) {
    throw LedgerError(ErrorCode::AlreadyExecuted,
                      "trade " + request.trade_id + " is already executed");
  }

  events_.validateBasics(request.event_id, request.trade_id,
                         request.trade_date, parties);

  if (request.buyer.empty() || request.seller.empty() ||
      request.buyer == request.seller) {
    throw LedgerError(ErrorCode::InvalidParties,
                      "buyer and seller must be set and distinct");
  }
  if (request.broker && request.broker->empty()) {
    throw LedgerError(ErrorCode::InvalidParties, "broker id is empty");
  }

  if (request.trade_date == 0) {
    throw LedgerError(ErrorCode::InvalidDates, "trade date not set");
  }
  if (request.terms.maturity_date <= request.terms.effective_date) {
    throw LedgerError(ErrorCode::InvalidDates,
                      "maturity must be after effective date");
  }
  if (request.details.timestamp > request.terms.effective_date) {
    throw LedgerError(ErrorCode::InvalidDates,
                      "execution time is after the effective date");
  }

  if (!(request.terms.notional > 0.0)) {
    throw LedgerError(ErrorCode::InvalidNotional, "notional must be positive");
  }

  const domain::TradeState state = states_.currentState(request.trade_id);
  if (state != domain::TradeState::Created) {
    throw LedgerError(ErrorCode::WrongTradeState,
                      "trade " + request.trade_id + " is " +
                          domain::tradeStateName(state) +
                          ", execution requires CREATED");
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool ExecutionRecorder::hasExecution(const domain::TradeId& trade_id) const {
  return by_trade_.count(trade_id) != 0;
}

std::optional<domain::ExecutionEventData> ExecutionRecorder::executionForTrade(
    const domain::TradeId& trade_id) const {
  auto it = by_trade_.find(trade_id);
  if (it == by_trade_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::ExecutionEventData> ExecutionRecorder::findByEvent(
    const domain::EventId& event_id) const {
  auto it = trade_of_event_.find(event_id);
  if (it == trade_of_event_.end()) {
    return std::nullopt;
  }
  return executionForTrade(it->second);
}

}  // namespace tradeledger
