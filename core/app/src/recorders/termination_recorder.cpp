#include "tradeledger/recorders/termination_recorder.hpp"

#include "tradeledger/domain/ledger_error.hpp"

#include <string>

namespace tradeledger {

TerminationRecorder::TerminationRecorder(StateStore& states,
                                         EventLedger& events,
                                         const TransferRecorder& transfers,
                                         const ITimeProvider& clock)
    : states_(states), events_(events), transfers_(transfers), clock_(clock) {}

// -----------------------------------------------------------------------------
// terminateTrade: validate, persist payload + envelope, terminate the trade
// -----------------------------------------------------------------------------
domain::EventRecord TerminationRecorder::terminateTrade(
    const TerminationRequest& request, LedgerTransaction& txn) {
  domain::PartyList parties =
      states_.exists(request.trade_id)
          ? states_.currentSnapshot(request.trade_id).parties
          : domain::PartyList{request.initiator};

  validate(request, parties);

  domain::TerminationEventData data;
  data.event_id = request.event_id;
  data.trade_id = request.trade_id;
  data.details = request.details;
  data.payment = request.payment;
  data.payment.is_disputed = false;
  data.status = domain::TerminationStatus::Pending;
  data.last_updated = clock_.now_ms();

  by_trade_.emplace(request.trade_id, data);
  trade_of_event_.emplace(request.event_id, request.trade_id);
  txn.onRollback([this, trade_id = request.trade_id,
                  event_id = request.event_id] {
    trade_of_event_.erase(event_id);
    by_trade_.erase(trade_id);
  });

  const domain::SnapshotId before =
      states_.currentSnapshot(request.trade_id).snapshot_id;

  events_.store(events_.draft(request.event_id, domain::EventType::Termination,
                              request.trade_id,
                              request.details.termination_date,
                              std::move(parties), request.initiator, before),
                &txn);

  const domain::TradeStateSnapshot terminated = states_.transitionState(
      request.trade_id, domain::TradeState::Terminated, request.event_id,
      request.initiator, &txn);

  return events_.markProcessed(request.event_id, terminated.snapshot_id, &txn);
}

void TerminationRecorder::validate(const TerminationRequest& request,
                                   const domain::PartyList& parties) const {
  events_.validateBasics(request.event_id, request.trade_id,
                         request.details.termination_date, parties);

  if (by_trade_.count(request.trade_id) != 0) {
    throw LedgerError(ErrorCode::TradeAlreadyTerminated,
                      "trade " + request.trade_id + " is already terminated");
  }

  const domain::TradeState state = states_.currentState(request.trade_id);
  if (state != domain::TradeState::Active &&
      state != domain::TradeState::Confirmed) {
    throw LedgerError(ErrorCode::TradeNotActive,
                      "trade " + request.trade_id + " is " +
                          domain::tradeStateName(state) +
                          ", termination requires ACTIVE or CONFIRMED");
  }

  const domain::TerminationDetails& details = request.details;
  if (details.termination_date < clock_.now_ms()) {
    throw LedgerError(ErrorCode::InvalidTerminationDate,
                      "termination date is in the past");
  }
  if (details.notification_date > details.termination_date) {
    throw LedgerError(ErrorCode::InvalidTerminationDate,
                      "notification date is after the termination date");
  }

  const domain::TerminationPayment& payment = request.payment;
  if (payment.value < 0.0) {
    throw LedgerError(ErrorCode::InvalidPaymentDetails,
                      "termination payment is negative");
  }
  if (payment.method == domain::PaymentMethod::Zero && payment.value != 0.0) {
    throw LedgerError(ErrorCode::InvalidPaymentDetails,
                      "ZERO method carries a non-zero payment");
  }
  if (payment.method != domain::PaymentMethod::Zero &&
      (payment.payer.empty() || payment.receiver.empty() ||
       payment.payer == payment.receiver)) {
    throw LedgerError(ErrorCode::InvalidParties,
                      "payer and receiver must be set and distinct");
  }
  if (request.initiator.empty()) {
    throw LedgerError(ErrorCode::InvalidParties,
                      "termination initiator is empty");
  }
}

// -----------------------------------------------------------------------------
// Termination status changes
// -----------------------------------------------------------------------------
domain::TerminationEventData TerminationRecorder::confirmTermination(
    const domain::EventId& event_id, LedgerTransaction& txn) {
  domain::TerminationEventData& data = terminationOrThrow(event_id);
  if (data.status == domain::TerminationStatus::Settled) {
    throw LedgerError(ErrorCode::AlreadySettled,
                      "termination " + event_id + " is already settled");
  }
  if (data.status != domain::TerminationStatus::Pending) {
    throw LedgerError(ErrorCode::InvalidTerminationStatus,
                      std::string("termination ") + event_id + " is " +
                          domain::terminationStatusName(data.status) +
                          ", only PENDING can be confirmed");
  }
  return applyStatus(data, domain::TerminationStatus::Confirmed,
                     [](domain::TerminationEventData&) {}, txn);
}

domain::TerminationEventData TerminationRecorder::disputeTermination(
    const domain::EventId& event_id, const domain::PartyId& disputing_party,
    const std::string& reason, LedgerTransaction& txn) {
  domain::TerminationEventData& data = terminationOrThrow(event_id);
  if (disputing_party.empty()) {
    throw LedgerError(ErrorCode::InvalidParties, "disputing party is empty");
  }
  return applyStatus(
      data, domain::TerminationStatus::Disputed,
      [&disputing_party, &reason](domain::TerminationEventData& d) {
        d.payment.is_disputed = true;
        d.disputed_by = disputing_party;
        d.dispute_reason = reason;
      },
      txn);
}

domain::TerminationEventData TerminationRecorder::linkSettlementTransfer(
    const domain::EventId& event_id, const domain::EventId& transfer_event_id,
    LedgerTransaction& txn) {
  domain::TerminationEventData& data = terminationOrThrow(event_id);
  if (data.status == domain::TerminationStatus::Settled) {
    throw LedgerError(ErrorCode::AlreadySettled,
                      "termination " + event_id + " is already settled");
  }

  const auto transfer = transfers_.findByEvent(transfer_event_id);
  if (!transfer) {
    throw LedgerError(ErrorCode::TransferNotFound,
                      "no transfer recorded under event " + transfer_event_id);
  }
  if (transfer->trade_id != data.trade_id) {
    throw LedgerError(ErrorCode::SettlementTradeMismatch,
                      "transfer " + transfer_event_id + " belongs to trade " +
                          transfer->trade_id + ", not " + data.trade_id);
  }

  return applyStatus(
      data, domain::TerminationStatus::Settled,
      [&transfer_event_id](domain::TerminationEventData& d) {
        d.settlement_transfer_event_id = transfer_event_id;
      },
      txn);
}

domain::TerminationEventData TerminationRecorder::applyStatus(
    domain::TerminationEventData& data, domain::TerminationStatus target,
    const TerminationMutator& mutate, LedgerTransaction& txn) {
  domain::TerminationEventData before = data;

  data.status = target;
  data.last_updated = clock_.now_ms();
  mutate(data);

  txn.onRollback([this, before] { by_trade_[before.trade_id] = before; });

  TerminationStatusUpdate update;
  update.event_id = data.event_id;
  update.trade_id = data.trade_id;
  update.previous_status = before.status;
  update.status = target;
  txn.enqueue(std::move(update));

  return data;
}

domain::TerminationEventData& TerminationRecorder::terminationOrThrow(
    const domain::EventId& event_id) {
  auto it = trade_of_event_.find(event_id);
  if (it == trade_of_event_.end()) {
    throw LedgerError(ErrorCode::TerminationNotFound,
                      "no termination recorded under event " + event_id);
  }
  return by_trade_.at(it->second);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool TerminationRecorder::hasTermination(
    const domain::TradeId& trade_id) const {
  return by_trade_.count(trade_id) != 0;
}

std::optional<domain::TerminationEventData>
TerminationRecorder::terminationForTrade(
    const domain::TradeId& trade_id) const {
  auto it = by_trade_.find(trade_id);
  if (it == by_trade_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::TerminationEventData> TerminationRecorder::findByEvent(
    const domain::EventId& event_id) const {
  auto it = trade_of_event_.find(event_id);
  if (it == trade_of_event_.end()) {
    return std::nullopt;
  }
  return terminationForTrade(it->second);
}

}  // namespace tradeledger
