#include "tradeledger/recorders/transfer_recorder.hpp"

#include "tradeledger/domain/ledger_error.hpp"

#include <optional>
#include <string>

namespace tradeledger {

namespace {

// An empty payment reference counts as not set.
std::optional<std::string> referenceOf(const domain::PaymentDetails& payment) {
  if (payment.payment_reference && !payment.payment_reference->empty()) {
    return payment.payment_reference;
  }
  return std::nullopt;
}

}  // namespace

TransferRecorder::TransferRecorder(StateStore& states, EventLedger& events,
                                   const ITimeProvider& clock)
    : states_(states), events_(events), clock_(clock) {}

// -----------------------------------------------------------------------------
// recordTransfer: validate, number and link the payload, store and process
// the envelope without a state change
// -----------------------------------------------------------------------------
domain::EventRecord TransferRecorder::recordTransfer(
    const TransferRequest& request, LedgerTransaction& txn) {
  domain::PartyList parties{request.parties.payer, request.parties.receiver};

  validate(request, parties);

  std::vector<domain::EventId>& chain = order_[request.trade_id];

  domain::TransferEventData data;
  data.event_id = request.event_id;
  data.trade_id = request.trade_id;
  data.transfer_type = request.transfer_type;
  data.sequence_number = static_cast<std::uint32_t>(chain.size() + 1);
  data.payment = request.payment;
  data.payment.payment_reference = referenceOf(request.payment);
  data.parties = request.parties;
  data.settlement.status = domain::SettlementStatus::Pending;
  data.settlement.last_updated = clock_.now_ms();
  data.previous_transfer_event_id =
      chain.empty() ? domain::EventId{} : chain.back();

  by_event_.emplace(request.event_id, data);
  chain.push_back(request.event_id);
  const std::optional<std::string> reference = data.payment.payment_reference;
  if (reference) {
    references_.emplace(*reference, request.event_id);
  }
  txn.onRollback([this, trade_id = request.trade_id,
                  event_id = request.event_id, reference] {
    if (reference) {
      references_.erase(*reference);
    }
    auto ordered = order_.find(trade_id);
    ordered->second.pop_back();
    if (ordered->second.empty()) {
      order_.erase(ordered);
    }
    by_event_.erase(event_id);
  });

  const domain::SnapshotId current =
      states_.currentSnapshot(request.trade_id).snapshot_id;

  events_.store(events_.draft(request.event_id, domain::EventType::Transfer,
                              request.trade_id, request.payment.value_date,
                              std::move(parties), request.initiator, current),
                &txn);

  return events_.markProcessed(request.event_id, current, &txn);
}

// -----------------------------------------------------------------------------
// validate: every precondition, no side effects
// -----------------------------------------------------------------------------
void TransferRecorder::validate(const TransferRequest& request,
                                const domain::PartyList& parties) const {
  events_.validateBasics(request.event_id, request.trade_id,
                         request.payment.value_date, parties);

  const std::optional<std::string> reference = referenceOf(request.payment);
  if (reference && references_.count(*reference) != 0) {
    throw LedgerError(ErrorCode::DuplicateReference,
                      "payment reference " + *reference + " already used");
  }

  if (!(request.payment.net_amount > 0.0)) {
    throw LedgerError(ErrorCode::InvalidAmount,
                      "net amount must be positive");
  }

  if (request.parties.payer == request.parties.receiver) {
    throw LedgerError(ErrorCode::InvalidParties,
                      "payer and receiver must differ");
  }
  if (request.initiator.empty()) {
    throw LedgerError(ErrorCode::InvalidParties, "transfer initiator is empty");
  }

  if (request.payment.value_date == 0) {
    throw LedgerError(ErrorCode::InvalidDates, "value date not set");
  }
}

// -----------------------------------------------------------------------------
// Settlement sub-state changes
// -----------------------------------------------------------------------------
domain::TransferEventData TransferRecorder::initiateTransfer(
    const domain::EventId& event_id, LedgerTransaction& txn) {
  domain::TransferEventData& data = transferOrThrow(event_id);
  rejectIfFinal(data);
  if (data.settlement.status != domain::SettlementStatus::Pending) {
    throw LedgerError(ErrorCode::InvalidSettlementTransition,
                      std::string("transfer ") + event_id + " is " +
                          domain::settlementStatusName(data.settlement.status) +
                          ", only PENDING transfers can be initiated");
  }
  return applySettlement(data, domain::SettlementStatus::Initiated,
                         [](domain::SettlementInfo&) {}, txn);
}

domain::TransferEventData TransferRecorder::settleTransfer(
    const domain::EventId& event_id, domain::EpochMillis settlement_date,
    const std::string& reference, LedgerTransaction& txn) {
  domain::TransferEventData& data = transferOrThrow(event_id);
  rejectIfFinal(data);
  if (settlement_date == 0) {
    throw LedgerError(ErrorCode::InvalidDates, "settlement date not set");
  }
  return applySettlement(
      data, domain::SettlementStatus::Settled,
      [settlement_date, &reference](domain::SettlementInfo& s) {
        s.settlement_date = settlement_date;
        s.settlement_reference = reference;
        s.failure_reason.clear();
      },
      txn);
}

domain::TransferEventData TransferRecorder::failTransfer(
    const domain::EventId& event_id, const std::string& reason,
    LedgerTransaction& txn) {
  domain::TransferEventData& data = transferOrThrow(event_id);
  rejectIfFinal(data);
  return applySettlement(
      data, domain::SettlementStatus::Failed,
      [&reason](domain::SettlementInfo& s) { s.failure_reason = reason; },
      txn);
}

domain::TransferEventData TransferRecorder::cancelTransfer(
    const domain::EventId& event_id, const std::string& reason,
    LedgerTransaction& txn) {
  domain::TransferEventData& data = transferOrThrow(event_id);
  rejectIfFinal(data);
  return applySettlement(
      data, domain::SettlementStatus::Cancelled,
      [&reason](domain::SettlementInfo& s) { s.failure_reason = reason; },
      txn);
}

domain::TransferEventData TransferRecorder::verifyTransfer(
    const domain::EventId& event_id, const domain::PartyId& verifier,
    LedgerTransaction& txn) {
  domain::TransferEventData& data = transferOrThrow(event_id);
  if (verifier.empty()) {
    throw LedgerError(ErrorCode::InvalidParties, "verifier is empty");
  }

  domain::TransferEventData before = data;
  data.verified = true;
  data.verified_by = verifier;
  data.verified_at = clock_.now_ms();
  txn.onRollback([this, before] { by_event_[before.event_id] = before; });

  VerificationUpdate update;
  update.event_id = event_id;
  update.trade_id = data.trade_id;
  update.event_type = domain::EventType::Transfer;
  update.verifier = verifier;
  update.verified_at = data.verified_at;
  txn.enqueue(std::move(update));

  return data;
}

domain::TransferEventData TransferRecorder::applySettlement(
    domain::TransferEventData& data, domain::SettlementStatus target,
    const SettlementMutator& mutate, LedgerTransaction& txn) {
  domain::TransferEventData before = data;

  data.settlement.status = target;
  data.settlement.last_updated = clock_.now_ms();
  mutate(data.settlement);

  txn.onRollback([this, before] { by_event_[before.event_id] = before; });

  TransferStatusUpdate update;
  update.event_id = data.event_id;
  update.trade_id = data.trade_id;
  update.previous_status = before.settlement.status;
  update.status = target;
  txn.enqueue(std::move(update));

  return data;
}

void TransferRecorder::rejectIfFinal(const domain::TransferEventData& data) {
  switch (data.settlement.status) {
    case domain::SettlementStatus::Settled:
      throw LedgerError(ErrorCode::AlreadySettled,
                        "transfer " + data.event_id + " is already settled");
    case domain::SettlementStatus::Cancelled:
      throw LedgerError(ErrorCode::TransferCancelled,
                        "transfer " + data.event_id + " was cancelled");
    default:
      return;
  }
}

domain::TransferEventData& TransferRecorder::transferOrThrow(
    const domain::EventId& event_id) {
  auto it = by_event_.find(event_id);
  if (it == by_event_.end()) {
    throw LedgerError(ErrorCode::TransferNotFound,
                      "no transfer recorded under event " + event_id);
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::TransferEventData> TransferRecorder::findByEvent(
    const domain::EventId& event_id) const {
  auto it = by_event_.find(event_id);
  if (it == by_event_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::TransferEventData> TransferRecorder::findByReference(
    const std::string& payment_reference) const {
  auto it = references_.find(payment_reference);
  if (it == references_.end()) {
    return std::nullopt;
  }
  return by_event_.at(it->second);
}

std::vector<domain::TransferEventData> TransferRecorder::transfersForTrade(
    const domain::TradeId& trade_id) const {
  std::vector<domain::TransferEventData> transfers;
  auto it = order_.find(trade_id);
  if (it == order_.end()) {
    return transfers;
  }
  transfers.reserve(it->second.size());
  for (const domain::EventId& id : it->second) {
    transfers.push_back(by_event_.at(id));
  }
  return transfers;
}

std::size_t TransferRecorder::transferCount(
    const domain::TradeId& trade_id) const {
  auto it = order_.find(trade_id);
  return it == order_.end() ? 0 : it->second.size();
}

bool TransferRecorder::isSettled(const domain::EventId& event_id) const {
  auto it = by_event_.find(event_id);
  return it != by_event_.end() &&
         it->second.settlement.status == domain::SettlementStatus::Settled;
}

}  // namespace tradeledger
