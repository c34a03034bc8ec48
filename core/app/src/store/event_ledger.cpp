#include "tradeledger/store/event_ledger.hpp"

#include "tradeledger/domain/ledger_error.hpp"

#include <algorithm>
#include <utility>

namespace tradeledger {

EventLedger::EventLedger(const StateStore& states, const ITimeProvider& clock)
    : states_(states), clock_(clock) {}

// -----------------------------------------------------------------------------
// validateBasics: checks common to every event kind
// -----------------------------------------------------------------------------
void EventLedger::validateBasics(const domain::EventId& event_id,
                                 const domain::TradeId& trade_id,
                                 domain::EpochMillis effective_date,
                                 const domain::PartyList& parties,
                                 DateRule rule) const {
  if (event_id.empty()) {
    throw LedgerError(ErrorCode::InvalidIdentifier, "event id is empty");
  }
  if (records_.count(event_id) != 0) {
    throw LedgerError(ErrorCode::EventAlreadyExists,
                      "event " + event_id + " already recorded");
  }
  if (!states_.exists(trade_id)) {
    throw LedgerError(ErrorCode::TradeNotFound,
                      "trade " + trade_id + " does not exist");
  }
  if (parties.empty() ||
      std::any_of(parties.begin(), parties.end(),
                  [](const domain::PartyId& p) { return p.empty(); })) {
    throw LedgerError(ErrorCode::InvalidParties,
                      "event " + event_id + " has no involved parties");
  }
  if (rule == DateRule::NotBeforeNow && effective_date < clock_.now_ms()) {
    throw LedgerError(ErrorCode::InvalidEffectiveDate,
                      "event " + event_id + " is effective in the past");
  }
}

// -----------------------------------------------------------------------------
// draft: Pending envelope, not yet stored
// -----------------------------------------------------------------------------
domain::EventRecord EventLedger::draft(const domain::EventId& event_id,
                                       domain::EventType type,
                                       const domain::TradeId& trade_id,
                                       domain::EpochMillis effective_date,
                                       domain::PartyList parties,
                                       const domain::PartyId& initiator,
                                       domain::SnapshotId before_state_id)
    const {
  domain::EventRecord record;
  record.event_id = event_id;
  record.event_type = type;
  record.status = domain::EventStatus::Pending;
  record.timestamp = clock_.now_ms();
  record.effective_date = effective_date;
  record.trade_id = trade_id;
  record.involved_parties = std::move(parties);
  record.initiator = initiator;
  record.before_state_id = before_state_id;
  record.validity.valid_from = effective_date;
  return record;
}

// -----------------------------------------------------------------------------
// store: append to global table and per-trade chain
// -----------------------------------------------------------------------------
domain::EventRecord EventLedger::store(domain::EventRecord record,
                                       LedgerTransaction* txn) {
  if (records_.count(record.event_id) != 0) {
    throw LedgerError(ErrorCode::EventAlreadyExists,
                      "event " + record.event_id + " already recorded");
  }
  if (!states_.exists(record.trade_id)) {
    throw LedgerError(ErrorCode::TradeNotFound,
                      "trade " + record.trade_id + " does not exist");
  }

  std::vector<domain::EventId>& chain = by_trade_[record.trade_id];
  record.previous_event_id = chain.empty() ? domain::EventId{} : chain.back();

  const domain::EventId event_id = record.event_id;
  const domain::TradeId trade_id = record.trade_id;

  chain.push_back(event_id);
  records_.emplace(event_id, record);

  if (txn != nullptr) {
    txn->onRollback([this, event_id, trade_id] {
      records_.erase(event_id);
      auto it = by_trade_.find(trade_id);
      it->second.pop_back();
      if (it->second.empty()) {
        by_trade_.erase(it);
      }
    });

    EventRecordUpdate update;
    update.record = record;
    txn->enqueue(std::move(update));
  }

  return record;
}

domain::EventRecord EventLedger::markProcessed(const domain::EventId& event_id,
                                               domain::SnapshotId after_state_id,
                                               LedgerTransaction* txn) {
  return finalize(event_id, domain::EventStatus::Processed, after_state_id,
                  std::string{}, txn);
}

domain::EventRecord EventLedger::markFailed(const domain::EventId& event_id,
                                            const std::string& reason,
                                            LedgerTransaction* txn) {
  return finalize(event_id, domain::EventStatus::Failed, domain::kNoSnapshot,
                  reason, txn);
}

// -----------------------------------------------------------------------------
// finalize: shared Pending → terminal status change
// -----------------------------------------------------------------------------
domain::EventRecord EventLedger::finalize(const domain::EventId& event_id,
                                          domain::EventStatus status,
                                          domain::SnapshotId after_state_id,
                                          const std::string& message,
                                          LedgerTransaction* txn) {
  auto it = records_.find(event_id);
  if (it == records_.end()) {
    throw LedgerError(ErrorCode::EventNotFound,
                      "event " + event_id + " does not exist");
  }

  domain::EventRecord& record = it->second;
  if (record.status != domain::EventStatus::Pending) {
    throw LedgerError(ErrorCode::EventAlreadyFinalized,
                      "event " + event_id + " is already " +
                          domain::eventStatusName(record.status));
  }

  domain::EventRecord before = record;

  record.status = status;
  record.message = message;
  if (status == domain::EventStatus::Processed) {
    record.after_state_id = after_state_id;
  }

  if (txn != nullptr) {
    txn->onRollback([this, before] { records_[before.event_id] = before; });

    EventRecordUpdate update;
    update.record = record;
    txn->enqueue(std::move(update));
  }

  return record;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool EventLedger::exists(const domain::EventId& event_id) const {
  return records_.count(event_id) != 0;
}

std::optional<domain::EventRecord> EventLedger::find(
    const domain::EventId& event_id) const {
  auto it = records_.find(event_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

domain::EventRecord EventLedger::get(const domain::EventId& event_id) const {
  auto it = records_.find(event_id);
  if (it == records_.end()) {
    throw LedgerError(ErrorCode::EventNotFound,
                      "event " + event_id + " does not exist");
  }
  return it->second;
}

std::vector<domain::EventRecord> EventLedger::eventsForTrade(
    const domain::TradeId& trade_id,
    std::optional<domain::EventType> type) const {
  std::vector<domain::EventRecord> events;
  auto it = by_trade_.find(trade_id);
  if (it == by_trade_.end()) {
    return events;
  }
  for (const domain::EventId& id : it->second) {
    const domain::EventRecord& record = records_.at(id);
    if (!type || record.event_type == *type) {
      events.push_back(record);
    }
  }
  return events;
}

std::optional<domain::EventRecord> EventLedger::lastEventForTrade(
    const domain::TradeId& trade_id) const {
  auto it = by_trade_.find(trade_id);
  if (it == by_trade_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return records_.at(it->second.back());
}

bool EventLedger::isProcessed(const domain::EventId& event_id) const {
  auto it = records_.find(event_id);
  return it != records_.end() &&
         it->second.status == domain::EventStatus::Processed;
}

}  // namespace tradeledger
