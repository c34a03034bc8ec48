#include "tradeledger/store/state_store.hpp"

#include "tradeledger/domain/ledger_error.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <algorithm>
#include <string>

namespace tradeledger {

StateStore::StateStore(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// isValidTransition: the legal edge table
// -----------------------------------------------------------------------------
bool StateStore::isValidTransition(domain::TradeState from,
                                   domain::TradeState to) {
  using S = domain::TradeState;

  switch (from) {
    case S::Created:
      return to == S::Pending ||
             to == S::Confirmed;

    case S::Pending:
      return to == S::Confirmed ||
             to == S::Created;

    case S::Confirmed:
      return to == S::Active ||
             to == S::Terminated;

    case S::Active:
      return to == S::Matured ||
             to == S::Terminated;

    case S::Matured:
    case S::Terminated:
      return to == S::Settled;

    case S::Settled:
      return false;
  }

  return false;
}

bool StateStore::isTerminal(domain::TradeState state) {
  return state == domain::TradeState::Settled;
}

// -----------------------------------------------------------------------------
// createTrade: validate, write creation snapshot, index the trade
// -----------------------------------------------------------------------------
domain::TradeStateSnapshot StateStore::createTrade(
    const domain::TradeId& trade_id, domain::ProductType product_type,
    const domain::PartyList& parties, domain::EpochMillis effective_date,
    domain::EpochMillis maturity_date, LedgerTransaction* txn) {
  if (trade_id.empty()) {
    throw LedgerError(ErrorCode::InvalidIdentifier, "trade id is empty");
  }
  if (trades_.count(trade_id) != 0) {
    throw LedgerError(ErrorCode::TradeAlreadyExists,
                      "trade " + trade_id + " already exists");
  }
  if (product_type == domain::ProductType::Unspecified) {
    throw LedgerError(ErrorCode::InvalidProductType,
                      "product type unspecified for trade " + trade_id);
  }
  if (parties.empty() ||
      std::any_of(parties.begin(), parties.end(),
                  [](const domain::PartyId& p) { return p.empty(); })) {
    throw LedgerError(ErrorCode::InvalidParties,
                      "trade " + trade_id + " needs non-empty parties");
  }
  if (maturity_date <= effective_date) {
    throw LedgerError(ErrorCode::InvalidDates,
                      "maturity must be after effective date for trade " +
                          trade_id);
  }

  const domain::EpochMillis now = clock_.now_ms();

  domain::TradeStateSnapshot snapshot;
  snapshot.snapshot_id = snapshots_.size() + 1;
  snapshot.trade_id = trade_id;
  snapshot.state = domain::TradeState::Created;
  snapshot.product_type = product_type;
  snapshot.timestamp = now;
  snapshot.previous_snapshot_id = domain::kNoSnapshot;
  snapshot.parties = parties;
  snapshot.effective_date = effective_date;
  snapshot.maturity_date = maturity_date;

  snapshots_.push_back(snapshot);

  TradeEntry entry;
  entry.current = snapshot.snapshot_id;
  entry.created_at = now;
  trades_.emplace(trade_id, std::move(entry));
  trade_order_.push_back(trade_id);

  if (txn != nullptr) {
    txn->onRollback([this, trade_id] {
      trade_order_.pop_back();
      trades_.erase(trade_id);
      snapshots_.pop_back();
    });

    TradeStateUpdate update;
    update.snapshot = snapshot;
    txn->enqueue(std::move(update));
  }

  return snapshot;
}

// -----------------------------------------------------------------------------
// transitionState: validate edge, append snapshot + transition, advance
// -----------------------------------------------------------------------------
domain::TradeStateSnapshot StateStore::transitionState(
    const domain::TradeId& trade_id, domain::TradeState target,
    const domain::EventId& causing_event_id, const domain::PartyId& initiator,
    LedgerTransaction* txn) {
  auto it = trades_.find(trade_id);
  if (it == trades_.end()) {
    throw LedgerError(ErrorCode::TradeNotFound,
                      "trade " + trade_id + " does not exist");
  }

  TradeEntry& entry = it->second;
  const domain::TradeStateSnapshot& current = snapshotRef(entry.current);
  const domain::TradeState from = current.state;

  if (!isValidTransition(from, target)) {
    throw LedgerError(ErrorCode::IllegalTransition,
                      std::string("trade ") + trade_id + " cannot move from " +
                          domain::tradeStateName(from) + " to " +
                          domain::tradeStateName(target));
  }

  const domain::EpochMillis now = clock_.now_ms();
  const domain::SnapshotId previous_id = entry.current;

  domain::TradeStateSnapshot next = current;
  next.snapshot_id = snapshots_.size() + 1;
  next.state = target;
  next.timestamp = now;
  next.causing_event_id = causing_event_id;
  next.previous_snapshot_id = previous_id;

  domain::StateTransition transition;
  transition.transition_id = transitions_.size() + 1;
  transition.trade_id = trade_id;
  transition.from_state = from;
  transition.to_state = target;
  transition.event_id = causing_event_id;
  transition.timestamp = now;
  transition.initiator = initiator;
  transition.validity.valid_from = now;

  snapshots_.push_back(next);
  transitions_.push_back(transition);
  entry.transitions.push_back(transition.transition_id);
  entry.current = next.snapshot_id;

  if (txn != nullptr) {
    txn->onRollback([this, trade_id, previous_id] {
      TradeEntry& e = trades_.at(trade_id);
      e.current = previous_id;
      e.transitions.pop_back();
      transitions_.pop_back();
      snapshots_.pop_back();
    });

    TradeStateUpdate update;
    update.snapshot = next;
    update.previous_state = from;
    txn->enqueue(std::move(update));
  }

  return next;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool StateStore::exists(const domain::TradeId& trade_id) const {
  return trades_.count(trade_id) != 0;
}

domain::TradeStateSnapshot StateStore::currentSnapshot(
    const domain::TradeId& trade_id) const {
  return snapshotRef(entryOrThrow(trade_id).current);
}

domain::TradeState StateStore::currentState(
    const domain::TradeId& trade_id) const {
  return snapshotRef(entryOrThrow(trade_id).current).state;
}

std::optional<domain::TradeStateSnapshot> StateStore::findSnapshot(
    domain::SnapshotId snapshot_id) const {
  if (snapshot_id == domain::kNoSnapshot || snapshot_id > snapshots_.size()) {
    return std::nullopt;
  }
  return snapshots_[snapshot_id - 1];
}

std::vector<domain::TradeStateSnapshot> StateStore::snapshotChain(
    const domain::TradeId& trade_id) const {
  std::vector<domain::TradeStateSnapshot> chain;
  domain::SnapshotId id = entryOrThrow(trade_id).current;
  while (id != domain::kNoSnapshot) {
    const domain::TradeStateSnapshot& s = snapshotRef(id);
    chain.push_back(s);
    id = s.previous_snapshot_id;
  }
  std::reverse(chain.begin(), chain.end());
  return chain;
}

std::vector<domain::StateTransition> StateStore::transitionHistory(
    const domain::TradeId& trade_id) const {
  const TradeEntry& entry = entryOrThrow(trade_id);
  std::vector<domain::StateTransition> history;
  history.reserve(entry.transitions.size());
  for (domain::TransitionId id : entry.transitions) {
    history.push_back(transitions_[id - 1]);
  }
  return history;
}

bool StateStore::isInState(const domain::TradeId& trade_id,
                           domain::TradeState state) const {
  auto it = trades_.find(trade_id);
  if (it == trades_.end()) {
    return false;
  }
  return snapshotRef(it->second.current).state == state;
}

bool StateStore::isInAnyState(
    const domain::TradeId& trade_id,
    const std::vector<domain::TradeState>& states) const {
  auto it = trades_.find(trade_id);
  if (it == trades_.end()) {
    return false;
  }
  const domain::TradeState current = snapshotRef(it->second.current).state;
  return std::find(states.begin(), states.end(), current) != states.end();
}

domain::EpochMillis StateStore::createdAt(
    const domain::TradeId& trade_id) const {
  return entryOrThrow(trade_id).created_at;
}

std::int64_t StateStore::tradeAgeMs(const domain::TradeId& trade_id,
                                    domain::EpochMillis now) const {
  return now - entryOrThrow(trade_id).created_at;
}

std::int64_t StateStore::tradeAgeDays(const domain::TradeId& trade_id,
                                      domain::EpochMillis now) const {
  return whole_days_between(entryOrThrow(trade_id).created_at, now);
}

bool StateStore::hasReachedEffectiveDate(const domain::TradeId& trade_id,
                                         domain::EpochMillis now) const {
  return now >= snapshotRef(entryOrThrow(trade_id).current).effective_date;
}

bool StateStore::hasReachedMaturity(const domain::TradeId& trade_id,
                                    domain::EpochMillis now) const {
  return now >= snapshotRef(entryOrThrow(trade_id).current).maturity_date;
}

std::int64_t StateStore::timeToMaturityMs(const domain::TradeId& trade_id,
                                          domain::EpochMillis now) const {
  const domain::EpochMillis maturity =
      snapshotRef(entryOrThrow(trade_id).current).maturity_date;
  return std::max<std::int64_t>(0, maturity - now);
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
const StateStore::TradeEntry& StateStore::entryOrThrow(
    const domain::TradeId& trade_id) const {
  auto it = trades_.find(trade_id);
  if (it == trades_.end()) {
    throw LedgerError(ErrorCode::TradeNotFound,
                      "trade " + trade_id + " does not exist");
  }
  return it->second;
}

const domain::TradeStateSnapshot& StateStore::snapshotRef(
    domain::SnapshotId id) const {
  return snapshots_.at(id - 1);
}

}  // namespace tradeledger
