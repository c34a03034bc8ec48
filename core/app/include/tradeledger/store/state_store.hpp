#pragma once

#include "tradeledger/domain/identifiers.hpp"
#include "tradeledger/domain/trade_snapshot.hpp"
#include "tradeledger/domain/trade_state.hpp"
#include "tradeledger/store/ledger_transaction.hpp"
#include "tradeledger/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// StateStore: trade lifecycle state machine and snapshot history
// -----------------------------------------------------------------------------
//
// @brief  Owns the canonical current state of every trade and the full,
//         immutable history of snapshots and transitions that led to it.
//
// @details
// Storage layout (append-only arenas plus one index):
//
//   snapshots_    every TradeStateSnapshot ever written, in write order.
//                 SnapshotId == position + 1.
//   transitions_  every StateTransition ever written, in write order.
//                 TransitionId == position + 1.
//   trades_       TradeId → {current snapshot id, ids of this trade's
//                 transitions, creation time}.
//
// Nothing in either arena is ever modified or removed once committed. The
// only mutable datum per trade is the "current" pointer, and it only moves
// forward along a legal edge of the transition graph (see TradeState).
// Backward links (previous_snapshot_id) are arena ids, never pointers, so
// the chain for a trade is walked with plain lookups.
//
// Every mutating call accepts an optional LedgerTransaction. When one is
// supplied the call registers its undo action and queues a
// TradeStateUpdate; the LifecycleEngine always supplies one. Without it the
// write is immediately permanent (used by tests that exercise the store in
// isolation).
//
// Thread model:
//   Not internally synchronized. The LifecycleEngine serializes all access
//   under its ledger lock (exclusive for writes, shared for reads).
//
// Ownership:
//   Owned by LifecycleEngine. Holds a reference to the engine's clock, which
//   must outlive the store.
// -----------------------------------------------------------------------------
class StateStore {
 public:
  explicit StateStore(const ITimeProvider& clock);

  StateStore(const StateStore&) = delete;
  StateStore& operator=(const StateStore&) = delete;

  // -------------------------------------------------------------------------
  // createTrade(...)
  // -------------------------------------------------------------------------
  // @brief  Registers a new trade in state Created and writes its creation
  //         snapshot.
  //
  // @param  trade_id        Caller-supplied, must be non-empty and unused.
  // @param  product_type    Must not be Unspecified.
  // @param  parties         Non-empty list of non-empty party ids.
  // @param  effective_date  Epoch ms.
  // @param  maturity_date   Epoch ms, strictly after effective_date.
  // @param  txn             Optional enclosing transaction.
  //
  // @return Copy of the creation snapshot (previous_snapshot_id == 0,
  //         causing_event_id empty).
  //
  // @throws LedgerError InvalidIdentifier, TradeAlreadyExists,
  //         InvalidProductType, InvalidParties, InvalidDates.
  // -------------------------------------------------------------------------
  domain::TradeStateSnapshot createTrade(const domain::TradeId& trade_id,
                                         domain::ProductType product_type,
                                         const domain::PartyList& parties,
                                         domain::EpochMillis effective_date,
                                         domain::EpochMillis maturity_date,
                                         LedgerTransaction* txn = nullptr);

  // -------------------------------------------------------------------------
  // transitionState(...)
  // -------------------------------------------------------------------------
  // @brief  Moves a trade to `target`, writing a new snapshot and a
  //         StateTransition audit record.
  //
  // @details
  // The new snapshot copies product type, parties and dates from the
  // current one, links back to it via previous_snapshot_id, and records
  // causing_event_id. The transition record stores initiator and an
  // open-ended validity starting now.
  //
  // @return Copy of the new current snapshot.
  //
  // @throws LedgerError TradeNotFound, IllegalTransition.
  // -------------------------------------------------------------------------
  domain::TradeStateSnapshot transitionState(
      const domain::TradeId& trade_id, domain::TradeState target,
      const domain::EventId& causing_event_id,
      const domain::PartyId& initiator, LedgerTransaction* txn = nullptr);

  // -------------------------------------------------------------------------
  // isValidTransition(from, to)
  // -------------------------------------------------------------------------
  // @brief  Pure predicate over the legal transition table.
  //
  //   Created    → Pending, Confirmed
  //   Pending    → Confirmed, Created
  //   Confirmed  → Active, Terminated
  //   Active     → Matured, Terminated
  //   Matured    → Settled
  //   Terminated → Settled
  //   Settled    → (none)
  // -------------------------------------------------------------------------
  static bool isValidTransition(domain::TradeState from, domain::TradeState to);

  static bool isTerminal(domain::TradeState state);

  // --- Queries --------------------------------------------------------------
  // All queries return copies. Lookups by TradeId throw
  // LedgerError(TradeNotFound) for unknown trades unless noted.

  bool exists(const domain::TradeId& trade_id) const;

  domain::TradeStateSnapshot currentSnapshot(
      const domain::TradeId& trade_id) const;

  domain::TradeState currentState(const domain::TradeId& trade_id) const;

  // Snapshot by arena id; std::nullopt if no such snapshot.
  std::optional<domain::TradeStateSnapshot> findSnapshot(
      domain::SnapshotId snapshot_id) const;

  // Snapshot chain from the creation snapshot to the current one, obtained
  // by walking previous_snapshot_id backwards and reversing.
  std::vector<domain::TradeStateSnapshot> snapshotChain(
      const domain::TradeId& trade_id) const;

  // Transitions in the order they were applied.
  std::vector<domain::StateTransition> transitionHistory(
      const domain::TradeId& trade_id) const;

  // False for unknown trades.
  bool isInState(const domain::TradeId& trade_id,
                 domain::TradeState state) const;
  bool isInAnyState(const domain::TradeId& trade_id,
                    const std::vector<domain::TradeState>& states) const;

  domain::EpochMillis createdAt(const domain::TradeId& trade_id) const;

  // Time elapsed since createTrade(), measured against `now`.
  std::int64_t tradeAgeMs(const domain::TradeId& trade_id,
                          domain::EpochMillis now) const;
  std::int64_t tradeAgeDays(const domain::TradeId& trade_id,
                            domain::EpochMillis now) const;

  bool hasReachedEffectiveDate(const domain::TradeId& trade_id,
                               domain::EpochMillis now) const;
  bool hasReachedMaturity(const domain::TradeId& trade_id,
                          domain::EpochMillis now) const;

  // Milliseconds until maturity; 0 once maturity has been reached.
  std::int64_t timeToMaturityMs(const domain::TradeId& trade_id,
                                domain::EpochMillis now) const;

  std::size_t tradeCount() const { return trades_.size(); }
  std::size_t snapshotCount() const { return snapshots_.size(); }

  // Trade ids in creation order.
  std::vector<domain::TradeId> tradeIds() const { return trade_order_; }

 private:
  struct TradeEntry {
    domain::SnapshotId current{domain::kNoSnapshot};
    std::vector<domain::TransitionId> transitions;
    domain::EpochMillis created_at{0};
  };

  const TradeEntry& entryOrThrow(const domain::TradeId& trade_id) const;
  const domain::TradeStateSnapshot& snapshotRef(domain::SnapshotId id) const;

  const ITimeProvider& clock_;

  std::vector<domain::TradeStateSnapshot> snapshots_;
  std::vector<domain::StateTransition> transitions_;
  std::unordered_map<domain::TradeId, TradeEntry> trades_;
  std::vector<domain::TradeId> trade_order_;
};

}  // namespace tradeledger
