#pragma once

#include "tradeledger/domain/identifiers.hpp"
#include "tradeledger/domain/trade_state.hpp"

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// TradeStateSnapshot
// -----------------------------------------------------------------------------
// Responsibility: Immutable point-in-time capture of one trade's lifecycle
// state.
//
// @details
// The StateStore writes a new snapshot for the creation of a trade and for
// every subsequent transition. Snapshots are never edited after they are
// appended. previous_snapshot_id links each snapshot to its predecessor, so
// walking the chain backwards always ends at the creation snapshot (whose
// previous_snapshot_id is kNoSnapshot). The chain never branches: a trade has
// exactly one "current" snapshot and every other snapshot is its ancestor.
//
// product_type, parties, effective_date and maturity_date are copied forward
// from the creation snapshot unchanged; only state, timestamp and the causal
// links differ between snapshots of the same trade.
//
// Copies handed out by the StateStore and carried in TradeStateUpdate are
// plain values; mutating them has no effect on the ledger.
// -----------------------------------------------------------------------------
struct TradeStateSnapshot {
  SnapshotId snapshot_id{kNoSnapshot};
  TradeId trade_id;
  TradeState state{TradeState::Created};
  ProductType product_type{ProductType::Unspecified};
  EpochMillis timestamp{0};
  EventId causing_event_id;             // Empty for the creation snapshot
  SnapshotId previous_snapshot_id{kNoSnapshot};
  PartyList parties;
  EpochMillis effective_date{0};
  EpochMillis maturity_date{0};
};

// -----------------------------------------------------------------------------
// StateTransition
// -----------------------------------------------------------------------------
// Append-only audit record written exactly once per state change. Together
// with the EventRecord named by event_id it answers "why is this trade in
// this state".
// -----------------------------------------------------------------------------
struct StateTransition {
  TransitionId transition_id{0};
  TradeId trade_id;
  TradeState from_state{TradeState::Created};
  TradeState to_state{TradeState::Created};
  EventId event_id;
  EpochMillis timestamp{0};
  PartyId initiator;
  Validity validity;
};

}  // namespace domain
}  // namespace tradeledger
