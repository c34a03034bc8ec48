#pragma once

#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/termination_data.hpp"
#include "tradeledger/domain/trade_snapshot.hpp"
#include "tradeledger/domain/transfer_data.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace tradeledger {

// -----------------------------------------------------------------------------
// Ledger updates
// -----------------------------------------------------------------------------
// Responsibility: Notifications describing one committed change to the
// ledger. Downstream collaborators (netting, valuation, monitoring) subscribe
// to them on the LifecycleEngine's EventBus or over the IPC PUB socket.
//
// Every update is produced inside a LedgerTransaction and published only
// after that transaction commits, so a subscriber never sees a change that
// was later rolled back. sequence_id is stamped by the LifecycleEngine at
// publish time and increases strictly across all update kinds.
// -----------------------------------------------------------------------------

// A trade was created (previous_state empty) or moved to a new state.
struct TradeStateUpdate {
  domain::TradeStateSnapshot snapshot;
  std::optional<domain::TradeState> previous_state;
  std::uint64_t sequence_id{0};
};

// An event record was stored or changed processing status.
struct EventRecordUpdate {
  domain::EventRecord record;
  std::uint64_t sequence_id{0};
};

struct TransferStatusUpdate {
  domain::EventId event_id;
  domain::TradeId trade_id;
  domain::SettlementStatus previous_status{domain::SettlementStatus::Pending};
  domain::SettlementStatus status{domain::SettlementStatus::Pending};
  std::uint64_t sequence_id{0};
};

struct TerminationStatusUpdate {
  domain::EventId event_id;
  domain::TradeId trade_id;
  domain::TerminationStatus previous_status{
      domain::TerminationStatus::Pending};
  domain::TerminationStatus status{domain::TerminationStatus::Pending};
  std::uint64_t sequence_id{0};
};

// A reset rate or a transfer was independently verified.
struct VerificationUpdate {
  domain::EventId event_id;
  domain::TradeId trade_id;
  domain::EventType event_type{domain::EventType::Reset};
  domain::PartyId verifier;
  domain::EpochMillis verified_at{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// LedgerUpdate (type alias)
// -----------------------------------------------------------------------------
// Closed set of update kinds carried by the EventBus. Subscribers use the
// typed EventBus::subscribe<T>() or std::visit to pick the kinds they need.
// -----------------------------------------------------------------------------
using LedgerUpdate = std::variant<
    TradeStateUpdate,
    EventRecordUpdate,
    TransferStatusUpdate,
    TerminationStatusUpdate,
    VerificationUpdate>;

// Writes sequence_id into whichever alternative the variant holds.
inline void stampSequence(LedgerUpdate& update, std::uint64_t sequence_id) {
  std::visit([sequence_id](auto& u) { u.sequence_id = sequence_id; }, update);
}

}  // namespace tradeledger
