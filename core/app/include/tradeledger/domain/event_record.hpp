#pragma once

#include "tradeledger/domain/identifiers.hpp"

#include <string>

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// EventType
// -----------------------------------------------------------------------------
// The closed set of business-event kinds the ledger records. Each kind has a
// dedicated recorder that owns its typed payload; the EventRecord envelope
// carries the tag so generic consumers can dispatch without knowing the
// payload layout.
// -----------------------------------------------------------------------------
enum class EventType {
  Execution,
  Reset,
  Transfer,
  Termination,
};

// -----------------------------------------------------------------------------
// EventStatus
// -----------------------------------------------------------------------------
// Pending at creation. Processed and Failed are terminal: once reached, the
// EventLedger refuses any further status change.
// -----------------------------------------------------------------------------
enum class EventStatus {
  Pending,
  Processed,
  Failed,
};

// -----------------------------------------------------------------------------
// EventRecord: generic event envelope
// -----------------------------------------------------------------------------
//
// @brief  Metadata and processing status shared by every business event,
//         regardless of kind.
//
// @details
// before_state_id / after_state_id name the trade snapshots on either side of
// the event. For events that do not move the state machine (resets,
// transfers) both point at the same snapshot. after_state_id is kNoSnapshot
// until the event is marked processed.
//
// previous_event_id is the backward link to the trade's preceding event of
// any kind (empty for the first event), giving every trade a single ordered
// event chain independent of the per-kind chains kept by the recorders.
//
// message holds the failure reason for Failed events and is empty otherwise.
// -----------------------------------------------------------------------------
struct EventRecord {
  EventId event_id;
  EventType event_type{EventType::Execution};
  EventStatus status{EventStatus::Pending};
  EpochMillis timestamp{0};
  EpochMillis effective_date{0};
  TradeId trade_id;
  PartyList involved_parties;
  PartyId initiator;
  SnapshotId before_state_id{kNoSnapshot};
  SnapshotId after_state_id{kNoSnapshot};
  EventId previous_event_id;
  Validity validity;
  std::string message;
};

const char* eventTypeName(EventType type);
const char* eventStatusName(EventStatus status);

}  // namespace domain
}  // namespace tradeledger
