#pragma once

#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/identifiers.hpp"
#include "tradeledger/store/ledger_transaction.hpp"
#include "tradeledger/store/state_store.hpp"
#include "tradeledger/time/i_time_provider.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// EventLedger: generic event envelope store
// -----------------------------------------------------------------------------
//
// @brief  Owns the EventRecord of every business event, indexed globally by
//         EventId and per trade in arrival order.
//
// @details
// Recorders call validateBasics() before writing anything, then store() the
// envelope, and finally markProcessed() (or markFailed()) once their side
// effects are in place. store() links each record to the trade's previous
// event, so every trade has one backward-linked event chain regardless of
// event kind.
//
// Status policy:
//   Pending → Processed | Failed. Both outcomes are terminal; any further
//   markProcessed()/markFailed() on the same event is rejected with
//   EventAlreadyFinalized instead of silently overwriting the outcome.
//
// Thread model:
//   Not internally synchronized; the LifecycleEngine serializes access.
//
// Ownership:
//   Owned by LifecycleEngine. Reads the StateStore (to check that a trade
//   exists) and the clock through references that must outlive it.
// -----------------------------------------------------------------------------
class EventLedger {
 public:
  // Whether an event's effective date may precede "now". Every recorder
  // passes Any. TerminationRecorder checks its own dates afterwards, because
  // they fail with InvalidTerminationDate rather than InvalidEffectiveDate.
  enum class DateRule {
    Any,           // Back-dated or forward-dated, both accepted
    NotBeforeNow,  // Earlier than now fails with InvalidEffectiveDate
  };

  EventLedger(const StateStore& states, const ITimeProvider& clock);

  EventLedger(const EventLedger&) = delete;
  EventLedger& operator=(const EventLedger&) = delete;

  // -------------------------------------------------------------------------
  // validateBasics(...)
  // -------------------------------------------------------------------------
  // @brief  Checks shared by every recorder, in this order:
  //         event id non-empty and unused, trade exists, parties non-empty,
  //         effective date not before now (NotBeforeNow only).
  //
  // @throws LedgerError InvalidIdentifier, EventAlreadyExists,
  //         TradeNotFound, InvalidParties, InvalidEffectiveDate.
  // Side-effects: None.
  // -------------------------------------------------------------------------
  void validateBasics(const domain::EventId& event_id,
                      const domain::TradeId& trade_id,
                      domain::EpochMillis effective_date,
                      const domain::PartyList& parties,
                      DateRule rule = DateRule::Any) const;

  // -------------------------------------------------------------------------
  // draft(...)
  // -------------------------------------------------------------------------
  // @brief  Builds a Pending envelope stamped with the current time and an
  //         open-ended validity starting at effective_date. Does not store.
  // -------------------------------------------------------------------------
  domain::EventRecord draft(const domain::EventId& event_id,
                            domain::EventType type,
                            const domain::TradeId& trade_id,
                            domain::EpochMillis effective_date,
                            domain::PartyList parties,
                            const domain::PartyId& initiator,
                            domain::SnapshotId before_state_id) const;

  // -------------------------------------------------------------------------
  // store(record)
  // -------------------------------------------------------------------------
  // @brief  Appends the record to the global table and the trade's ordered
  //         list. Visible to queries immediately.
  //
  // @details
  // previous_event_id is overwritten with the trade's last event id (empty
  // for the first event).
  //
  // @return The record as stored.
  // @throws LedgerError EventAlreadyExists, TradeNotFound.
  // -------------------------------------------------------------------------
  domain::EventRecord store(domain::EventRecord record,
                            LedgerTransaction* txn = nullptr);

  // Pending → Processed, recording the snapshot the event produced (or left
  // in place). Throws EventNotFound, EventAlreadyFinalized.
  domain::EventRecord markProcessed(const domain::EventId& event_id,
                                    domain::SnapshotId after_state_id,
                                    LedgerTransaction* txn = nullptr);

  // Pending → Failed with a reason. Throws EventNotFound,
  // EventAlreadyFinalized.
  domain::EventRecord markFailed(const domain::EventId& event_id,
                                 const std::string& reason,
                                 LedgerTransaction* txn = nullptr);

  // --- Queries --------------------------------------------------------------

  bool exists(const domain::EventId& event_id) const;

  std::optional<domain::EventRecord> find(
      const domain::EventId& event_id) const;

  // Throws LedgerError(EventNotFound) if absent.
  domain::EventRecord get(const domain::EventId& event_id) const;

  // Events of a trade in arrival order, optionally restricted to one kind.
  // Empty for trades with no events (or unknown trades).
  std::vector<domain::EventRecord> eventsForTrade(
      const domain::TradeId& trade_id,
      std::optional<domain::EventType> type = std::nullopt) const;

  std::optional<domain::EventRecord> lastEventForTrade(
      const domain::TradeId& trade_id) const;

  // False for unknown events.
  bool isProcessed(const domain::EventId& event_id) const;

  std::size_t eventCount() const { return records_.size(); }

 private:
  domain::EventRecord finalize(const domain::EventId& event_id,
                               domain::EventStatus status,
                               domain::SnapshotId after_state_id,
                               const std::string& message,
                               LedgerTransaction* txn);

  const StateStore& states_;
  const ITimeProvider& clock_;

  std::unordered_map<domain::EventId, domain::EventRecord> records_;
  std::unordered_map<domain::TradeId, std::vector<domain::EventId>> by_trade_;
};

}  // namespace tradeledger
