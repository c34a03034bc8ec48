#pragma once

#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/reset_data.hpp"
#include "tradeledger/store/event_ledger.hpp"
#include "tradeledger/store/ledger_transaction.hpp"
#include "tradeledger/store/state_store.hpp"
#include "tradeledger/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeledger {

struct ResetRequest {
  domain::EventId event_id;
  domain::TradeId trade_id;
  std::string payout_reference;
  std::uint32_t reset_number{0};
  domain::RateObservation observation;
  domain::ResetCalculation calculation;
  domain::PartyId initiator;
  std::optional<domain::AveragingData> averaging;
};

// -----------------------------------------------------------------------------
// ResetRecorder: floating-rate observations per calculation period
// -----------------------------------------------------------------------------
//
// @brief  Records rate resets for Active trades. Resets never move the
//         trade's state: the stored EventRecord has before_state_id ==
//         after_state_id and is marked Processed in the same transaction.
//
// @details
// Resets are keyed by (trade, reset_number). The number is caller-supplied
// because it normally mirrors an externally defined period number; it need
// not be contiguous, but it must be non-zero and unique per trade. Out of
// order numbers are accepted as given and never renumbered.
//
// Validation order (first failure wins):
//   reset_number == 0                                   → InvalidResetNumber
//   EventLedger::validateBasics, initiator non-empty
//   (trade, reset_number) already used                  → ResetAlreadyExists
//   trade not Active                                    → TradeNotActive
//   observation date unset or after now                 → InvalidObservationDate
//   period end not after start                          → InvalidPeriodDates
//   notional not positive                               → InvalidNotional
//   averaging inconsistent with the observation         → InvalidAveragingData
//
// The accrual, day-count fraction and averaged rate come from external
// calculators and are stored without recomputation.
// -----------------------------------------------------------------------------
class ResetRecorder {
 public:
  ResetRecorder(StateStore& states, EventLedger& events,
                const ITimeProvider& clock);

  ResetRecorder(const ResetRecorder&) = delete;
  ResetRecorder& operator=(const ResetRecorder&) = delete;

  domain::EventRecord recordReset(const ResetRequest& request,
                                  LedgerTransaction& txn);

  // -------------------------------------------------------------------------
  // verifyRate(event_id, verifier)
  // -------------------------------------------------------------------------
  // @brief  Sets the independent rate-verification flag on a reset.
  //
  // @details
  // Does not touch the event's processing status. Re-verification simply
  // records the latest verifier and time.
  //
  // @throws LedgerError ResetNotFound, InvalidParties (empty verifier).
  // -------------------------------------------------------------------------
  domain::ResetEventData verifyRate(const domain::EventId& event_id,
                                    const domain::PartyId& verifier,
                                    LedgerTransaction& txn);

  std::optional<domain::ResetEventData> findByEvent(
      const domain::EventId& event_id) const;

  std::optional<domain::ResetEventData> resetByNumber(
      const domain::TradeId& trade_id, std::uint32_t reset_number) const;

  // Resets of a trade in recording order.
  std::vector<domain::ResetEventData> resetsForTrade(
      const domain::TradeId& trade_id) const;

  std::size_t resetCount(const domain::TradeId& trade_id) const;

  // Most recently recorded reset of the trade.
  std::optional<domain::ResetEventData> latestReset(
      const domain::TradeId& trade_id) const;

 private:
  void validate(const ResetRequest& request,
                const domain::PartyList& parties) const;
  static void validateAveraging(const ResetRequest& request);

  StateStore& states_;
  EventLedger& events_;
  const ITimeProvider& clock_;

  std::unordered_map<domain::EventId, domain::ResetEventData> by_event_;
  std::unordered_map<domain::TradeId, std::map<std::uint32_t, domain::EventId>>
      by_number_;
  std::unordered_map<domain::TradeId, std::vector<domain::EventId>> order_;
};

}  // namespace tradeledger
