#pragma once

#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/termination_data.hpp"
#include "tradeledger/recorders/transfer_recorder.hpp"
#include "tradeledger/store/event_ledger.hpp"
#include "tradeledger/store/ledger_transaction.hpp"
#include "tradeledger/store/state_store.hpp"
#include "tradeledger/time/i_time_provider.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace tradeledger {

struct TerminationRequest {
  domain::EventId event_id;
  domain::TradeId trade_id;
  domain::TerminationDetails details;
  domain::TerminationPayment payment;
  domain::PartyId initiator;
};

// -----------------------------------------------------------------------------
// TerminationRecorder: early termination of a live trade
// -----------------------------------------------------------------------------
//
// @brief  Records at most one termination per trade, moves the trade to
//         Terminated, and tracks the termination's own status.
//
// @details
// Termination status: Pending ──> Confirmed ──> Settled, with Disputed
// reachable from any status. Settled is reached by linking the transfer
// that pays the termination amount; it does not move the trade to Settled,
// which stays a separate StateStore::transitionState call.
//
// terminateTrade validation (first failure wins):
//   EventLedger::validateBasics over the trade's parties
//   termination already recorded             → TradeAlreadyTerminated
//   trade not Active or Confirmed            → TradeNotActive
//   termination date before now, or
//   notification after termination           → InvalidTerminationDate
//   negative value, or non-zero under Zero   → InvalidPaymentDetails
//   method not Zero and payer/receiver
//   empty or equal; initiator empty          → InvalidParties
//
// Thread model / ownership: as StateStore. Reads transfers through a const
// reference to the TransferRecorder, which must outlive this recorder.
// -----------------------------------------------------------------------------
class TerminationRecorder {
 public:
  TerminationRecorder(StateStore& states, EventLedger& events,
                      const TransferRecorder& transfers,
                      const ITimeProvider& clock);

  TerminationRecorder(const TerminationRecorder&) = delete;
  TerminationRecorder& operator=(const TerminationRecorder&) = delete;

  domain::EventRecord terminateTrade(const TerminationRequest& request,
                                     LedgerTransaction& txn);

  // Pending → Confirmed.
  domain::TerminationEventData confirmTermination(
      const domain::EventId& event_id, LedgerTransaction& txn);

  domain::TerminationEventData disputeTermination(
      const domain::EventId& event_id, const domain::PartyId& disputing_party,
      const std::string& reason, LedgerTransaction& txn);

  // -------------------------------------------------------------------------
  // linkSettlementTransfer(event_id, transfer_event_id)
  // -------------------------------------------------------------------------
  // @brief  Records the transfer paying the termination and marks the
  //         termination Settled.
  // @throws LedgerError TerminationNotFound, AlreadySettled,
  //         TransferNotFound, SettlementTradeMismatch.
  // -------------------------------------------------------------------------
  domain::TerminationEventData linkSettlementTransfer(
      const domain::EventId& event_id,
      const domain::EventId& transfer_event_id, LedgerTransaction& txn);

  bool hasTermination(const domain::TradeId& trade_id) const;

  std::optional<domain::TerminationEventData> terminationForTrade(
      const domain::TradeId& trade_id) const;

  std::optional<domain::TerminationEventData> findByEvent(
      const domain::EventId& event_id) const;

 private:
  using TerminationMutator = std::function<void(domain::TerminationEventData&)>;

  void validate(const TerminationRequest& request,
                const domain::PartyList& parties) const;

  domain::TerminationEventData& terminationOrThrow(
      const domain::EventId& event_id);

  domain::TerminationEventData applyStatus(domain::TerminationEventData& data,
                                           domain::TerminationStatus target,
                                           const TerminationMutator& mutate,
                                           LedgerTransaction& txn);

  StateStore& states_;
  EventLedger& events_;
  const TransferRecorder& transfers_;
  const ITimeProvider& clock_;

  std::unordered_map<domain::TradeId, domain::TerminationEventData> by_trade_;
  std::unordered_map<domain::EventId, domain::TradeId> trade_of_event_;
};

}  // namespace tradeledger
