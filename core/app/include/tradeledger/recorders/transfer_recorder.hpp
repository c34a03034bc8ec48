#pragma once

#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/transfer_data.hpp"
#include "tradeledger/store/event_ledger.hpp"
#include "tradeledger/store/ledger_transaction.hpp"
#include "tradeledger/store/state_store.hpp"
#include "tradeledger/time/i_time_provider.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeledger {

struct TransferRequest {
  domain::EventId event_id;
  domain::TradeId trade_id;
  domain::TransferType transfer_type{domain::TransferType::Coupon};
  domain::PaymentDetails payment;
  domain::TransferParties parties;
  domain::PartyId initiator;
};

// -----------------------------------------------------------------------------
// TransferRecorder: payment obligations and their settlement
// -----------------------------------------------------------------------------
//
// @brief  Records transfers against a trade in any lifecycle state and
//         tracks each transfer's settlement sub-state.
//
// @details
// Recording an obligation is not settlement: recordTransfer() stores the
// payload with SettlementStatus::Pending and marks the generic EventRecord
// Processed immediately, without moving the trade's state. Settlement then
// progresses through initiateTransfer / settleTransfer / failTransfer /
// cancelTransfer, none of which touch the EventRecord.
//
// Numbering: sequence_number is assigned per trade in insertion order
// starting at 1, and previous_transfer_event_id links each transfer to the
// trade's preceding one.
//
// Payment references, when present, are unique across all trades.
//
// recordTransfer validation (first failure wins):
//   EventLedger::validateBasics over {payer, receiver}
//   payment reference already used           → DuplicateReference
//   net amount not positive                  → InvalidAmount
//   payer/receiver/initiator empty, or
//   payer == receiver                        → InvalidParties
//   value date unset                         → InvalidDates
// -----------------------------------------------------------------------------
class TransferRecorder {
 public:
  TransferRecorder(StateStore& states, EventLedger& events,
                   const ITimeProvider& clock);

  TransferRecorder(const TransferRecorder&) = delete;
  TransferRecorder& operator=(const TransferRecorder&) = delete;

  domain::EventRecord recordTransfer(const TransferRequest& request,
                                     LedgerTransaction& txn);

  // Pending → Initiated.
  domain::TransferEventData initiateTransfer(const domain::EventId& event_id,
                                             LedgerTransaction& txn);

  // -------------------------------------------------------------------------
  // settleTransfer(event_id, settlement_date, reference)
  // -------------------------------------------------------------------------
  // @brief  Pending | Initiated | Failed → Settled.
  // @throws LedgerError TransferNotFound, AlreadySettled, TransferCancelled,
  //         InvalidDates (settlement_date unset).
  // -------------------------------------------------------------------------
  domain::TransferEventData settleTransfer(const domain::EventId& event_id,
                                           domain::EpochMillis settlement_date,
                                           const std::string& reference,
                                           LedgerTransaction& txn);

  // Any non-final status → Failed. Throws AlreadySettled once settled.
  domain::TransferEventData failTransfer(const domain::EventId& event_id,
                                         const std::string& reason,
                                         LedgerTransaction& txn);

  // Pending | Initiated | Failed → Cancelled.
  domain::TransferEventData cancelTransfer(const domain::EventId& event_id,
                                           const std::string& reason,
                                           LedgerTransaction& txn);

  // Independent verification flag; allowed in any settlement status.
  domain::TransferEventData verifyTransfer(const domain::EventId& event_id,
                                           const domain::PartyId& verifier,
                                           LedgerTransaction& txn);

  std::optional<domain::TransferEventData> findByEvent(
      const domain::EventId& event_id) const;

  std::optional<domain::TransferEventData> findByReference(
      const std::string& payment_reference) const;

  // Transfers of a trade in sequence-number order.
  std::vector<domain::TransferEventData> transfersForTrade(
      const domain::TradeId& trade_id) const;

  std::size_t transferCount(const domain::TradeId& trade_id) const;

  // False for unknown events.
  bool isSettled(const domain::EventId& event_id) const;

 private:
  using SettlementMutator = std::function<void(domain::SettlementInfo&)>;

  void validate(const TransferRequest& request,
                const domain::PartyList& parties) const;

  domain::TransferEventData& transferOrThrow(const domain::EventId& event_id);

  // Applies a settlement change after the caller's checks, registering the
  // undo action and queueing a TransferStatusUpdate.
  domain::TransferEventData applySettlement(domain::TransferEventData& data,
                                            domain::SettlementStatus target,
                                            const SettlementMutator& mutate,
                                            LedgerTransaction& txn);

  // Throws AlreadySettled / TransferCancelled for final statuses.
  static void rejectIfFinal(const domain::TransferEventData& data);

  StateStore& states_;
  EventLedger& events_;
  const ITimeProvider& clock_;

  std::unordered_map<domain::EventId, domain::TransferEventData> by_event_;
  std::unordered_map<domain::TradeId, std::vector<domain::EventId>> order_;
  std::unordered_map<std::string, domain::EventId> references_;
};

}  // namespace tradeledger
