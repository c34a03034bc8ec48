#pragma once

#include "tradeledger/domain/identifiers.hpp"

#include <string>

namespace tradeledger {
namespace domain {

enum class TerminationType {
  MutualAgreement,
  Unilateral,
  EventOfDefault,
  TerminationEvent,
  Novation,
};

enum class PaymentMethod {
  Zero,            // Walk away, no payment
  MarkToMarket,
  AgreedAmount,
  ReplacementCost,
};

// Pending ──> Confirmed ──> Settled; Disputed is reachable from any status.
enum class TerminationStatus {
  Pending,
  Confirmed,
  Settled,
  Disputed,
};

struct TerminationDetails {
  TerminationType type{TerminationType::MutualAgreement};
  EpochMillis termination_date{0};
  EpochMillis notification_date{0};
  std::string reason;
};

struct TerminationPayment {
  PaymentMethod method{PaymentMethod::Zero};
  double value{0.0};
  std::string currency;
  PartyId payer;
  PartyId receiver;
  bool is_disputed{false};
};

// -----------------------------------------------------------------------------
// TerminationEventData
// -----------------------------------------------------------------------------
// Typed payload of an early termination; at most one per trade.
// settlement_transfer_event_id names the TransferRecorder event that pays
// the termination amount once linkSettlementTransfer() has been called.
// -----------------------------------------------------------------------------
struct TerminationEventData {
  EventId event_id;
  TradeId trade_id;
  TerminationDetails details;
  TerminationPayment payment;
  TerminationStatus status{TerminationStatus::Pending};
  EventId settlement_transfer_event_id;
  PartyId disputed_by;
  std::string dispute_reason;
  EpochMillis last_updated{0};
};

const char* terminationTypeName(TerminationType type);
const char* paymentMethodName(PaymentMethod method);
const char* terminationStatusName(TerminationStatus status);

}  // namespace domain
}  // namespace tradeledger
