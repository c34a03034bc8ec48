#pragma once

#include "tradeledger/domain/identifiers.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradeledger {
namespace domain {

enum class TransferType {
  Coupon,
  Fee,
  Principal,
  Collateral,
  TerminationPayment,
};

// Direction of the cash movement from the recording party's point of view.
enum class TransferDirection {
  Pay,
  Receive,
};

// -----------------------------------------------------------------------------
// SettlementStatus: transfer settlement sub-state
// -----------------------------------------------------------------------------
//
//   Pending ──> Initiated ──> Settled
//      │            │            ▲
//      │            ▼            │
//      ├───────> Failed ─────────┘
//      │            │
//      └──> Cancelled <──────────┘   (also from Initiated)
//
// Settled and Cancelled are final. Failed may be retried to Settled.
// -----------------------------------------------------------------------------
enum class SettlementStatus {
  Pending,
  Initiated,
  Settled,
  Failed,
  Cancelled,
};

struct PaymentDetails {
  double gross_amount{0.0};
  double net_amount{0.0};
  std::string currency;
  TransferDirection direction{TransferDirection::Pay};
  EpochMillis value_date{0};
  std::optional<std::string> payment_reference;  // Globally unique if set
};

struct TransferParties {
  PartyId payer;
  PartyId receiver;
};

struct SettlementInfo {
  SettlementStatus status{SettlementStatus::Pending};
  EpochMillis settlement_date{0};
  std::string settlement_reference;
  std::string failure_reason;
  EpochMillis last_updated{0};
};

// -----------------------------------------------------------------------------
// TransferEventData
// -----------------------------------------------------------------------------
// Typed payload of a payment obligation. sequence_number is assigned by the
// TransferRecorder in insertion order per trade, starting at 1.
// previous_transfer_event_id links to the trade's preceding transfer.
// Recording a transfer does not settle it; settlement progresses through
// the SettlementInfo sub-state.
// -----------------------------------------------------------------------------
struct TransferEventData {
  EventId event_id;
  TradeId trade_id;
  TransferType transfer_type{TransferType::Coupon};
  std::uint32_t sequence_number{0};
  PaymentDetails payment;
  TransferParties parties;
  SettlementInfo settlement;
  EventId previous_transfer_event_id;

  bool verified{false};
  PartyId verified_by;
  EpochMillis verified_at{0};
};

const char* transferTypeName(TransferType type);
const char* transferDirectionName(TransferDirection direction);
const char* settlementStatusName(SettlementStatus status);

}  // namespace domain
}  // namespace tradeledger
