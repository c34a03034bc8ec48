#pragma once

#include "tradeledger/domain/identifiers.hpp"

#include <optional>
#include <string>

namespace tradeledger {
namespace domain {

// How the counterparties confirmed the executed terms.
enum class ConfirmationMethod {
  Electronic,
  Manual,
  Voice,
};

// -----------------------------------------------------------------------------
// ExecutionDetails
// -----------------------------------------------------------------------------
// Where, when and at what price the trade was executed. timestamp is the
// execution time and must not be later than the economic effective date.
// -----------------------------------------------------------------------------
struct ExecutionDetails {
  std::string venue;
  double price{0.0};
  ConfirmationMethod confirmation_method{ConfirmationMethod::Electronic};
  EpochMillis timestamp{0};
};

// -----------------------------------------------------------------------------
// EconomicTerms
// -----------------------------------------------------------------------------
// Snapshot of the economic terms agreed at execution. Stored verbatim; the
// ledger does not price or re-derive them.
// -----------------------------------------------------------------------------
struct EconomicTerms {
  double notional{0.0};
  std::string currency;
  EpochMillis effective_date{0};
  EpochMillis maturity_date{0};
};

// -----------------------------------------------------------------------------
// ExecutionEventData
// -----------------------------------------------------------------------------
// Typed payload of a trade's single inception event. Exactly one exists per
// executed trade; owned by the ExecutionRecorder.
// -----------------------------------------------------------------------------
struct ExecutionEventData {
  EventId event_id;
  TradeId trade_id;
  ExecutionDetails details;
  EconomicTerms terms;
  PartyId buyer;
  PartyId seller;
  std::optional<PartyId> broker;
  EpochMillis trade_date{0};
};

const char* confirmationMethodName(ConfirmationMethod method);

}  // namespace domain
}  // namespace tradeledger
