#pragma once

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// TradeState: trade lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a trade can occupy between inception and
//         final settlement.
//
// @details
// The StateStore enforces the legal transition graph:
//
//   Created ──> Pending ──> Confirmed ──> Active ──> Matured ──> Settled
//     │  ▲         │           │            │                      ▲
//     │  └─────────┘           │            │                      │
//     └──────────> Confirmed   └──────> Terminated <───────────────┘
//                                           │
//                                           └──────────> Settled
//
//   Created    → Pending, Confirmed
//   Pending    → Confirmed, Created
//   Confirmed  → Active, Terminated
//   Active     → Matured, Terminated
//   Matured    → Settled
//   Terminated → Settled
//   Settled    → (none: terminal)
//
// Thread model:
//   Plain enum, value type. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class TradeState {
  Created,     // Trade registered, not yet executed
  Pending,     // Awaiting counterparty affirmation
  Confirmed,   // Execution recorded and confirmed
  Active,      // Effective date reached, cashflows running
  Matured,     // Scheduled maturity reached
  Terminated,  // Ended early before maturity
  Settled,     // All obligations discharged: terminal state
};

// -----------------------------------------------------------------------------
// ProductType
// -----------------------------------------------------------------------------
// Closed set of instrument families the ledger accepts. Unspecified exists
// only so a default-constructed request is detectably incomplete; the
// StateStore rejects it.
// -----------------------------------------------------------------------------
enum class ProductType {
  Unspecified,
  InterestRateSwap,
  CrossCurrencySwap,
  BasisSwap,
  ForwardRateAgreement,
  FxForward,
  FxSwap,
  CreditDefaultSwap,
  EquitySwap,
  Swaption,
};

const char* tradeStateName(TradeState state);
const char* productTypeName(ProductType type);

}  // namespace domain
}  // namespace tradeledger
