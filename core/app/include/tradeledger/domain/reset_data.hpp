#pragma once

#include "tradeledger/domain/identifiers.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// RateObservation
// -----------------------------------------------------------------------------
// A single fixing of a floating-rate index. observed_rate is a decimal
// fraction (5.25% == 0.0525). observation_date must not be in the future
// when the reset is recorded.
// -----------------------------------------------------------------------------
struct RateObservation {
  std::string rate_index;      // e.g. "SOFR", "EURIBOR-6M"
  std::string source;          // Publishing page or vendor
  EpochMillis observation_date{0};
  double observed_rate{0.0};
};

// -----------------------------------------------------------------------------
// ResetCalculation
// -----------------------------------------------------------------------------
// Calculation-period inputs and the accrual the external calculator derived
// from them. The ledger stores accrual_amount and day_count_fraction as
// opaque values and never recomputes them.
// -----------------------------------------------------------------------------
struct ResetCalculation {
  EpochMillis period_start{0};
  EpochMillis period_end{0};
  double notional{0.0};
  double day_count_fraction{0.0};
  double accrual_amount{0.0};
};

enum class AveragingMethod {
  None,
  Simple,
  Weighted,
  Compounded,
};

// -----------------------------------------------------------------------------
// AveragingData
// -----------------------------------------------------------------------------
// Optional sub-record for resets whose rate is an average of several raw
// observations. final_rate must equal the parent observation's
// observed_rate; for Weighted averaging weights must pair one-to-one with
// observations.
// -----------------------------------------------------------------------------
struct AveragingData {
  AveragingMethod method{AveragingMethod::None};
  std::vector<double> observations;
  std::optional<std::vector<double>> weights;
  std::uint32_t compounding_periods{0};
  double final_rate{0.0};
};

// -----------------------------------------------------------------------------
// ResetEventData
// -----------------------------------------------------------------------------
// Typed payload of a rate reset. Keyed by (trade_id, reset_number); the
// number is supplied by the caller (it usually mirrors an externally defined
// period number) and need not be contiguous.
//
// previous_reset_event_id links to the reset recorded for
// reset_number - 1 on the same trade when one exists at recording time, and
// is empty otherwise. The verification fields are written by verifyRate()
// and are independent of the event's processing status.
// -----------------------------------------------------------------------------
struct ResetEventData {
  EventId event_id;
  TradeId trade_id;
  std::string payout_reference;
  std::uint32_t reset_number{0};
  RateObservation observation;
  ResetCalculation calculation;
  std::optional<AveragingData> averaging;
  EventId previous_reset_event_id;

  bool rate_verified{false};
  PartyId verified_by;
  EpochMillis verified_at{0};
};

const char* averagingMethodName(AveragingMethod method);

}  // namespace domain
}  // namespace tradeledger
