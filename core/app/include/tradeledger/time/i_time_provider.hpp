#pragma once

#include <cstdint>

namespace tradeledger {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Supplies the current time to every ledger component.
//
// @details
// Several ledger rules are relative to "now": a reset observation may not lie
// in the future, a termination date may not lie in the past, trade age and
// time-to-maturity are measured against it, and every snapshot, transition
// and event record is timestamped with it. Components never read the system
// clock directly; they receive `const ITimeProvider&` so that:
//
//   - LiveTimeProvider   → production, wall-clock time.
//   - SimulationTimeProvider → tests and replays, time set explicitly.
//
// Time is epoch milliseconds, the same unit as every business date the
// ledger stores.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads.
//
// Ownership:
//   Components hold a const reference and never own the provider; it must
//   outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradeledger
