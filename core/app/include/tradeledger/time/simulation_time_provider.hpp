#pragma once

#include "tradeledger/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradeledger {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly by its owner.
//
// @details
// Lets tests and historical replays pin the ledger's notion of "now" so that
// date-relative rules (observation dates, termination dates, trade age) and
// every stored timestamp are deterministic. The executable selects it when
// the configured clock mode is "simulation".
//
// Internal storage is a std::atomic<int64_t>: one writer (the test or replay
// driver) and any number of concurrent readers, with no lock on the read
// path.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to new_time_ms.
  //
  // @details
  // Monotonicity is not enforced; tests set arbitrary times to exercise
  // date-relative rejections.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward (or backward for negative delta) by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradeledger
