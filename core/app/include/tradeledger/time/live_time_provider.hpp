#pragma once

#include "tradeledger/time/i_time_provider.hpp"

namespace tradeledger {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by the tradeledger executable when the configured clock mode is
// "live". Reads std::chrono::system_clock on every call; holds no state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradeledger
