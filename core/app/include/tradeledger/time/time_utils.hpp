#pragma once

#include <cstdint>

namespace tradeledger {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Helpers for the epoch-millisecond dates the ledger stores.
//
// @details
// Business dates (effective, maturity, value, termination) and timestamps
// share one representation: std::int64_t milliseconds since the Unix epoch.
// These helpers build day offsets and day counts for the StateStore queries
// and for tests. All are stateless and safe from any thread.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMillisPerSecond = 1000;
inline constexpr std::int64_t kMillisPerDay = 24 * 60 * 60 * kMillisPerSecond;

inline constexpr std::int64_t days_to_ms(std::int64_t days) {
  return days * kMillisPerDay;
}

// Whole days between two instants, truncated toward zero. Negative when
// `to` precedes `from`.
inline constexpr std::int64_t whole_days_between(std::int64_t from_ms,
                                                 std::int64_t to_ms) {
  return (to_ms - from_ms) / kMillisPerDay;
}

}  // namespace tradeledger
