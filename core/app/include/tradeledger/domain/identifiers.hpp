#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// Identifiers
// -----------------------------------------------------------------------------
// Responsibility: Names the opaque tokens that flow through every ledger API.
//
// TradeId, EventId and PartyId are supplied by the caller. The ledger never
// interprets their internal structure; it only compares them for equality
// and uses them as map keys. An empty string means "not set" and is rejected
// wherever an identifier is mandatory.
//
// SnapshotId and TransitionId are assigned by the StateStore. Each one is the
// 1-based position of the entry in the store's append-only arena, so a
// back-reference is a plain lookup key and never an owning pointer. Zero is
// reserved as the "none" sentinel (e.g. the creation snapshot has
// previous_snapshot_id == 0).
// -----------------------------------------------------------------------------
using TradeId = std::string;
using EventId = std::string;
using PartyId = std::string;

using SnapshotId = std::uint64_t;
using TransitionId = std::uint64_t;

inline constexpr SnapshotId kNoSnapshot = 0;

// Epoch milliseconds. Used for timestamps and business dates alike; a value
// of 0 means "not set".
using EpochMillis = std::int64_t;

using PartyList = std::vector<PartyId>;

// -----------------------------------------------------------------------------
// Validity
// -----------------------------------------------------------------------------
// Business-time interval over which a record is in force. Records are
// written open-ended (valid_to unset); nothing in the core closes them.
// -----------------------------------------------------------------------------
struct Validity {
  EpochMillis valid_from{0};
  std::optional<EpochMillis> valid_to;
};

inline bool operator==(const Validity& a, const Validity& b) {
  return a.valid_from == b.valid_from && a.valid_to == b.valid_to;
}

}  // namespace domain
}  // namespace tradeledger
