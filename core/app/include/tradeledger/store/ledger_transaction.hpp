#pragma once

#include "tradeledger/events/ledger_update.hpp"

#include <functional>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// LedgerTransaction: all-or-nothing write scope
// -----------------------------------------------------------------------------
//
// @brief  Undo log plus pending-update buffer for one ledger write.
//
// @details
// A single business operation touches several tables: a recorder's typed
// payload, the EventLedger's generic record and per-trade list, and for
// executions and terminations also the StateStore's snapshot arena,
// transition log and current pointer. Either all of them change or none do.
//
// Each component that mutates state inside a transaction registers the
// inverse operation with onRollback(). Because every table is append-only
// (or a small in-place field change) and writes are serialized by the
// LifecycleEngine lock, the inverse is always "pop what I just pushed" or
// "restore the field I just overwrote", and replaying the log in reverse
// restores the exact pre-transaction state.
//
// If the transaction is destroyed without commit() (typically because a
// LedgerError or std::bad_alloc escaped mid-operation), the destructor runs
// the undo log. After commit() the undo log is discarded.
//
// Updates queued with enqueue() are handed to the caller by takeUpdates()
// only after commit, so subscribers never hear about rolled-back writes.
//
// Thread model:
//   Not thread-safe. A transaction lives on the stack of the thread holding
//   the LifecycleEngine's exclusive lock.
// -----------------------------------------------------------------------------
class LedgerTransaction {
 public:
  using UndoAction = std::function<void()>;

  LedgerTransaction() = default;
  ~LedgerTransaction();

  LedgerTransaction(const LedgerTransaction&) = delete;
  LedgerTransaction& operator=(const LedgerTransaction&) = delete;
  LedgerTransaction(LedgerTransaction&&) = delete;
  LedgerTransaction& operator=(LedgerTransaction&&) = delete;

  // Registers the inverse of a mutation that has just been applied. Undo
  // actions must not throw.
  void onRollback(UndoAction undo);

  // Buffers an update for publication after commit.
  void enqueue(LedgerUpdate update);

  // Makes every registered mutation permanent.
  void commit();

  // Reverts every registered mutation, newest first. No-op once committed
  // or already rolled back.
  void rollback() noexcept;

  bool committed() const { return committed_; }

  // Returns the buffered updates in enqueue order. Empty unless committed.
  std::vector<LedgerUpdate> takeUpdates();

 private:
  std::vector<UndoAction> undo_log_;
  std::vector<LedgerUpdate> updates_;
  bool committed_{false};
};

}  // namespace tradeledger
