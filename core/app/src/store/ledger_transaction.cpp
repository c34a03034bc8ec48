#include "tradeledger/store/ledger_transaction.hpp"

#include <iostream>
#include <utility>

namespace tradeledger {

LedgerTransaction::~LedgerTransaction() {
  if (!committed_ && !undo_log_.empty()) {
    std::cerr << "[LedgerTransaction] rolling back " << undo_log_.size()
              << " uncommitted change(s)\n";
  }
  rollback();
}

void LedgerTransaction::onRollback(UndoAction undo) {
  undo_log_.push_back(std::move(undo));
}

void LedgerTransaction::enqueue(LedgerUpdate update) {
  updates_.push_back(std::move(update));
}

void LedgerTransaction::commit() {
  committed_ = true;
  undo_log_.clear();
}

// -----------------------------------------------------------------------------
// rollback(): replay the undo log newest-first
// -----------------------------------------------------------------------------
void LedgerTransaction::rollback() noexcept {
  if (committed_) {
    return;
  }
  while (!undo_log_.empty()) {
    UndoAction undo = std::move(undo_log_.back());
    undo_log_.pop_back();
    undo();
  }
  updates_.clear();
}

std::vector<LedgerUpdate> LedgerTransaction::takeUpdates() {
  if (!committed_) {
    return {};
  }
  return std::exchange(updates_, {});
}

}  // namespace tradeledger
