#pragma once

#include <stdexcept>
#include <string>

namespace tradeledger {

// -----------------------------------------------------------------------------
// ErrorKind: failure taxonomy
// -----------------------------------------------------------------------------
// Coarse class of a rejected operation. Every ErrorCode maps to exactly one
// kind, so orchestration layers can decide on retry policy without knowing
// each individual condition.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  NotFound,
  AlreadyExists,
  InvalidInput,
  IllegalTransition,
  WrongLifecycleStage,
  AlreadyTerminal,
};

// -----------------------------------------------------------------------------
// ErrorCode: distinct named failure conditions
// -----------------------------------------------------------------------------
enum class ErrorCode {
  // NotFound
  TradeNotFound,
  EventNotFound,
  ExecutionNotFound,
  ResetNotFound,
  TransferNotFound,
  TerminationNotFound,

  // AlreadyExists
  TradeAlreadyExists,
  EventAlreadyExists,
  AlreadyExecuted,
  ResetAlreadyExists,
  DuplicateReference,
  TradeAlreadyTerminated,

  // InvalidInput
  InvalidIdentifier,
  InvalidProductType,
  InvalidParties,
  InvalidDates,
  InvalidEffectiveDate,
  InvalidNotional,
  InvalidAmount,
  InvalidObservationDate,
  InvalidPeriodDates,
  InvalidResetNumber,
  InvalidAveragingData,
  InvalidTerminationDate,
  InvalidPaymentDetails,
  SettlementTradeMismatch,
  InvalidEnumName,

  // IllegalTransition
  IllegalTransition,

  // WrongLifecycleStage
  WrongTradeState,
  TradeNotActive,
  InvalidSettlementTransition,
  InvalidTerminationStatus,

  // AlreadyTerminal
  EventAlreadyFinalized,
  AlreadySettled,
  TransferCancelled,
};

ErrorKind errorKindOf(ErrorCode code);
const char* errorCodeName(ErrorCode code);
const char* errorKindName(ErrorKind kind);

// -----------------------------------------------------------------------------
// LedgerError
// -----------------------------------------------------------------------------
//
// @brief  Exception thrown by every ledger component when a precondition
//         fails.
//
// @details
// The operation that throws has made no visible change: validation runs
// before any write, and the LifecycleEngine rolls back the enclosing
// LedgerTransaction if anything escapes after the first write.
//
// what() returns "<CodeName>: <detail>" so a bare log line is still
// self-describing.
// -----------------------------------------------------------------------------
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorCode code, const std::string& detail);

  ErrorCode code() const noexcept { return code_; }
  ErrorKind kind() const noexcept { return errorKindOf(code_); }
  const std::string& detail() const noexcept { return detail_; }

 private:
  ErrorCode code_;
  std::string detail_;
};

}  // namespace tradeledger
