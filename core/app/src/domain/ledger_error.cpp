#include "tradeledger/domain/ledger_error.hpp"

namespace tradeledger {

// -----------------------------------------------------------------------------
// LedgerError constructor
// -----------------------------------------------------------------------------
LedgerError::LedgerError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(errorCodeName(code)) + ": " + detail),
      code_(code),
      detail_(detail) {}

// -----------------------------------------------------------------------------
// errorKindOf: fold each named condition into its taxonomy class
// -----------------------------------------------------------------------------
ErrorKind errorKindOf(ErrorCode code) {
  using C = ErrorCode;
  switch (code) {
    case C::TradeNotFound:
    case C::EventNotFound:
    case C::ExecutionNotFound:
    case C::ResetNotFound:
    case C::TransferNotFound:
    case C::TerminationNotFound:
      return ErrorKind::NotFound;

    case C::TradeAlreadyExists:
    case C::EventAlreadyExists:
    case C::AlreadyExecuted:
    case C::ResetAlreadyExists:
    case C::DuplicateReference:
    case C::TradeAlreadyTerminated:
      return ErrorKind::AlreadyExists;

    case C::InvalidIdentifier:
    case C::InvalidProductType:
    case C::InvalidParties:
    case C::InvalidDates:
    case C::InvalidEffectiveDate:
    case C::InvalidNotional:
    case C::InvalidAmount:
    case C::InvalidObservationDate:
    case C::InvalidPeriodDates:
    case C::InvalidResetNumber:
    case C::InvalidAveragingData:
    case C::InvalidTerminationDate:
    case C::InvalidPaymentDetails:
    case C::SettlementTradeMismatch:
    case C::InvalidEnumName:
      return ErrorKind::InvalidInput;

    case C::IllegalTransition:
      return ErrorKind::IllegalTransition;

    case C::WrongTradeState:
    case C::TradeNotActive:
    case C::InvalidSettlementTransition:
    case C::InvalidTerminationStatus:
      return ErrorKind::WrongLifecycleStage;

    case C::EventAlreadyFinalized:
    case C::AlreadySettled:
    case C::TransferCancelled:
      return ErrorKind::AlreadyTerminal;
  }
  return ErrorKind::InvalidInput;
}

const char* errorCodeName(ErrorCode code) {
  using C = ErrorCode;
  switch (code) {
    case C::TradeNotFound:               return "TradeNotFound";
    case C::EventNotFound:               return "EventNotFound";
    case C::ExecutionNotFound:           return "ExecutionNotFound";
    case C::ResetNotFound:               return "ResetNotFound";
    case C::TransferNotFound:            return "TransferNotFound";
    case C::TerminationNotFound:         return "TerminationNotFound";
    case C::TradeAlreadyExists:          return "TradeAlreadyExists";
    case C::EventAlreadyExists:          return "EventAlreadyExists";
    case C::AlreadyExecuted:             return "AlreadyExecuted";
    case C::ResetAlreadyExists:          return "ResetAlreadyExists";
    case C::DuplicateReference:          return "DuplicateReference";
    case C::TradeAlreadyTerminated:      return "TradeAlreadyTerminated";
    case C::InvalidIdentifier:           return "InvalidIdentifier";
    case C::InvalidProductType:          return "InvalidProductType";
    case C::InvalidParties:              return "InvalidParties";
    case C::InvalidDates:                return "InvalidDates";
    case C::InvalidEffectiveDate:        return "InvalidEffectiveDate";
    case C::InvalidNotional:             return "InvalidNotional";
    case C::InvalidAmount:               return "InvalidAmount";
    case C::InvalidObservationDate:      return "InvalidObservationDate";
    case C::InvalidPeriodDates:          return "InvalidPeriodDates";
    case C::InvalidResetNumber:          return "InvalidResetNumber";
    case C::InvalidAveragingData:        return "InvalidAveragingData";
    case C::InvalidTerminationDate:      return "InvalidTerminationDate";
    case C::InvalidPaymentDetails:       return "InvalidPaymentDetails";
    case C::SettlementTradeMismatch:     return "SettlementTradeMismatch";
    case C::InvalidEnumName:             return "InvalidEnumName";
    case C::IllegalTransition:           return "IllegalTransition";
    case C::WrongTradeState:             return "WrongTradeState";
    case C::TradeNotActive:              return "TradeNotActive";
    case C::InvalidSettlementTransition: return "InvalidSettlementTransition";
    case C::InvalidTerminationStatus:    return "InvalidTerminationStatus";
    case C::EventAlreadyFinalized:       return "EventAlreadyFinalized";
    case C::AlreadySettled:              return "AlreadySettled";
    case C::TransferCancelled:           return "TransferCancelled";
  }
  return "Unknown";
}

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:            return "NotFound";
    case ErrorKind::AlreadyExists:       return "AlreadyExists";
    case ErrorKind::InvalidInput:        return "InvalidInput";
    case ErrorKind::IllegalTransition:   return "IllegalTransition";
    case ErrorKind::WrongLifecycleStage: return "WrongLifecycleStage";
    case ErrorKind::AlreadyTerminal:     return "AlreadyTerminal";
  }
  return "Unknown";
}

}  // namespace tradeledger
