#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/execution_data.hpp"
#include "tradeledger/domain/reset_data.hpp"
#include "tradeledger/domain/termination_data.hpp"
#include "tradeledger/domain/trade_state.hpp"
#include "tradeledger/domain/transfer_data.hpp"

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// Canonical enum names
// -----------------------------------------------------------------------------
// Upper-case spellings shared by log lines, error messages and the JSON
// codec. The codec decodes by matching these names, so renaming one changes
// the wire format.
// -----------------------------------------------------------------------------

const char* tradeStateName(TradeState state) {
  using S = TradeState;
  switch (state) {
    case S::Created:    return "CREATED";
    case S::Pending:    return "PENDING";
    case S::Confirmed:  return "CONFIRMED";
    case S::Active:     return "ACTIVE";
    case S::Matured:    return "MATURED";
    case S::Terminated: return "TERMINATED";
    case S::Settled:    return "SETTLED";
  }
  return "UNKNOWN";
}

const char* productTypeName(ProductType type) {
  using P = ProductType;
  switch (type) {
    case P::Unspecified:          return "UNSPECIFIED";
    case P::InterestRateSwap:     return "IRS";
    case P::CrossCurrencySwap:    return "CCS";
    case P::BasisSwap:            return "BASIS_SWAP";
    case P::ForwardRateAgreement: return "FRA";
    case P::FxForward:            return "FX_FORWARD";
    case P::FxSwap:               return "FX_SWAP";
    case P::CreditDefaultSwap:    return "CDS";
    case P::EquitySwap:           return "EQUITY_SWAP";
    case P::Swaption:             return "SWAPTION";
  }
  return "UNKNOWN";
}

const char* eventTypeName(EventType type) {
  switch (type) {
    case EventType::Execution:   return "EXECUTION";
    case EventType::Reset:       return "RESET";
    case EventType::Transfer:    return "TRANSFER";
    case EventType::Termination: return "TERMINATION";
  }
  return "UNKNOWN";
}

const char* eventStatusName(EventStatus status) {
  switch (status) {
    case EventStatus::Pending:   return "PENDING";
    case EventStatus::Processed: return "PROCESSED";
    case EventStatus::Failed:    return "FAILED";
  }
  return "UNKNOWN";
}

const char* confirmationMethodName(ConfirmationMethod method) {
  switch (method) {
    case ConfirmationMethod::Electronic: return "ELECTRONIC";
    case ConfirmationMethod::Manual:     return "MANUAL";
    case ConfirmationMethod::Voice:      return "VOICE";
  }
  return "UNKNOWN";
}

const char* averagingMethodName(AveragingMethod method) {
  switch (method) {
    case AveragingMethod::None:       return "NONE";
    case AveragingMethod::Simple:     return "SIMPLE";
    case AveragingMethod::Weighted:   return "WEIGHTED";
    case AveragingMethod::Compounded: return "COMPOUNDED";
  }
  return "UNKNOWN";
}

const char* transferTypeName(TransferType type) {
  switch (type) {
    case TransferType::Coupon:             return "COUPON";
    case TransferType::Fee:                return "FEE";
    case TransferType::Principal:          return "PRINCIPAL";
    case TransferType::Collateral:         return "COLLATERAL";
    case TransferType::TerminationPayment: return "TERMINATION_PAYMENT";
  }
  return "UNKNOWN";
}

const char* transferDirectionName(TransferDirection direction) {
  switch (direction) {
    case TransferDirection::Pay:     return "PAY";
    case TransferDirection::Receive: return "RECEIVE";
  }
  return "UNKNOWN";
}

const char* settlementStatusName(SettlementStatus status) {
  using S = SettlementStatus;
  switch (status) {
    case S::Pending:   return "PENDING";
    case S::Initiated: return "INITIATED";
    case S::Settled:   return "SETTLED";
    case S::Failed:    return "FAILED";
    case S::Cancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

const char* terminationTypeName(TerminationType type) {
  using T = TerminationType;
  switch (type) {
    case T::MutualAgreement:  return "MUTUAL_AGREEMENT";
    case T::Unilateral:       return "UNILATERAL";
    case T::EventOfDefault:   return "EVENT_OF_DEFAULT";
    case T::TerminationEvent: return "TERMINATION_EVENT";
    case T::Novation:         return "NOVATION";
  }
  return "UNKNOWN";
}

const char* paymentMethodName(PaymentMethod method) {
  switch (method) {
    case PaymentMethod::Zero:            return "ZERO";
    case PaymentMethod::MarkToMarket:    return "MARK_TO_MARKET";
    case PaymentMethod::AgreedAmount:    return "AGREED_AMOUNT";
    case PaymentMethod::ReplacementCost: return "REPLACEMENT_COST";
  }
  return "UNKNOWN";
}

const char* terminationStatusName(TerminationStatus status) {
  using S = TerminationStatus;
  switch (status) {
    case S::Pending:   return "PENDING";
    case S::Confirmed: return "CONFIRMED";
    case S::Settled:   return "SETTLED";
    case S::Disputed:  return "DISPUTED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace tradeledger
