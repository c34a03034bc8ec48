#pragma once

#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/execution_data.hpp"
#include "tradeledger/domain/ledger_error.hpp"
#include "tradeledger/domain/reset_data.hpp"
#include "tradeledger/domain/termination_data.hpp"
#include "tradeledger/domain/trade_snapshot.hpp"
#include "tradeledger/domain/trade_state.hpp"
#include "tradeledger/domain/transfer_data.hpp"
#include "tradeledger/events/ledger_update.hpp"
#include "tradeledger/recorders/execution_recorder.hpp"
#include "tradeledger/recorders/reset_recorder.hpp"
#include "tradeledger/recorders/termination_recorder.hpp"
#include "tradeledger/recorders/transfer_recorder.hpp"

#include <nlohmann/json.hpp>

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
// Responsibility: nlohmann::json conversions for every ledger value type,
// the recorder request structs, and the LedgerUpdate notifications.
//
// Conventions:
//   - Field names are the C++ member names (snake_case).
//   - Enums travel as the upper-case names returned by domain::*Name().
//     A string that names no enumerator, or a non-string, is rejected with
//     LedgerError(InvalidEnumName); nothing falls back to a default.
//   - Dates and timestamps are integer epoch milliseconds.
//   - Absent std::optional members are omitted on encode; a missing or null
//     key decodes to std::nullopt.
//   - from_json is lenient: a missing key keeps the member's default, so
//     semantic checks stay in the recorders and report LedgerError codes.
//
// The to_json/from_json pairs live in the namespace of the type they convert
// so nlohmann's ADL lookup finds them.
// -----------------------------------------------------------------------------

namespace tradeledger {
namespace domain {

// Enums: encode to their canonical name; decoding anything else throws
// LedgerError(InvalidEnumName).
void to_json(nlohmann::json& j, const ProductType& v);
void from_json(const nlohmann::json& j, ProductType& v);
void to_json(nlohmann::json& j, const TradeState& v);
void from_json(const nlohmann::json& j, TradeState& v);
void to_json(nlohmann::json& j, const EventType& v);
void from_json(const nlohmann::json& j, EventType& v);
void to_json(nlohmann::json& j, const EventStatus& v);
void from_json(const nlohmann::json& j, EventStatus& v);
void to_json(nlohmann::json& j, const ConfirmationMethod& v);
void from_json(const nlohmann::json& j, ConfirmationMethod& v);
void to_json(nlohmann::json& j, const AveragingMethod& v);
void from_json(const nlohmann::json& j, AveragingMethod& v);
void to_json(nlohmann::json& j, const TransferType& v);
void from_json(const nlohmann::json& j, TransferType& v);
void to_json(nlohmann::json& j, const TransferDirection& v);
void from_json(const nlohmann::json& j, TransferDirection& v);
void to_json(nlohmann::json& j, const SettlementStatus& v);
void from_json(const nlohmann::json& j, SettlementStatus& v);
void to_json(nlohmann::json& j, const TerminationType& v);
void from_json(const nlohmann::json& j, TerminationType& v);
void to_json(nlohmann::json& j, const PaymentMethod& v);
void from_json(const nlohmann::json& j, PaymentMethod& v);
void to_json(nlohmann::json& j, const TerminationStatus& v);
void from_json(const nlohmann::json& j, TerminationStatus& v);

void to_json(nlohmann::json& j, const Validity& v);
void from_json(const nlohmann::json& j, Validity& v);

void to_json(nlohmann::json& j, const TradeStateSnapshot& s);
void from_json(const nlohmann::json& j, TradeStateSnapshot& s);

void to_json(nlohmann::json& j, const StateTransition& t);
void from_json(const nlohmann::json& j, StateTransition& t);

void to_json(nlohmann::json& j, const EventRecord& r);
void from_json(const nlohmann::json& j, EventRecord& r);

void to_json(nlohmann::json& j, const ExecutionDetails& d);
void from_json(const nlohmann::json& j, ExecutionDetails& d);
void to_json(nlohmann::json& j, const EconomicTerms& t);
void from_json(const nlohmann::json& j, EconomicTerms& t);
void to_json(nlohmann::json& j, const ExecutionEventData& e);
void from_json(const nlohmann::json& j, ExecutionEventData& e);

void to_json(nlohmann::json& j, const RateObservation& o);
void from_json(const nlohmann::json& j, RateObservation& o);
void to_json(nlohmann::json& j, const ResetCalculation& c);
void from_json(const nlohmann::json& j, ResetCalculation& c);
void to_json(nlohmann::json& j, const AveragingData& a);
void from_json(const nlohmann::json& j, AveragingData& a);
void to_json(nlohmann::json& j, const ResetEventData& r);
void from_json(const nlohmann::json& j, ResetEventData& r);

void to_json(nlohmann::json& j, const PaymentDetails& p);
void from_json(const nlohmann::json& j, PaymentDetails& p);
void to_json(nlohmann::json& j, const TransferParties& p);
void from_json(const nlohmann::json& j, TransferParties& p);
void to_json(nlohmann::json& j, const SettlementInfo& s);
void from_json(const nlohmann::json& j, SettlementInfo& s);
void to_json(nlohmann::json& j, const TransferEventData& t);
void from_json(const nlohmann::json& j, TransferEventData& t);

void to_json(nlohmann::json& j, const TerminationDetails& d);
void from_json(const nlohmann::json& j, TerminationDetails& d);
void to_json(nlohmann::json& j, const TerminationPayment& p);
void from_json(const nlohmann::json& j, TerminationPayment& p);
void to_json(nlohmann::json& j, const TerminationEventData& t);
void from_json(const nlohmann::json& j, TerminationEventData& t);

}  // namespace domain

// Recorder requests, decoded from IPC commands.
void to_json(nlohmann::json& j, const ExecutionRequest& r);
void from_json(const nlohmann::json& j, ExecutionRequest& r);
void to_json(nlohmann::json& j, const ResetRequest& r);
void from_json(const nlohmann::json& j, ResetRequest& r);
void to_json(nlohmann::json& j, const TransferRequest& r);
void from_json(const nlohmann::json& j, TransferRequest& r);
void to_json(nlohmann::json& j, const TerminationRequest& r);
void from_json(const nlohmann::json& j, TerminationRequest& r);

// -----------------------------------------------------------------------------
// updateToJson(update)
// -----------------------------------------------------------------------------
// Telemetry form of a committed LedgerUpdate: an object with a "type"
// discriminator ("trade_state", "event_record", "transfer_status",
// "termination_status", "verification") plus "sequence_id" and the
// alternative's own fields.
// -----------------------------------------------------------------------------
nlohmann::json updateToJson(const LedgerUpdate& update);

// {"status":"error","error":<code>,"kind":<kind>,"message":<detail>}
nlohmann::json errorToJson(const LedgerError& error);

}  // namespace tradeledger
