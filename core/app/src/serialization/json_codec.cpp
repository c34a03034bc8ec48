#include "tradeledger/serialization/json_codec.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace tradeledger {

using nlohmann::json;

namespace {

// Assigns j[key] to out when the key is present and not null; otherwise the
// member keeps its default.
template <typename T>
void readField(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

template <typename T>
void readOptional(const json& j, const char* key, std::optional<T>& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    out.reset();
  } else {
    out = it->get<T>();
  }
}

template <typename T>
void writeOptional(json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

// Finds the value whose canonical name equals the JSON string. Anything else,
// including a non-string, is an InvalidEnumName.
template <typename E, std::size_t N>
void enumFromJson(const json& j, E& out, const E (&values)[N],
                  const char* (*name)(E), const char* type_name) {
  if (j.is_string()) {
    const auto& text = j.get_ref<const std::string&>();
    for (E candidate : values) {
      if (text == name(candidate)) {
        out = candidate;
        return;
      }
    }
  }
  throw LedgerError(ErrorCode::InvalidEnumName,
                    std::string(type_name) + " has no value " + j.dump());
}

}  // namespace

namespace domain {

// ----- Enums -----

void to_json(json& j, const ProductType& v) { j = productTypeName(v); }

void from_json(const json& j, ProductType& v) {
  static const ProductType kValues[] = {
      ProductType::Unspecified, ProductType::InterestRateSwap,
      ProductType::CrossCurrencySwap, ProductType::BasisSwap,
      ProductType::ForwardRateAgreement, ProductType::FxForward,
      ProductType::FxSwap, ProductType::CreditDefaultSwap,
      ProductType::EquitySwap, ProductType::Swaption};
  enumFromJson(j, v, kValues, productTypeName, "ProductType");
}

void to_json(json& j, const TradeState& v) { j = tradeStateName(v); }

void from_json(const json& j, TradeState& v) {
  static const TradeState kValues[] = {
      TradeState::Created, TradeState::Pending, TradeState::Confirmed,
      TradeState::Active, TradeState::Matured, TradeState::Terminated,
      TradeState::Settled};
  enumFromJson(j, v, kValues, tradeStateName, "TradeState");
}

void to_json(json& j, const EventType& v) { j = eventTypeName(v); }

void from_json(const json& j, EventType& v) {
  static const EventType kValues[] = {
      EventType::Execution, EventType::Reset, EventType::Transfer,
      EventType::Termination};
  enumFromJson(j, v, kValues, eventTypeName, "EventType");
}

void to_json(json& j, const EventStatus& v) { j = eventStatusName(v); }

void from_json(const json& j, EventStatus& v) {
  static const EventStatus kValues[] = {
      EventStatus::Pending, EventStatus::Processed, EventStatus::Failed};
  enumFromJson(j, v, kValues, eventStatusName, "EventStatus");
}

void to_json(json& j, const ConfirmationMethod& v) {
  j = confirmationMethodName(v);
}

void from_json(const json& j, ConfirmationMethod& v) {
  static const ConfirmationMethod kValues[] = {
      ConfirmationMethod::Electronic, ConfirmationMethod::Manual,
      ConfirmationMethod::Voice};
  enumFromJson(j, v, kValues, confirmationMethodName, "ConfirmationMethod");
}

void to_json(json& j, const AveragingMethod& v) { j = averagingMethodName(v); }

void from_json(const json& j, AveragingMethod& v) {
  static const AveragingMethod kValues[] = {
      AveragingMethod::None, AveragingMethod::Simple, AveragingMethod::Weighted,
      AveragingMethod::Compounded};
  enumFromJson(j, v, kValues, averagingMethodName, "AveragingMethod");
}

void to_json(json& j, const TransferType& v) { j = transferTypeName(v); }

void from_json(const json& j, TransferType& v) {
  static const TransferType kValues[] = {
      TransferType::Coupon, TransferType::Fee, TransferType::Principal,
      TransferType::Collateral, TransferType::TerminationPayment};
  enumFromJson(j, v, kValues, transferTypeName, "TransferType");
}

void to_json(json& j, const TransferDirection& v) {
  j = transferDirectionName(v);
}

void from_json(const json& j, TransferDirection& v) {
  static const TransferDirection kValues[] = {
      TransferDirection::Pay, TransferDirection::Receive};
  enumFromJson(j, v, kValues, transferDirectionName, "TransferDirection");
}

void to_json(json& j, const SettlementStatus& v) {
  j = settlementStatusName(v);
}

void from_json(const json& j, SettlementStatus& v) {
  static const SettlementStatus kValues[] = {
      SettlementStatus::Pending, SettlementStatus::Initiated,
      SettlementStatus::Settled, SettlementStatus::Failed,
      SettlementStatus::Cancelled};
  enumFromJson(j, v, kValues, settlementStatusName, "SettlementStatus");
}

void to_json(json& j, const TerminationType& v) { j = terminationTypeName(v); }

void from_json(const json& j, TerminationType& v) {
  static const TerminationType kValues[] = {
      TerminationType::MutualAgreement, TerminationType::Unilateral,
      TerminationType::EventOfDefault, TerminationType::TerminationEvent,
      TerminationType::Novation};
  enumFromJson(j, v, kValues, terminationTypeName, "TerminationType");
}

void to_json(json& j, const PaymentMethod& v) { j = paymentMethodName(v); }

void from_json(const json& j, PaymentMethod& v) {
  static const PaymentMethod kValues[] = {
      PaymentMethod::Zero, PaymentMethod::MarkToMarket,
      PaymentMethod::AgreedAmount, PaymentMethod::ReplacementCost};
  enumFromJson(j, v, kValues, paymentMethodName, "PaymentMethod");
}

void to_json(json& j, const TerminationStatus& v) {
  j = terminationStatusName(v);
}

void from_json(const json& j, TerminationStatus& v) {
  static const TerminationStatus kValues[] = {
      TerminationStatus::Pending, TerminationStatus::Confirmed,
      TerminationStatus::Settled, TerminationStatus::Disputed};
  enumFromJson(j, v, kValues, terminationStatusName, "TerminationStatus");
}

// ----- Identity and state -----

void to_json(json& j, const Validity& v) {
  j = json{{"valid_from", v.valid_from}};
  writeOptional(j, "valid_to", v.valid_to);
}

void from_json(const json& j, Validity& v) {
  readField(j, "valid_from", v.valid_from);
  readOptional(j, "valid_to", v.valid_to);
}

void to_json(json& j, const TradeStateSnapshot& s) {
  j = json{{"snapshot_id", s.snapshot_id},
           {"trade_id", s.trade_id},
           {"state", s.state},
           {"product_type", s.product_type},
           {"timestamp", s.timestamp},
           {"causing_event_id", s.causing_event_id},
           {"previous_snapshot_id", s.previous_snapshot_id},
           {"parties", s.parties},
           {"effective_date", s.effective_date},
           {"maturity_date", s.maturity_date}};
}

void from_json(const json& j, TradeStateSnapshot& s) {
  readField(j, "snapshot_id", s.snapshot_id);
  readField(j, "trade_id", s.trade_id);
  readField(j, "state", s.state);
  readField(j, "product_type", s.product_type);
  readField(j, "timestamp", s.timestamp);
  readField(j, "causing_event_id", s.causing_event_id);
  readField(j, "previous_snapshot_id", s.previous_snapshot_id);
  readField(j, "parties", s.parties);
  readField(j, "effective_date", s.effective_date);
  readField(j, "maturity_date", s.maturity_date);
}

void to_json(json& j, const StateTransition& t) {
  j = json{{"transition_id", t.transition_id},
           {"trade_id", t.trade_id},
           {"from_state", t.from_state},
           {"to_state", t.to_state},
           {"event_id", t.event_id},
           {"timestamp", t.timestamp},
           {"initiator", t.initiator},
           {"validity", t.validity}};
}

void from_json(const json& j, StateTransition& t) {
  readField(j, "transition_id", t.transition_id);
  readField(j, "trade_id", t.trade_id);
  readField(j, "from_state", t.from_state);
  readField(j, "to_state", t.to_state);
  readField(j, "event_id", t.event_id);
  readField(j, "timestamp", t.timestamp);
  readField(j, "initiator", t.initiator);
  readField(j, "validity", t.validity);
}

void to_json(json& j, const EventRecord& r) {
  j = json{{"event_id", r.event_id},
           {"event_type", r.event_type},
           {"status", r.status},
           {"timestamp", r.timestamp},
           {"effective_date", r.effective_date},
           {"trade_id", r.trade_id},
           {"involved_parties", r.involved_parties},
           {"initiator", r.initiator},
           {"before_state_id", r.before_state_id},
           {"after_state_id", r.after_state_id},
           {"previous_event_id", r.previous_event_id},
           {"validity", r.validity},
           {"message", r.message}};
}

void from_json(const json& j, EventRecord& r) {
  readField(j, "event_id", r.event_id);
  readField(j, "event_type", r.event_type);
  readField(j, "status", r.status);
  readField(j, "timestamp", r.timestamp);
  readField(j, "effective_date", r.effective_date);
  readField(j, "trade_id", r.trade_id);
  readField(j, "involved_parties", r.involved_parties);
  readField(j, "initiator", r.initiator);
  readField(j, "before_state_id", r.before_state_id);
  readField(j, "after_state_id", r.after_state_id);
  readField(j, "previous_event_id", r.previous_event_id);
  readField(j, "validity", r.validity);
  readField(j, "message", r.message);
}

// ----- Execution -----

void to_json(json& j, const ExecutionDetails& d) {
  j = json{{"venue", d.venue},
           {"price", d.price},
           {"confirmation_method", d.confirmation_method},
           {"timestamp", d.timestamp}};
}

void from_json(const json& j, ExecutionDetails& d) {
  readField(j, "venue", d.venue);
  readField(j, "price", d.price);
  readField(j, "confirmation_method", d.confirmation_method);
  readField(j, "timestamp", d.timestamp);
}

void to_json(json& j, const EconomicTerms& t) {
  j = json{{"notional", t.notional},
           {"currency", t.currency},
           {"effective_date", t.effective_date},
           {"maturity_date", t.maturity_date}};
}

void from_json(const json& j, EconomicTerms& t) {
  readField(j, "notional", t.notional);
  readField(j, "currency", t.currency);
  readField(j, "effective_date", t.effective_date);
  readField(j, "maturity_date", t.maturity_date);
}

void to_json(json& j, const ExecutionEventData& e) {
  j = json{{"event_id", e.event_id},
           {"trade_id", e.trade_id},
           {"details", e.details},
           {"terms", e.terms},
           {"buyer", e.buyer},
           {"seller", e.seller},
           {"trade_date", e.trade_date}};
  writeOptional(j, "broker", e.broker);
}

void from_json(const json& j, ExecutionEventData& e) {
  readField(j, "event_id", e.event_id);
  readField(j, "trade_id", e.trade_id);
  readField(j, "details", e.details);
  readField(j, "terms", e.terms);
  readField(j, "buyer", e.buyer);
  readField(j, "seller", e.seller);
  readOptional(j, "broker", e.broker);
  readField(j, "trade_date", e.trade_date);
}

// ----- Reset -----

void to_json(json& j, const RateObservation& o) {
  j = json{{"rate_index", o.rate_index},
           {"source", o.source},
           {"observation_date", o.observation_date},
           {"observed_rate", o.observed_rate}};
}

void from_json(const json& j, RateObservation& o) {
  readField(j, "rate_index", o.rate_index);
  readField(j, "source", o.source);
  readField(j, "observation_date", o.observation_date);
  readField(j, "observed_rate", o.observed_rate);
}

void to_json(json& j, const ResetCalculation& c) {
  j = json{{"period_start", c.period_start},
           {"period_end", c.period_end},
           {"notional", c.notional},
           {"day_count_fraction", c.day_count_fraction},
           {"accrual_amount", c.accrual_amount}};
}

void from_json(const json& j, ResetCalculation& c) {
  readField(j, "period_start", c.period_start);
  readField(j, "period_end", c.period_end);
  readField(j, "notional", c.notional);
  readField(j, "day_count_fraction", c.day_count_fraction);
  readField(j, "accrual_amount", c.accrual_amount);
}

void to_json(json& j, const AveragingData& a) {
  j = json{{"method", a.method},
           {"observations", a.observations},
           {"compounding_periods", a.compounding_periods},
           {"final_rate", a.final_rate}};
  writeOptional(j, "weights", a.weights);
}

void from_json(const json& j, AveragingData& a) {
  readField(j, "method", a.method);
  readField(j, "observations", a.observations);
  readOptional(j, "weights", a.weights);
  readField(j, "compounding_periods", a.compounding_periods);
  readField(j, "final_rate", a.final_rate);
}

void to_json(json& j, const ResetEventData& r) {
  j = json{{"event_id", r.event_id},
           {"trade_id", r.trade_id},
           {"payout_reference", r.payout_reference},
           {"reset_number", r.reset_number},
           {"observation", r.observation},
           {"calculation", r.calculation},
           {"previous_reset_event_id", r.previous_reset_event_id},
           {"rate_verified", r.rate_verified},
           {"verified_by", r.verified_by},
           {"verified_at", r.verified_at}};
  writeOptional(j, "averaging", r.averaging);
}

void from_json(const json& j, ResetEventData& r) {
  readField(j, "event_id", r.event_id);
  readField(j, "trade_id", r.trade_id);
  readField(j, "payout_reference", r.payout_reference);
  readField(j, "reset_number", r.reset_number);
  readField(j, "observation", r.observation);
  readField(j, "calculation", r.calculation);
  readOptional(j, "averaging", r.averaging);
  readField(j, "previous_reset_event_id", r.previous_reset_event_id);
  readField(j, "rate_verified", r.rate_verified);
  readField(j, "verified_by", r.verified_by);
  readField(j, "verified_at", r.verified_at);
}

// ----- Transfer -----

void to_json(json& j, const PaymentDetails& p) {
  j = json{{"gross_amount", p.gross_amount},
           {"net_amount", p.net_amount},
           {"currency", p.currency},
           {"direction", p.direction},
           {"value_date", p.value_date}};
  writeOptional(j, "payment_reference", p.payment_reference);
}

void from_json(const json& j, PaymentDetails& p) {
  readField(j, "gross_amount", p.gross_amount);
  readField(j, "net_amount", p.net_amount);
  readField(j, "currency", p.currency);
  readField(j, "direction", p.direction);
  readField(j, "value_date", p.value_date);
  readOptional(j, "payment_reference", p.payment_reference);
  if (p.payment_reference && p.payment_reference->empty()) {
    p.payment_reference.reset();
  }
}

void to_json(json& j, const TransferParties& p) {
  j = json{{"payer", p.payer}, {"receiver", p.receiver}};
}

void from_json(const json& j, TransferParties& p) {
  readField(j, "payer", p.payer);
  readField(j, "receiver", p.receiver);
}

void to_json(json& j, const SettlementInfo& s) {
  j = json{{"status", s.status},
           {"settlement_date", s.settlement_date},
           {"settlement_reference", s.settlement_reference},
           {"failure_reason", s.failure_reason},
           {"last_updated", s.last_updated}};
}

void from_json(const json& j, SettlementInfo& s) {
  readField(j, "status", s.status);
  readField(j, "settlement_date", s.settlement_date);
  readField(j, "settlement_reference", s.settlement_reference);
  readField(j, "failure_reason", s.failure_reason);
  readField(j, "last_updated", s.last_updated);
}

void to_json(json& j, const TransferEventData& t) {
  j = json{{"event_id", t.event_id},
           {"trade_id", t.trade_id},
           {"transfer_type", t.transfer_type},
           {"sequence_number", t.sequence_number},
           {"payment", t.payment},
           {"parties", t.parties},
           {"settlement", t.settlement},
           {"previous_transfer_event_id", t.previous_transfer_event_id},
           {"verified", t.verified},
           {"verified_by", t.verified_by},
           {"verified_at", t.verified_at}};
}

void from_json(const json& j, TransferEventData& t) {
  readField(j, "event_id", t.event_id);
  readField(j, "trade_id", t.trade_id);
  readField(j, "transfer_type", t.transfer_type);
  readField(j, "sequence_number", t.sequence_number);
  readField(j, "payment", t.payment);
  readField(j, "parties", t.parties);
  readField(j, "settlement", t.settlement);
  readField(j, "previous_transfer_event_id", t.previous_transfer_event_id);
  readField(j, "verified", t.verified);
  readField(j, "verified_by", t.verified_by);
  readField(j, "verified_at", t.verified_at);
}

// ----- Termination -----

void to_json(json& j, const TerminationDetails& d) {
  j = json{{"type", d.type},
           {"termination_date", d.termination_date},
           {"notification_date", d.notification_date},
           {"reason", d.reason}};
}

void from_json(const json& j, TerminationDetails& d) {
  readField(j, "type", d.type);
  readField(j, "termination_date", d.termination_date);
  readField(j, "notification_date", d.notification_date);
  readField(j, "reason", d.reason);
}

void to_json(json& j, const TerminationPayment& p) {
  j = json{{"method", p.method},
           {"value", p.value},
           {"currency", p.currency},
           {"payer", p.payer},
           {"receiver", p.receiver},
           {"is_disputed", p.is_disputed}};
}

void from_json(const json& j, TerminationPayment& p) {
  readField(j, "method", p.method);
  readField(j, "value", p.value);
  readField(j, "currency", p.currency);
  readField(j, "payer", p.payer);
  readField(j, "receiver", p.receiver);
  readField(j, "is_disputed", p.is_disputed);
}

void to_json(json& j, const TerminationEventData& t) {
  j = json{{"event_id", t.event_id},
           {"trade_id", t.trade_id},
           {"details", t.details},
           {"payment", t.payment},
           {"status", t.status},
           {"settlement_transfer_event_id", t.settlement_transfer_event_id},
           {"disputed_by", t.disputed_by},
           {"dispute_reason", t.dispute_reason},
           {"last_updated", t.last_updated}};
}

void from_json(const json& j, TerminationEventData& t) {
  readField(j, "event_id", t.event_id);
  readField(j, "trade_id", t.trade_id);
  readField(j, "details", t.details);
  readField(j, "payment", t.payment);
  readField(j, "status", t.status);
  readField(j, "settlement_transfer_event_id", t.settlement_transfer_event_id);
  readField(j, "disputed_by", t.disputed_by);
  readField(j, "dispute_reason", t.dispute_reason);
  readField(j, "last_updated", t.last_updated);
}

}  // namespace domain

// ----- Requests -----

void to_json(json& j, const ExecutionRequest& r) {
  j = json{{"event_id", r.event_id},
           {"trade_id", r.trade_id},
           {"details", r.details},
           {"terms", r.terms},
           {"buyer", r.buyer},
           {"seller", r.seller},
           {"trade_date", r.trade_date}};
  writeOptional(j, "broker", r.broker);
}

void from_json(const json& j, ExecutionRequest& r) {
  readField(j, "event_id", r.event_id);
  readField(j, "trade_id", r.trade_id);
  readField(j, "details", r.details);
  readField(j, "terms", r.terms);
  readField(j, "buyer", r.buyer);
  readField(j, "seller", r.seller);
  readOptional(j, "broker", r.broker);
  readField(j, "trade_date", r.trade_date);
}

void to_json(json& j, const ResetRequest& r) {
  j = json{{"event_id", r.event_id},
           {"trade_id", r.trade_id},
           {"payout_reference", r.payout_reference},
           {"reset_number", r.reset_number},
           {"observation", r.observation},
           {"calculation", r.calculation},
           {"initiator", r.initiator}};
  writeOptional(j, "averaging", r.averaging);
}

void from_json(const json& j, ResetRequest& r) {
  readField(j, "event_id", r.event_id);
  readField(j, "trade_id", r.trade_id);
  readField(j, "payout_reference", r.payout_reference);
  readField(j, "reset_number", r.reset_number);
  readField(j, "observation", r.observation);
  readField(j, "calculation", r.calculation);
  readField(j, "initiator", r.initiator);
  readOptional(j, "averaging", r.averaging);
}

void to_json(json& j, const TransferRequest& r) {
  j = json{{"event_id", r.event_id},
           {"trade_id", r.trade_id},
           {"transfer_type", r.transfer_type},
           {"payment", r.payment},
           {"parties", r.parties},
           {"initiator", r.initiator}};
}

void from_json(const json& j, TransferRequest& r) {
  readField(j, "event_id", r.event_id);
  readField(j, "trade_id", r.trade_id);
  readField(j, "transfer_type", r.transfer_type);
  readField(j, "payment", r.payment);
  readField(j, "parties", r.parties);
  readField(j, "initiator", r.initiator);
}

void to_json(json& j, const TerminationRequest& r) {
  j = json{{"event_id", r.event_id},
           {"trade_id", r.trade_id},
           {"details", r.details},
           {"payment", r.payment},
           {"initiator", r.initiator}};
}

void from_json(const json& j, TerminationRequest& r) {
  readField(j, "event_id", r.event_id);
  readField(j, "trade_id", r.trade_id);
  readField(j, "details", r.details);
  readField(j, "payment", r.payment);
  readField(j, "initiator", r.initiator);
}

// ----- Updates and errors -----

namespace {

json formatUpdate(const TradeStateUpdate& u) {
  json j{{"type", "trade_state"}, {"snapshot", u.snapshot}};
  if (u.previous_state) {
    j["previous_state"] = *u.previous_state;
  } else {
    j["previous_state"] = nullptr;
  }
  return j;
}

json formatUpdate(const EventRecordUpdate& u) {
  return json{{"type", "event_record"}, {"record", u.record}};
}

json formatUpdate(const TransferStatusUpdate& u) {
  return json{{"type", "transfer_status"},
              {"event_id", u.event_id},
              {"trade_id", u.trade_id},
              {"previous_status", u.previous_status},
              {"status", u.status}};
}

json formatUpdate(const TerminationStatusUpdate& u) {
  return json{{"type", "termination_status"},
              {"event_id", u.event_id},
              {"trade_id", u.trade_id},
              {"previous_status", u.previous_status},
              {"status", u.status}};
}

json formatUpdate(const VerificationUpdate& u) {
  return json{{"type", "verification"},
              {"event_id", u.event_id},
              {"trade_id", u.trade_id},
              {"event_type", u.event_type},
              {"verifier", u.verifier},
              {"verified_at", u.verified_at}};
}

}  // namespace

json updateToJson(const LedgerUpdate& update) {
  return std::visit(
      [](const auto& u) {
        json j = formatUpdate(u);
        j["sequence_id"] = u.sequence_id;
        return j;
      },
      update);
}

json errorToJson(const LedgerError& error) {
  return json{{"status", "error"},
              {"error", errorCodeName(error.code())},
              {"kind", errorKindName(error.kind())},
              {"message", error.detail()}};
}

}  // namespace tradeledger
