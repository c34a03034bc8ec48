#include "tradeledger/recorders/reset_recorder.hpp"

#include "tradeledger/domain/ledger_error.hpp"

#include <string>

namespace tradeledger {

ResetRecorder::ResetRecorder(StateStore& states, EventLedger& events,
                             const ITimeProvider& clock)
    : states_(states), events_(events), clock_(clock) {}

// -----------------------------------------------------------------------------
// recordReset: validate, store payload linked to the prior period, store and
// immediately process the envelope
// -----------------------------------------------------------------------------
domain::EventRecord ResetRecorder::recordReset(const ResetRequest& request,
                                               LedgerTransaction& txn) {
  // Resets involve the trade's counterparties; the initiator alone stands in
  // when the trade is unknown so validateBasics reports TradeNotFound.
  domain::PartyList parties =
      states_.exists(request.trade_id)
          ? states_.currentSnapshot(request.trade_id).parties
          : domain::PartyList{request.initiator};

  validate(request, parties);

  domain::ResetEventData data;
  data.event_id = request.event_id;
  data.trade_id = request.trade_id;
  data.payout_reference = request.payout_reference;
  data.reset_number = request.reset_number;
  data.observation = request.observation;
  data.calculation = request.calculation;
  data.averaging = request.averaging;

  auto& numbers = by_number_[request.trade_id];
  if (request.reset_number > 1) {
    auto prior = numbers.find(request.reset_number - 1);
    if (prior != numbers.end()) {
      data.previous_reset_event_id = prior->second;
    }
  }

  by_event_.emplace(request.event_id, data);
  numbers.emplace(request.reset_number, request.event_id);
  order_[request.trade_id].push_back(request.event_id);
  txn.onRollback([this, trade_id = request.trade_id,
                  event_id = request.event_id,
                  number = request.reset_number] {
    auto ordered = order_.find(trade_id);
    ordered->second.pop_back();
    if (ordered->second.empty()) {
      order_.erase(ordered);
    }
    auto numbered = by_number_.find(trade_id);
    numbered->second.erase(number);
    if (numbered->second.empty()) {
      by_number_.erase(numbered);
    }
    by_event_.erase(event_id);
  });

  const domain::SnapshotId current =
      states_.currentSnapshot(request.trade_id).snapshot_id;

  events_.store(events_.draft(request.event_id, domain::EventType::Reset,
                              request.trade_id,
                              request.observation.observation_date,
                              std::move(parties), request.initiator, current),
                &txn);

  return events_.markProcessed(request.event_id, current, &txn);
}

// -----------------------------------------------------------------------------
// validate: every precondition, no side effects
// -----------------------------------------------------------------------------
void ResetRecorder::validate(const ResetRequest& request,
                             const domain::PartyList& parties) const {
  if (request.reset_number == 0) {
    throw LedgerError(ErrorCode::InvalidResetNumber,
                      "reset number must be non-zero");
  }

  events_.validateBasics(request.event_id, request.trade_id,
                         request.observation.observation_date, parties);
  if (request.initiator.empty()) {
    throw LedgerError(ErrorCode::InvalidParties, "reset initiator is empty");
  }

  auto numbers = by_number_.find(request.trade_id);
  if (numbers != by_number_.end() &&
      numbers->second.count(request.reset_number) != 0) {
    throw LedgerError(ErrorCode::ResetAlreadyExists,
                      "reset " + std::to_string(request.reset_number) +
                          " already recorded for trade " + request.trade_id);
  }

  const domain::TradeState state = states_.currentState(request.trade_id);
  if (state != domain::TradeState::Active) {
    throw LedgerError(ErrorCode::TradeNotActive,
                      "trade " + request.trade_id + " is " +
                          domain::tradeStateName(state) +
                          ", resets require ACTIVE");
  }

  const domain::EpochMillis observed = request.observation.observation_date;
  if (observed == 0 || observed > clock_.now_ms()) {
    throw LedgerError(ErrorCode::InvalidObservationDate,
                      "observation date is unset or in the future");
  }

  if (request.calculation.period_end <= request.calculation.period_start) {
    throw LedgerError(ErrorCode::InvalidPeriodDates,
                      "calculation period end must follow its start");
  }

  if (!(request.calculation.notional > 0.0)) {
    throw LedgerError(ErrorCode::InvalidNotional, "notional must be positive");
  }

  validateAveraging(request);
}

void ResetRecorder::validateAveraging(const ResetRequest& request) {
  if (!request.averaging) {
    return;
  }
  const domain::AveragingData& avg = *request.averaging;

  // Exact comparison: both values come from the same external calculator
  // run and are stored verbatim.
  if (avg.final_rate != request.observation.observed_rate) {
    throw LedgerError(ErrorCode::InvalidAveragingData,
                      "averaged rate differs from the observed rate");
  }
  if (avg.method != domain::AveragingMethod::None &&
      avg.observations.empty()) {
    throw LedgerError(ErrorCode::InvalidAveragingData,
                      std::string(domain::averagingMethodName(avg.method)) +
                          " averaging needs raw observations");
  }
  if (avg.method == domain::AveragingMethod::Weighted &&
      (!avg.weights || avg.weights->size() != avg.observations.size())) {
    throw LedgerError(ErrorCode::InvalidAveragingData,
                      "weighted averaging needs one weight per observation");
  }
}

// -----------------------------------------------------------------------------
// verifyRate: independent confirmation flag
// -----------------------------------------------------------------------------
domain::ResetEventData ResetRecorder::verifyRate(
    const domain::EventId& event_id, const domain::PartyId& verifier,
    LedgerTransaction& txn) {
  auto it = by_event_.find(event_id);
  if (it == by_event_.end()) {
    throw LedgerError(ErrorCode::ResetNotFound,
                      "no reset recorded under event " + event_id);
  }
  if (verifier.empty()) {
    throw LedgerError(ErrorCode::InvalidParties, "verifier is empty");
  }

  domain::ResetEventData& data = it->second;
  domain::ResetEventData before = data;

  data.rate_verified = true;
  data.verified_by = verifier;
  data.verified_at = clock_.now_ms();

  txn.onRollback([this, before] { by_event_[before.event_id] = before; });

  VerificationUpdate update;
  update.event_id = event_id;
  update.trade_id = data.trade_id;
  update.event_type = domain::EventType::Reset;
  update.verifier = verifier;
  update.verified_at = data.verified_at;
  txn.enqueue(std::move(update));

  return data;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::ResetEventData> ResetRecorder::findByEvent(
    const domain::EventId& event_id) const {
  auto it = by_event_.find(event_id);
  if (it == by_event_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::ResetEventData> ResetRecorder::resetByNumber(
    const domain::TradeId& trade_id, std::uint32_t reset_number) const {
  auto numbers = by_number_.find(trade_id);
  if (numbers == by_number_.end()) {
    return std::nullopt;
  }
  auto it = numbers->second.find(reset_number);
  if (it == numbers->second.end()) {
    return std::nullopt;
  }
  return by_event_.at(it->second);
}

std::vector<domain::ResetEventData> ResetRecorder::resetsForTrade(
    const domain::TradeId& trade_id) const {
  std::vector<domain::ResetEventData> resets;
  auto it = order_.find(trade_id);
  if (it == order_.end()) {
    return resets;
  }
  resets.reserve(it->second.size());
  for (const domain::EventId& id : it->second) {
    resets.push_back(by_event_.at(id));
  }
  return resets;
}

std::size_t ResetRecorder::resetCount(const domain::TradeId& trade_id) const {
  auto it = order_.find(trade_id);
  return it == order_.end() ? 0 : it->second.size();
}

std::optional<domain::ResetEventData> ResetRecorder::latestReset(
    const domain::TradeId& trade_id) const {
  auto it = order_.find(trade_id);
  if (it == order_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return by_event_.at(it->second.back());
}

}  // namespace tradeledger
