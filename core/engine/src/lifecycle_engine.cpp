#include "tradeledger/engine/lifecycle_engine.hpp"

#include "tradeledger/domain/ledger_error.hpp"
#include "tradeledger/serialization/json_codec.hpp"
#include "tradeledger/store/ledger_transaction.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace tradeledger {

namespace {

using nlohmann::json;

json ok() { return json{{"status", "ok"}}; }

std::string requiredString(const json& request, const char* key) {
  return request.at(key).get<std::string>();
}

json statusToJson(const TradeStatus& status) {
  return json{{"snapshot", status.current},
              {"state", status.current.state},
              {"transitions", status.transitions},
              {"age_ms", status.age_ms},
              {"age_days", status.age_days},
              {"time_to_maturity_ms", status.time_to_maturity_ms},
              {"effective_date_reached", status.effective_date_reached},
              {"maturity_reached", status.maturity_reached},
              {"executed", status.executed},
              {"terminated", status.terminated}};
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

json auditToJson(const AuditTrail& trail) {
  return json{{"trade_id", trail.trade_id},
              {"snapshots", trail.snapshots},
              {"transitions", trail.transitions},
              {"events", trail.events},
              {"execution", optionalToJson(trail.execution)},
              {"resets", trail.resets},
              {"transfers", trail.transfers},
              {"termination", optionalToJson(trail.termination)}};
}

// Clears the delivery flag even if a subscriber throws.
struct DeliveryGuard {
  std::atomic<bool>& flag;
  ~DeliveryGuard() { flag.store(false); }
};

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
LifecycleEngine::LifecycleEngine(const ITimeProvider& clock,
                                 std::string ipc_cmd_endpoint,
                                 std::string ipc_pub_endpoint)
    : clock_(clock),
      ipc_cmd_endpoint_(std::move(ipc_cmd_endpoint)),
      ipc_pub_endpoint_(std::move(ipc_pub_endpoint)),
      states_(clock),
      events_(states_, clock),
      executions_(states_, events_),
      resets_(states_, events_, clock),
      transfers_(states_, events_, clock),
      terminations_(states_, events_, transfers_, clock) {}

LifecycleEngine::~LifecycleEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(): bring up IPC and bridge committed updates to its PUB socket
// -----------------------------------------------------------------------------
void LifecycleEngine::start() {
  if (running_) {
    return;
  }

  if (!ipc_cmd_endpoint_.empty() && !ipc_pub_endpoint_.empty()) {
    ipc_server_ = std::make_shared<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        ipc_cmd_endpoint_, ipc_pub_endpoint_);
    ipc_server_->start();

    // The bridge shares ownership: a writer that copied the subscriber list
    // before stop() may still publish into the server afterwards.
    std::shared_ptr<IpcServer> server = ipc_server_;
    ipc_subscription_ = event_bus_.subscribe(
        [server](const LedgerUpdate& update) {
          server->publishUpdate(update);
        });
  }

  running_ = true;

  std::cout << "[LifecycleEngine] started"
            << (ipc_server_ ? " with IPC" : " without IPC") << ".\n";
}

// -----------------------------------------------------------------------------
// stop(): detach the update bridge before the server goes away
// -----------------------------------------------------------------------------
void LifecycleEngine::stop() {
  if (!running_) {
    return;
  }

  if (ipc_server_) {
    event_bus_.unsubscribe(ipc_subscription_);
    ipc_server_->stop();
    ipc_server_.reset();
  }

  running_ = false;

  std::cout << "[LifecycleEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// write(): one exclusive, all-or-nothing unit followed by delivery
// -----------------------------------------------------------------------------
template <typename Operation>
auto LifecycleEngine::write(const char* name, Operation&& operation) {
  std::unique_lock lock(mutex_);
  LedgerTransaction txn;

  auto result = [&] {
    try {
      return operation(txn);
    } catch (const LedgerError& e) {
      std::cerr << "[LifecycleEngine] " << name << " rejected: " << e.what()
                << "\n";
      throw;
    }
  }();

  txn.commit();
  for (LedgerUpdate& update : txn.takeUpdates()) {
    stampSequence(update, ++last_sequence_id_);
    pending_.push(std::move(update));
  }

  lock.unlock();
  deliverPending();
  return result;
}

template <typename Query>
auto LifecycleEngine::query(Query&& q) const {
  std::shared_lock lock(mutex_);
  return q();
}

// -----------------------------------------------------------------------------
// deliverPending(): one thread at a time drains the queue in sequence order
// -----------------------------------------------------------------------------
void LifecycleEngine::deliverPending() {
  while (!pending_.empty()) {
    bool expected = false;
    if (!delivering_.compare_exchange_strong(expected, true)) {
      // The thread holding the flag re-checks the queue after clearing it.
      return;
    }
    DeliveryGuard guard{delivering_};
    for (const LedgerUpdate& update : pending_.drain()) {
      event_bus_.publish(update);
    }
  }
}

std::uint64_t LifecycleEngine::lastSequenceId() const {
  return query([this] { return last_sequence_id_; });
}

// -----------------------------------------------------------------------------
// Writes
// -----------------------------------------------------------------------------
domain::TradeStateSnapshot LifecycleEngine::createTrade(
    const domain::TradeId& trade_id, domain::ProductType product_type,
    const domain::PartyList& parties, domain::EpochMillis effective_date,
    domain::EpochMillis maturity_date) {
  return write("createTrade", [&](LedgerTransaction& txn) {
    return states_.createTrade(trade_id, product_type, parties,
                               effective_date, maturity_date, &txn);
  });
}

domain::TradeStateSnapshot LifecycleEngine::transitionState(
    const domain::TradeId& trade_id, domain::TradeState target,
    const domain::EventId& causing_event_id,
    const domain::PartyId& initiator) {
  return write("transitionState", [&](LedgerTransaction& txn) {
    return states_.transitionState(trade_id, target, causing_event_id,
                                   initiator, &txn);
  });
}

domain::EventRecord LifecycleEngine::executeTrade(
    const ExecutionRequest& request) {
  return write("executeTrade", [&](LedgerTransaction& txn) {
    return executions_.executeTrade(request, txn);
  });
}

domain::EventRecord LifecycleEngine::recordReset(const ResetRequest& request) {
  return write("recordReset", [&](LedgerTransaction& txn) {
    return resets_.recordReset(request, txn);
  });
}

domain::ResetEventData LifecycleEngine::verifyRate(
    const domain::EventId& event_id, const domain::PartyId& verifier) {
  return write("verifyRate", [&](LedgerTransaction& txn) {
    return resets_.verifyRate(event_id, verifier, txn);
  });
}

domain::EventRecord LifecycleEngine::recordTransfer(
    const TransferRequest& request) {
  return write("recordTransfer", [&](LedgerTransaction& txn) {
    return transfers_.recordTransfer(request, txn);
  });
}

domain::TransferEventData LifecycleEngine::initiateTransfer(
    const domain::EventId& event_id) {
  return write("initiateTransfer", [&](LedgerTransaction& txn) {
    return transfers_.initiateTransfer(event_id, txn);
  });
}

domain::TransferEventData LifecycleEngine::settleTransfer(
    const domain::EventId& event_id, domain::EpochMillis settlement_date,
    const std::string& reference) {
  return write("settleTransfer", [&](LedgerTransaction& txn) {
    return transfers_.settleTransfer(event_id, settlement_date, reference,
                                     txn);
  });
}

domain::TransferEventData LifecycleEngine::failTransfer(
    const domain::EventId& event_id, const std::string& reason) {
  return write("failTransfer", [&](LedgerTransaction& txn) {
    return transfers_.failTransfer(event_id, reason, txn);
  });
}

domain::TransferEventData LifecycleEngine::cancelTransfer(
    const domain::EventId& event_id, const std::string& reason) {
  return write("cancelTransfer", [&](LedgerTransaction& txn) {
    return transfers_.cancelTransfer(event_id, reason, txn);
  });
}

domain::TransferEventData LifecycleEngine::verifyTransfer(
    const domain::EventId& event_id, const domain::PartyId& verifier) {
  return write("verifyTransfer", [&](LedgerTransaction& txn) {
    return transfers_.verifyTransfer(event_id, verifier, txn);
  });
}

domain::EventRecord LifecycleEngine::terminateTrade(
    const TerminationRequest& request) {
  return write("terminateTrade", [&](LedgerTransaction& txn) {
    return terminations_.terminateTrade(request, txn);
  });
}

domain::TerminationEventData LifecycleEngine::confirmTermination(
    const domain::EventId& event_id) {
  return write("confirmTermination", [&](LedgerTransaction& txn) {
    return terminations_.confirmTermination(event_id, txn);
  });
}

domain::TerminationEventData LifecycleEngine::disputeTermination(
    const domain::EventId& event_id, const domain::PartyId& disputing_party,
    const std::string& reason) {
  return write("disputeTermination", [&](LedgerTransaction& txn) {
    return terminations_.disputeTermination(event_id, disputing_party, reason,
                                            txn);
  });
}

domain::TerminationEventData LifecycleEngine::linkSettlementTransfer(
    const domain::EventId& event_id,
    const domain::EventId& transfer_event_id) {
  return write("linkSettlementTransfer", [&](LedgerTransaction& txn) {
    return terminations_.linkSettlementTransfer(event_id, transfer_event_id,
                                                txn);
  });
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
bool LifecycleEngine::tradeExists(const domain::TradeId& trade_id) const {
  return query([&] { return states_.exists(trade_id); });
}

domain::TradeStateSnapshot LifecycleEngine::currentSnapshot(
    const domain::TradeId& trade_id) const {
  return query([&] { return states_.currentSnapshot(trade_id); });
}

domain::TradeState LifecycleEngine::currentState(
    const domain::TradeId& trade_id) const {
  return query([&] { return states_.currentState(trade_id); });
}

std::optional<domain::TradeStateSnapshot> LifecycleEngine::findSnapshot(
    domain::SnapshotId snapshot_id) const {
  return query([&] { return states_.findSnapshot(snapshot_id); });
}

std::vector<domain::TradeStateSnapshot> LifecycleEngine::snapshotChain(
    const domain::TradeId& trade_id) const {
  return query([&] { return states_.snapshotChain(trade_id); });
}

std::vector<domain::StateTransition> LifecycleEngine::transitionHistory(
    const domain::TradeId& trade_id) const {
  return query([&] { return states_.transitionHistory(trade_id); });
}

TradeStatus LifecycleEngine::tradeStatus(
    const domain::TradeId& trade_id) const {
  return query([&] {
    const domain::EpochMillis now = clock_.now_ms();
    TradeStatus status;
    status.current = states_.currentSnapshot(trade_id);
    status.transitions = states_.transitionHistory(trade_id);
    status.age_ms = states_.tradeAgeMs(trade_id, now);
    status.age_days = states_.tradeAgeDays(trade_id, now);
    status.time_to_maturity_ms = states_.timeToMaturityMs(trade_id, now);
    status.effective_date_reached =
        states_.hasReachedEffectiveDate(trade_id, now);
    status.maturity_reached = states_.hasReachedMaturity(trade_id, now);
    status.executed = executions_.hasExecution(trade_id);
    status.terminated = terminations_.hasTermination(trade_id);
    return status;
  });
}

std::vector<domain::TradeId> LifecycleEngine::tradeIds() const {
  return query([&] { return states_.tradeIds(); });
}

std::size_t LifecycleEngine::tradeCount() const {
  return query([&] { return states_.tradeCount(); });
}

std::optional<domain::EventRecord> LifecycleEngine::findEvent(
    const domain::EventId& event_id) const {
  return query([&] { return events_.find(event_id); });
}

std::vector<domain::EventRecord> LifecycleEngine::eventsForTrade(
    const domain::TradeId& trade_id,
    std::optional<domain::EventType> type) const {
  return query([&] { return events_.eventsForTrade(trade_id, type); });
}

std::size_t LifecycleEngine::eventCount() const {
  return query([&] { return events_.eventCount(); });
}

std::optional<domain::ExecutionEventData> LifecycleEngine::executionForTrade(
    const domain::TradeId& trade_id) const {
  return query([&] { return executions_.executionForTrade(trade_id); });
}

std::vector<domain::ResetEventData> LifecycleEngine::resetsForTrade(
    const domain::TradeId& trade_id) const {
  return query([&] { return resets_.resetsForTrade(trade_id); });
}

std::optional<domain::ResetEventData> LifecycleEngine::resetByNumber(
    const domain::TradeId& trade_id, std::uint32_t reset_number) const {
  return query([&] { return resets_.resetByNumber(trade_id, reset_number); });
}

std::vector<domain::TransferEventData> LifecycleEngine::transfersForTrade(
    const domain::TradeId& trade_id) const {
  return query([&] { return transfers_.transfersForTrade(trade_id); });
}

std::optional<domain::TransferEventData> LifecycleEngine::findTransfer(
    const domain::EventId& event_id) const {
  return query([&] { return transfers_.findByEvent(event_id); });
}

std::optional<domain::TerminationEventData>
LifecycleEngine::terminationForTrade(const domain::TradeId& trade_id) const {
  return query([&] { return terminations_.terminationForTrade(trade_id); });
}

AuditTrail LifecycleEngine::auditTrail(const domain::TradeId& trade_id) const {
  return query([&] {
    AuditTrail trail;
    trail.trade_id = trade_id;
    trail.snapshots = states_.snapshotChain(trade_id);
    trail.transitions = states_.transitionHistory(trade_id);
    trail.events = events_.eventsForTrade(trade_id);
    trail.execution = executions_.executionForTrade(trade_id);
    trail.resets = resets_.resetsForTrade(trade_id);
    trail.transfers = transfers_.transfersForTrade(trade_id);
    trail.termination = terminations_.terminationForTrade(trade_id);
    return trail;
  });
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, convert failures into error replies
// -----------------------------------------------------------------------------
std::string LifecycleEngine::executeCommand(const std::string& cmd) {
  json response;

  try {
    const json request = json::parse(cmd);
    response = dispatch(requiredString(request, "command"), request);
  } catch (const LedgerError& e) {
    response = errorToJson(e);
  } catch (const json::exception& e) {
    std::cerr << "[LifecycleEngine] bad command: " << e.what() << "\n";
    response = json{{"status", "error"},
                    {"error", "BadRequest"},
                    {"kind", errorKindName(ErrorKind::InvalidInput)},
                    {"message", e.what()}};
  }

  return response.dump();
}

json LifecycleEngine::dispatch(const std::string& name, const json& request) {
  json response = ok();

  if (name == "ping") {
    response["response"] = "PONG";
  } else if (name == "status") {
    response["trades"] = tradeCount();
    response["events"] = eventCount();
    response["last_sequence_id"] = lastSequenceId();
    response["ipc_configured"] = !ipc_cmd_endpoint_.empty();
  }
  // --- Trade state ---------------------------------------------------------
  else if (name == "create_trade") {
    response["snapshot"] = createTrade(
        requiredString(request, "trade_id"),
        request.at("product_type").get<domain::ProductType>(),
        request.at("parties").get<domain::PartyList>(),
        request.at("effective_date").get<domain::EpochMillis>(),
        request.at("maturity_date").get<domain::EpochMillis>());
  } else if (name == "transition_state") {
    response["snapshot"] = transitionState(
        requiredString(request, "trade_id"),
        request.at("target_state").get<domain::TradeState>(),
        request.value("event_id", std::string()),
        requiredString(request, "initiator"));
  }
  // --- Business events -----------------------------------------------------
  else if (name == "execute_trade") {
    response["record"] = executeTrade(request.get<ExecutionRequest>());
  } else if (name == "record_reset") {
    response["record"] = recordReset(request.get<ResetRequest>());
  } else if (name == "verify_rate") {
    response["reset"] = verifyRate(requiredString(request, "event_id"),
                                   requiredString(request, "verifier"));
  } else if (name == "record_transfer") {
    response["record"] = recordTransfer(request.get<TransferRequest>());
  } else if (name == "initiate_transfer") {
    response["transfer"] =
        initiateTransfer(requiredString(request, "event_id"));
  } else if (name == "settle_transfer") {
    response["transfer"] = settleTransfer(
        requiredString(request, "event_id"),
        request.at("settlement_date").get<domain::EpochMillis>(),
        request.value("reference", std::string()));
  } else if (name == "fail_transfer") {
    response["transfer"] = failTransfer(requiredString(request, "event_id"),
                                        request.value("reason", std::string()));
  } else if (name == "cancel_transfer") {
    response["transfer"] = cancelTransfer(
        requiredString(request, "event_id"),
        request.value("reason", std::string()));
  } else if (name == "verify_transfer") {
    response["transfer"] = verifyTransfer(requiredString(request, "event_id"),
                                          requiredString(request, "verifier"));
  } else if (name == "terminate_trade") {
    response["record"] = terminateTrade(request.get<TerminationRequest>());
  } else if (name == "confirm_termination") {
    response["termination"] =
        confirmTermination(requiredString(request, "event_id"));
  } else if (name == "dispute_termination") {
    response["termination"] = disputeTermination(
        requiredString(request, "event_id"), requiredString(request, "party"),
        request.value("reason", std::string()));
  } else if (name == "link_settlement_transfer") {
    response["termination"] = linkSettlementTransfer(
        requiredString(request, "event_id"),
        requiredString(request, "transfer_event_id"));
  }
  // --- Queries -------------------------------------------------------------
  else if (name == "get_trade") {
    response["trade"] =
        statusToJson(tradeStatus(requiredString(request, "trade_id")));
  } else if (name == "get_snapshots") {
    response["snapshots"] = snapshotChain(requiredString(request, "trade_id"));
  } else if (name == "get_transitions") {
    response["transitions"] =
        transitionHistory(requiredString(request, "trade_id"));
  } else if (name == "get_events") {
    std::optional<domain::EventType> type;
    if (request.contains("event_type")) {
      type = request.at("event_type").get<domain::EventType>();
    }
    response["events"] =
        eventsForTrade(requiredString(request, "trade_id"), type);
  } else if (name == "get_execution") {
    response["execution"] =
        optionalToJson(executionForTrade(requiredString(request, "trade_id")));
  } else if (name == "get_resets") {
    response["resets"] = resetsForTrade(requiredString(request, "trade_id"));
  } else if (name == "get_transfers") {
    response["transfers"] =
        transfersForTrade(requiredString(request, "trade_id"));
  } else if (name == "get_termination") {
    response["termination"] = optionalToJson(
        terminationForTrade(requiredString(request, "trade_id")));
  } else if (name == "get_audit_trail") {
    response["audit_trail"] =
        auditToJson(auditTrail(requiredString(request, "trade_id")));
  } else {
    response = json{{"status", "error"},
                    {"error", "UnknownCommand"},
                    {"kind", errorKindName(ErrorKind::InvalidInput)},
                    {"message", "unknown command: " + name}};
  }

  return response;
}

}  // namespace tradeledger
