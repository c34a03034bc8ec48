#pragma once

#include "tradeledger/concurrent/thread_safe_queue.hpp"
#include "tradeledger/domain/event_record.hpp"
#include "tradeledger/domain/execution_data.hpp"
#include "tradeledger/domain/reset_data.hpp"
#include "tradeledger/domain/termination_data.hpp"
#include "tradeledger/domain/trade_snapshot.hpp"
#include "tradeledger/domain/transfer_data.hpp"
#include "tradeledger/eventbus/event_bus.hpp"
#include "tradeledger/events/ledger_update.hpp"
#include "tradeledger/network/ipc_server.hpp"
#include "tradeledger/recorders/execution_recorder.hpp"
#include "tradeledger/recorders/reset_recorder.hpp"
#include "tradeledger/recorders/termination_recorder.hpp"
#include "tradeledger/recorders/transfer_recorder.hpp"
#include "tradeledger/store/event_ledger.hpp"
#include "tradeledger/store/state_store.hpp"
#include "tradeledger/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradeledger {

// Status view of one trade, evaluated against the engine clock.
struct TradeStatus {
  domain::TradeStateSnapshot current;
  std::vector<domain::StateTransition> transitions;
  std::int64_t age_ms{0};
  std::int64_t age_days{0};
  std::int64_t time_to_maturity_ms{0};
  bool effective_date_reached{false};
  bool maturity_reached{false};
  bool executed{false};
  bool terminated{false};
};

// Everything recorded about one trade, enough to explain its current state.
struct AuditTrail {
  domain::TradeId trade_id;
  std::vector<domain::TradeStateSnapshot> snapshots;
  std::vector<domain::StateTransition> transitions;
  std::vector<domain::EventRecord> events;
  std::optional<domain::ExecutionEventData> execution;
  std::vector<domain::ResetEventData> resets;
  std::vector<domain::TransferEventData> transfers;
  std::optional<domain::TerminationEventData> termination;
};

// -----------------------------------------------------------------------------
// LifecycleEngine
// -----------------------------------------------------------------------------
//
// @brief  Aggregate root of the ledger: owns the StateStore, EventLedger and
//         the four recorders, serializes every operation, and publishes
//         committed updates.
//
// @details
// Every write runs the same way:
//   1. Take mutex_ exclusively.
//   2. Open a LedgerTransaction and call the component operation.
//   3. On success commit, stamp each buffered update with the next
//      sequence id and queue it for delivery. On LedgerError the
//      transaction rolls back, the rejection is logged and rethrown.
//   4. Release mutex_, then deliver queued updates on the EventBus.
//
// Delivery happens outside the lock so subscribers may query the engine.
// Updates are delivered in sequence order; when several threads write
// concurrently one of them delivers for all. A subscriber that writes back
// into the engine has its updates delivered after the current batch.
//
// Reads take mutex_ shared and return copies.
//
// Thread model:
//   All public operations are safe from any thread. start()/stop() control
//   the optional IpcServer and must be called from the owning thread.
//
// Ownership:
//   LifecycleEngine
//    ├── clock_         (const ITimeProvider&: non-owning, must outlive)
//    ├── states_        (StateStore)
//    ├── events_        (EventLedger)
//    ├── executions_    (ExecutionRecorder)
//    ├── resets_        (ResetRecorder)
//    ├── transfers_     (TransferRecorder)
//    ├── terminations_  (TerminationRecorder)
//    ├── event_bus_     (EventBus)
//    ├── pending_       (ThreadSafeQueue<LedgerUpdate> awaiting delivery)
//    └── ipc_server_    (shared_ptr<IpcServer>, created by start(); the
//                        EventBus bridge holds the other reference)
// -----------------------------------------------------------------------------
class LifecycleEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock             Source of "now" for every component.
  // @param  ipc_cmd_endpoint  REP endpoint; empty disables the IpcServer.
  // @param  ipc_pub_endpoint  PUB endpoint; empty disables the IpcServer.
  //
  // The ledger is usable immediately; start() only brings up IPC.
  // -------------------------------------------------------------------------
  explicit LifecycleEngine(const ITimeProvider& clock,
                           std::string ipc_cmd_endpoint = "",
                           std::string ipc_pub_endpoint = "");

  ~LifecycleEngine();

  LifecycleEngine(const LifecycleEngine&) = delete;
  LifecycleEngine& operator=(const LifecycleEngine&) = delete;
  LifecycleEngine(LifecycleEngine&&) = delete;
  LifecycleEngine& operator=(LifecycleEngine&&) = delete;

  // Starts the IpcServer (if configured) and forwards updates to it.
  void start();
  void stop();
  bool isRunning() const { return running_; }

  // --- Writes ---------------------------------------------------------------
  // Each is one atomic unit. All throw LedgerError on a failed precondition
  // and leave the ledger unchanged.

  domain::TradeStateSnapshot createTrade(const domain::TradeId& trade_id,
                                         domain::ProductType product_type,
                                         const domain::PartyList& parties,
                                         domain::EpochMillis effective_date,
                                         domain::EpochMillis maturity_date);

  domain::TradeStateSnapshot transitionState(
      const domain::TradeId& trade_id, domain::TradeState target,
      const domain::EventId& causing_event_id,
      const domain::PartyId& initiator);

  domain::EventRecord executeTrade(const ExecutionRequest& request);

  domain::EventRecord recordReset(const ResetRequest& request);
  domain::ResetEventData verifyRate(const domain::EventId& event_id,
                                    const domain::PartyId& verifier);

  domain::EventRecord recordTransfer(const TransferRequest& request);
  domain::TransferEventData initiateTransfer(const domain::EventId& event_id);
  domain::TransferEventData settleTransfer(const domain::EventId& event_id,
                                           domain::EpochMillis settlement_date,
                                           const std::string& reference);
  domain::TransferEventData failTransfer(const domain::EventId& event_id,
                                         const std::string& reason);
  domain::TransferEventData cancelTransfer(const domain::EventId& event_id,
                                           const std::string& reason);
  domain::TransferEventData verifyTransfer(const domain::EventId& event_id,
                                           const domain::PartyId& verifier);

  domain::EventRecord terminateTrade(const TerminationRequest& request);
  domain::TerminationEventData confirmTermination(
      const domain::EventId& event_id);
  domain::TerminationEventData disputeTermination(
      const domain::EventId& event_id, const domain::PartyId& disputing_party,
      const std::string& reason);
  domain::TerminationEventData linkSettlementTransfer(
      const domain::EventId& event_id,
      const domain::EventId& transfer_event_id);

  // --- Reads ----------------------------------------------------------------

  bool tradeExists(const domain::TradeId& trade_id) const;
  domain::TradeStateSnapshot currentSnapshot(
      const domain::TradeId& trade_id) const;
  domain::TradeState currentState(const domain::TradeId& trade_id) const;
  std::optional<domain::TradeStateSnapshot> findSnapshot(
      domain::SnapshotId snapshot_id) const;
  std::vector<domain::TradeStateSnapshot> snapshotChain(
      const domain::TradeId& trade_id) const;
  std::vector<domain::StateTransition> transitionHistory(
      const domain::TradeId& trade_id) const;

  // Throws LedgerError(TradeNotFound) for unknown trades.
  TradeStatus tradeStatus(const domain::TradeId& trade_id) const;

  std::vector<domain::TradeId> tradeIds() const;
  std::size_t tradeCount() const;

  std::optional<domain::EventRecord> findEvent(
      const domain::EventId& event_id) const;
  std::vector<domain::EventRecord> eventsForTrade(
      const domain::TradeId& trade_id,
      std::optional<domain::EventType> type = std::nullopt) const;
  std::size_t eventCount() const;

  std::optional<domain::ExecutionEventData> executionForTrade(
      const domain::TradeId& trade_id) const;
  std::vector<domain::ResetEventData> resetsForTrade(
      const domain::TradeId& trade_id) const;
  std::optional<domain::ResetEventData> resetByNumber(
      const domain::TradeId& trade_id, std::uint32_t reset_number) const;
  std::vector<domain::TransferEventData> transfersForTrade(
      const domain::TradeId& trade_id) const;
  std::optional<domain::TransferEventData> findTransfer(
      const domain::EventId& event_id) const;
  std::optional<domain::TerminationEventData> terminationForTrade(
      const domain::TradeId& trade_id) const;

  // Throws LedgerError(TradeNotFound) for unknown trades.
  AuditTrail auditTrail(const domain::TradeId& trade_id) const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one JSON command and returns the JSON reply.
  //
  // @param  cmd  A JSON object {"command": <name>, ...fields}.
  //
  // @details
  // Success:  {"status":"ok", ...result fields}
  // Failure:  {"status":"error","error":<code>,"kind":<kind>,"message":...}
  //   where <code> is an ErrorCode name, or "BadRequest" for malformed
  //   JSON / missing fields and "UnknownCommand" for an unknown name.
  //
  // Commands: ping, status, create_trade, transition_state, execute_trade,
  // record_reset, verify_rate, record_transfer, initiate_transfer,
  // settle_transfer, fail_transfer, cancel_transfer, verify_transfer,
  // terminate_trade, confirm_termination, dispute_termination,
  // link_settlement_transfer, get_trade, get_snapshots, get_transitions,
  // get_events, get_execution, get_resets, get_transfers, get_termination,
  // get_audit_trail.
  //
  // Thread-safety: Safe to call from any thread (the IPC worker calls it).
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return event_bus_; }

  // Sequence id of the most recently committed update (0 before any write).
  std::uint64_t lastSequenceId() const;

 private:
  template <typename Operation>
  auto write(const char* name, Operation&& operation);

  template <typename Query>
  auto query(Query&& q) const;

  void deliverPending();

  nlohmann::json dispatch(const std::string& name,
                          const nlohmann::json& request);

  const ITimeProvider& clock_;
  std::string ipc_cmd_endpoint_;
  std::string ipc_pub_endpoint_;

  mutable std::shared_mutex mutex_;
  StateStore states_;
  EventLedger events_;
  ExecutionRecorder executions_;
  ResetRecorder resets_;
  TransferRecorder transfers_;
  TerminationRecorder terminations_;
  std::uint64_t last_sequence_id_{0};  // Guarded by mutex_

  EventBus event_bus_;
  ThreadSafeQueue<LedgerUpdate> pending_;
  std::atomic<bool> delivering_{false};

  std::shared_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId ipc_subscription_{0};
  bool running_{false};
};

}  // namespace tradeledger
