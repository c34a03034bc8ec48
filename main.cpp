// -----------------------------------------------------------------------------
// tradeledger: ledger service entry point
//
//   1) Load LedgerConfig from argv[1] (defaults when no path is given).
//   2) Build the clock the config asks for: the system clock, or a
//      SimulationTimeProvider frozen at clock.start_ms for replays.
//   3) Create the LifecycleEngine, subscribe logging callbacks to its
//      EventBus, and start it. With IPC enabled this binds the REP command
//      socket and the PUB update feed.
//   4) Wait on the main thread until SIGINT or SIGTERM, then stop.
//
// Thread layout:
//   main thread  → startup, wait, shutdown
//   IPC thread   → IpcServer loop; runs commands and publishes updates
// -----------------------------------------------------------------------------

#include "tradeledger/config/ledger_config.hpp"
#include "tradeledger/domain/trade_state.hpp"
#include "tradeledger/domain/transfer_data.hpp"
#include "tradeledger/engine/lifecycle_engine.hpp"
#include "tradeledger/events/ledger_update.hpp"
#include "tradeledger/time/live_time_provider.hpp"
#include "tradeledger/time/simulation_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// Set from the signal handler, polled by main().
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char* argv[]) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  tradeledger::LedgerConfig config;
  if (argc > 1) {
    try {
      config = tradeledger::loadLedgerConfig(argv[1]);
    } catch (const tradeledger::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] loaded config from " << argv[1] << "\n";
  } else {
    std::cout << "[main] no config file given, using defaults\n";
  }

  // -------------------------------------------------------------------------
  // 2) Clock
  // -------------------------------------------------------------------------
  std::unique_ptr<tradeledger::ITimeProvider> clock;
  if (config.clock.mode == tradeledger::ClockMode::Simulation) {
    clock = std::make_unique<tradeledger::SimulationTimeProvider>(
        config.clock.start_ms);
    std::cout << "[main] simulation clock at " << config.clock.start_ms
              << " ms\n";
  } else {
    clock = std::make_unique<tradeledger::LiveTimeProvider>();
  }

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  tradeledger::LifecycleEngine engine(
      *clock, config.ipc.enabled ? config.ipc.command_endpoint : "",
      config.ipc.enabled ? config.ipc.publish_endpoint : "");

  engine.eventBus().subscribe<tradeledger::TradeStateUpdate>(
      [](const tradeledger::TradeStateUpdate& u) {
        std::cout << "[TradeState] seq=" << u.sequence_id
                  << " trade=" << u.snapshot.trade_id << " "
                  << (u.previous_state
                          ? tradeledger::domain::tradeStateName(
                                *u.previous_state)
                          : "-")
                  << " -> "
                  << tradeledger::domain::tradeStateName(u.snapshot.state)
                  << " snapshot=" << u.snapshot.snapshot_id << "\n";
      });

  engine.eventBus().subscribe<tradeledger::TransferStatusUpdate>(
      [](const tradeledger::TransferStatusUpdate& u) {
        std::cout << "[Settlement] seq=" << u.sequence_id
                  << " transfer=" << u.event_id << " "
                  << tradeledger::domain::settlementStatusName(
                         u.previous_status)
                  << " -> "
                  << tradeledger::domain::settlementStatusName(u.status)
                  << "\n";
      });

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot bind IPC endpoints: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for shutdown
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] ledger running. Press Ctrl-C to shut down.\n";
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
