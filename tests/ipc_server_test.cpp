// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Loopback tests for tradeledger::IpcServer and the engine's IPC bridge.
//
// Validates:
//   - start() / stop() are idempotent; the destructor stops the worker
//   - A REQ client gets the handler's reply for each request
//   - Updates handed to publishUpdate() reach a SUB client as JSON
//   - LifecycleEngine::start() answers commands and publishes its updates
//   - stop() is safe while another thread is still delivering updates
// =============================================================================

#include "tradeledger/engine/lifecycle_engine.hpp"
#include "tradeledger/network/ipc_server.hpp"
#include "tradeledger/time/simulation_time_provider.hpp"

#include "ledger_fixture.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <atomic>
#include <optional>
#include <string>
#include <thread>

using nlohmann::json;
using tradeledger::IpcServer;

class IpcServerTest : public ::testing::Test {
 protected:
  static constexpr int kRecvTimeoutMs = 2000;

  zmq::context_t client_context{1};

  static std::string endpoint(int port) {
    return "tcp://127.0.0.1:" + std::to_string(port);
  }

  std::string request(const std::string& ep, const std::string& body) {
    zmq::socket_t req(client_context, zmq::socket_type::req);
    req.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
    req.set(zmq::sockopt::linger, 0);
    req.connect(ep);

    req.send(zmq::buffer(body), zmq::send_flags::none);
    zmq::message_t reply;
    const auto result = req.recv(reply, zmq::recv_flags::none);
    if (!result.has_value()) {
      return "";
    }
    return reply.to_string();
  }

  // Keeps publishing until the subscriber has joined and sees a message.
  template <typename Publish>
  std::optional<json> receiveOne(const std::string& ep, Publish&& publish) {
    zmq::socket_t sub(client_context, zmq::socket_type::sub);
    sub.set(zmq::sockopt::subscribe, "");
    sub.set(zmq::sockopt::rcvtimeo, 100);
    sub.set(zmq::sockopt::linger, 0);
    sub.connect(ep);

    for (int attempt = 0; attempt < 30; ++attempt) {
      publish(attempt);
      zmq::message_t msg;
      if (sub.recv(msg, zmq::recv_flags::none).has_value()) {
        return json::parse(msg.to_string());
      }
    }
    return std::nullopt;
  }
};

// -----------------------------------------------------------------------------
// 1. Lifecycle
// -----------------------------------------------------------------------------
TEST_F(IpcServerTest, StartAndStopAreIdempotent) {
  IpcServer server([](const std::string& s) { return s; }, endpoint(47550),
                   endpoint(47551));
  EXPECT_FALSE(server.isRunning());

  server.start();
  server.start();
  EXPECT_TRUE(server.isRunning());

  server.stop();
  server.stop();
  EXPECT_FALSE(server.isRunning());
}

TEST_F(IpcServerTest, DestructorStopsWorker) {
  {
    IpcServer server([](const std::string& s) { return s; }, endpoint(47552),
                     endpoint(47553));
    server.start();
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 2. Request / reply
// -----------------------------------------------------------------------------
TEST_F(IpcServerTest, ReplyComesFromHandler) {
  IpcServer server(
      [](const std::string& cmd) { return "echo:" + cmd; }, endpoint(47554),
      endpoint(47555));
  server.start();

  EXPECT_EQ(request(endpoint(47554), "hello"), "echo:hello");
  EXPECT_EQ(request(endpoint(47554), "again"), "echo:again");

  server.stop();
}

// -----------------------------------------------------------------------------
// 3. Publish feed
// -----------------------------------------------------------------------------
TEST_F(IpcServerTest, PublishedUpdateReachesSubscriber) {
  IpcServer server([](const std::string& s) { return s; }, endpoint(47556),
                   endpoint(47557));
  server.start();

  const auto received = receiveOne(endpoint(47557), [&server](int attempt) {
    tradeledger::TradeStateUpdate u;
    u.snapshot.trade_id = "IRS-1";
    u.snapshot.state = tradeledger::domain::TradeState::Pending;
    u.sequence_id = static_cast<std::uint64_t>(attempt + 1);
    server.publishUpdate(u);
  });

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->at("type"), "trade_state");
  EXPECT_EQ(received->at("snapshot").at("trade_id"), "IRS-1");
  EXPECT_EQ(received->at("snapshot").at("state"), "PENDING");
  EXPECT_GE(received->at("sequence_id").get<std::uint64_t>(), 1u);

  server.stop();
}

// -----------------------------------------------------------------------------
// 4. Engine bridge
// -----------------------------------------------------------------------------
TEST_F(IpcServerTest, EngineServesCommandsAndPublishesUpdates) {
  tradeledger::SimulationTimeProvider clock{ledger_test::kStart};
  tradeledger::LifecycleEngine engine(clock, endpoint(47558), endpoint(47559));
  engine.start();
  ASSERT_TRUE(engine.isRunning());

  const json pong = json::parse(
      request(endpoint(47558), json{{"command", "ping"}}.dump()));
  EXPECT_EQ(pong.at("response"), "PONG");

  const json status = json::parse(
      request(endpoint(47558), json{{"command", "status"}}.dump()));
  EXPECT_EQ(status.at("ipc_configured"), true);

  const auto received = receiveOne(endpoint(47559), [&engine](int attempt) {
    engine.createTrade("IRS-" + std::to_string(attempt),
                       tradeledger::domain::ProductType::InterestRateSwap,
                       ledger_test::defaultParties(), ledger_test::kEffective,
                       ledger_test::kMaturity);
  });

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->at("type"), "trade_state");
  EXPECT_EQ(received->at("snapshot").at("state"), "CREATED");
  EXPECT_TRUE(received->at("previous_state").is_null());

  engine.stop();
  EXPECT_FALSE(engine.isRunning());
}

TEST_F(IpcServerTest, EngineStopsWhileWriterDelivers) {
  tradeledger::SimulationTimeProvider clock{ledger_test::kStart};
  tradeledger::LifecycleEngine engine(clock, endpoint(47560), endpoint(47561));
  engine.start();

  constexpr int kTrades = 300;
  std::atomic<int> created{0};
  std::thread writer([&engine, &created] {
    for (int i = 0; i < kTrades; ++i) {
      engine.createTrade("IRS-" + std::to_string(i),
                         tradeledger::domain::ProductType::InterestRateSwap,
                         ledger_test::defaultParties(), ledger_test::kEffective,
                         ledger_test::kMaturity);
      ++created;
    }
  });

  while (created.load() < kTrades / 3) {
    std::this_thread::yield();
  }
  engine.stop();
  writer.join();

  EXPECT_FALSE(engine.isRunning());
  EXPECT_EQ(created.load(), kTrades);
  EXPECT_EQ(engine.tradeCount(), static_cast<std::size_t>(kTrades));
  EXPECT_EQ(engine.lastSequenceId(), static_cast<std::uint64_t>(kTrades));
}
