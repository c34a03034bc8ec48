// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for tradeledger::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO order through push / pop / try_pop
//   - drain() empties the queue in one call, oldest first
//   - Blocking pop() wakes when a producer pushes
//   - No update is lost or duplicated with several producers and one
//     draining consumer, the shape the IPC server uses
// =============================================================================

#include "tradeledger/concurrent/thread_safe_queue.hpp"
#include "tradeledger/events/ledger_update.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <set>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  tradeledger::ThreadSafeQueue<tradeledger::LedgerUpdate> queue;

  static tradeledger::LedgerUpdate update(std::uint64_t seq) {
    tradeledger::EventRecordUpdate u;
    u.record.event_id = "EVT-" + std::to_string(seq);
    u.sequence_id = seq;
    return u;
  }

  static std::uint64_t seqOf(const tradeledger::LedgerUpdate& u) {
    return std::visit([](const auto& v) { return v.sequence_id; }, u);
  }
};

// -----------------------------------------------------------------------------
// 1. FIFO basics
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopReturnsOldestFirst) {
  EXPECT_TRUE(queue.empty());
  queue.push(update(1));
  queue.push(update(2));
  EXPECT_EQ(queue.size(), 2u);

  EXPECT_EQ(seqOf(queue.pop()), 1u);
  const auto next = queue.try_pop();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(seqOf(*next), 2u);

  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. drain() hands back everything queued, in order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainTakesEverything) {
  EXPECT_TRUE(queue.drain().empty());

  for (std::uint64_t i = 1; i <= 5; ++i) {
    queue.push(update(i));
  }
  const auto items = queue.drain();
  ASSERT_EQ(items.size(), 5u);
  for (std::size_t i = 0; i < items.size(); ++i) {
    EXPECT_EQ(seqOf(items[i]), i + 1);
  }
  EXPECT_EQ(std::get<tradeledger::EventRecordUpdate>(items[4]).record.event_id,
            "EVT-5");
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. pop() blocks until a value arrives.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<std::uint64_t> received{0};
  std::thread consumer([this, &received] { received = seqOf(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), 0u);

  queue.push(update(7));
  consumer.join();
  EXPECT_EQ(received.load(), 7u);
}

// -----------------------------------------------------------------------------
// 4. Several producers, one consumer draining in batches.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersWithDrainingConsumer) {
  constexpr std::uint64_t kProducers = 4;
  constexpr std::uint64_t kPerProducer = 500;
  constexpr std::uint64_t kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (std::uint64_t p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (std::uint64_t i = 1; i <= kPerProducer; ++i) {
        queue.push(update(p * kPerProducer + i));
      }
    });
  }

  std::set<std::uint64_t> seen;
  std::size_t received = 0;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (received < kTotal && std::chrono::steady_clock::now() < deadline) {
    for (const auto& u : queue.drain()) {
      seen.insert(seqOf(u));
      ++received;
    }
  }

  for (auto& t : producers) {
    t.join();
  }

  EXPECT_EQ(received, kTotal);
  EXPECT_EQ(seen.size(), kTotal);
  EXPECT_EQ(*seen.begin(), 1u);
  EXPECT_EQ(*seen.rbegin(), kTotal);
}
