// =============================================================================
// broadcast_hub_test.cpp
// =============================================================================
// Unit tests for tickflow::BroadcastHub.
//
// Validates:
//   - A new session's first message is the snapshot, also mid-stream, and
//     it then receives every later tick in publish order
//   - A stalled session drops its oldest ticks without slowing the publisher
//     or the other sessions; its unread snapshot is never dropped
//   - Keepalive: silent sessions are reaped with KeepaliveExpired, touched
//     ones survive; the reaper thread does the same on its own
//   - disconnect() and closeAll() close with the right reason
//   - Provider errors update provider health and a later tick clears them;
//     broker errors reach sessions without touching provider health
//   - The pulled account never steps back to an older account version
//   - remove_symbol() and clear() empty the snapshot
// =============================================================================

#include "tickflow/broadcast/broadcast_hub.hpp"
#include "tickflow/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using nlohmann::json;
using tickflow::CloseReason;
using tickflow::SessionState;

namespace {

tickflow::TickProcessedEvent composite(const std::string& symbol, double price,
                                       std::int64_t ts) {
  tickflow::TickProcessedEvent e;
  e.tick = tickflow::domain::Tick{symbol, price, ts};
  e.signal = tickflow::domain::Signal{symbol, tickflow::domain::SignalKind::Hold,
                                      "insufficient_data", ts};
  e.account.cash = 1000.0;
  e.account.equity = 1000.0;
  return e;
}

json next_message(tickflow::BroadcastHub::SessionPtr& session) {
  auto message = session->try_pop();
  if (!message) {
    return nullptr;
  }
  return json::parse(**message);
}

}  // namespace

class BroadcastHubTest : public ::testing::Test {
 protected:
  tickflow::BroadcastConfig config() const {
    tickflow::BroadcastConfig c;
    c.queue_capacity = 4;
    c.keepalive_timeout_ms = 60000;
    c.reap_interval_ms = 10;
    return c;
  }

  tickflow::SimulationTimeProvider clock{1'700'000'000'000};
};

// -----------------------------------------------------------------------------
// 1. Snapshot first, then ticks in order.
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, SnapshotIsFirstMessage) {
  tickflow::BroadcastHub hub(config(), clock);
  hub.add_symbol("SH600000");

  auto session = hub.connect();
  EXPECT_EQ(session->state(), SessionState::Connecting);
  EXPECT_EQ(hub.clientCount(), 1u);

  hub.publish(composite("SH600000", 10.0, 1));
  hub.publish(composite("SH600000", 11.0, 2));

  const json first = next_message(session);
  EXPECT_EQ(first["type"], "snapshot");
  EXPECT_TRUE(first["data"]["last"]["SH600000"]["tick"].is_null());

  EXPECT_EQ(next_message(session)["price"], 10.0);
  EXPECT_EQ(next_message(session)["price"], 11.0);
  EXPECT_TRUE(next_message(session).is_null());
  EXPECT_EQ(hub.published(), 2u);
}

// -----------------------------------------------------------------------------
// 2. A consumer joining mid-stream sees the latest state in its snapshot,
//    then only later ticks; never a tick before its snapshot.
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, LateJoinerGetsCurrentState) {
  tickflow::BroadcastHub hub(config(), clock);
  hub.add_symbol("SH600000");
  hub.publish(composite("SH600000", 10.0, 1));
  hub.publish(composite("SH600000", 12.5, 2));

  auto session = hub.connect();
  hub.publish(composite("SH600000", 13.0, 3));

  const json first = next_message(session);
  ASSERT_EQ(first["type"], "snapshot");
  EXPECT_EQ(first["data"]["last"]["SH600000"]["tick"]["price"], 12.5);
  EXPECT_EQ(first["data"]["provider_health"]["tick_count"]["SH600000"], 2);

  const json second = next_message(session);
  EXPECT_EQ(second["type"], "tick");
  EXPECT_EQ(second["price"], 13.0);
}

TEST_F(BroadcastHubTest, ConcurrentConnectsAlwaysStartWithSnapshot) {
  auto c = config();
  c.queue_capacity = 1024;
  tickflow::BroadcastHub hub(c, clock);
  hub.add_symbol("SH600000");

  std::atomic<bool> done{false};
  std::thread publisher([&] {
    for (int i = 1; !done.load(); ++i) {
      hub.publish(composite("SH600000", 10.0 + i % 7, i));
    }
  });

  std::vector<tickflow::BroadcastHub::SessionPtr> sessions;
  for (int i = 0; i < 50; ++i) {
    sessions.push_back(hub.connect());
    std::this_thread::sleep_for(100us);
  }
  done.store(true);
  publisher.join();

  for (auto& session : sessions) {
    EXPECT_EQ(next_message(session)["type"], "snapshot");
  }
}

// -----------------------------------------------------------------------------
// 3. Capacity 4: a session that never drains keeps its snapshot and only the
//    newest ticks.
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, FullQueueDropsOldestTicksButKeepsSnapshot) {
  tickflow::BroadcastHub hub(config(), clock);
  auto session = hub.connect();

  for (int i = 1; i <= 10; ++i) {
    hub.publish(composite("SH600000", static_cast<double>(i), i));
  }

  EXPECT_EQ(session->queued(), 4u);
  EXPECT_EQ(session->dropped(), 7u);  // ticks 1..7
  EXPECT_EQ(next_message(session)["type"], "snapshot");
  for (double expected : {8.0, 9.0, 10.0}) {
    EXPECT_EQ(next_message(session)["price"], expected);
  }

  // Once the snapshot is read, later overflow evicts the oldest tick.
  for (int i = 11; i <= 15; ++i) {
    hub.publish(composite("SH600000", static_cast<double>(i), i));
  }
  EXPECT_EQ(next_message(session)["price"], 12.0);
}

TEST_F(BroadcastHubTest, SnapshotSurvivesOverflowBeforeFirstRead) {
  auto c = config();
  c.queue_capacity = 1;
  tickflow::BroadcastHub hub(c, clock);
  auto session = hub.connect();

  for (int i = 1; i <= 5; ++i) {
    hub.publish(composite("SH600000", static_cast<double>(i), i));
  }
  EXPECT_EQ(next_message(session)["type"], "snapshot");
  EXPECT_TRUE(next_message(session).is_null());

  hub.publish(composite("SH600000", 6.0, 6));
  EXPECT_EQ(next_message(session)["price"], 6.0);
}

// -----------------------------------------------------------------------------
// 4. A stalled session neither blocks publish() nor delays a live one.
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, SlowConsumerDoesNotDelayOthers) {
  auto c = config();
  c.queue_capacity = 16;
  tickflow::BroadcastHub hub(c, clock);

  auto stalled = hub.connect();
  auto live = hub.connect();

  std::atomic<int> received{0};
  std::atomic<double> last_price{0.0};
  std::thread reader([&] {
    while (auto message = live->pop_for(2s)) {
      const json m = json::parse(**message);
      if (m["type"] == "tick") {
        last_price.store(m["price"].get<double>());
        ++received;
      }
    }
  });

  constexpr int kTicks = 2000;
  const auto begin = std::chrono::steady_clock::now();
  for (int i = 1; i <= kTicks; ++i) {
    hub.publish(composite("SH600000", static_cast<double>(i), i));
  }
  const auto publish_time = std::chrono::steady_clock::now() - begin;

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (last_price.load() < kTicks &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  hub.closeAll(CloseReason::ServerShutdown);
  reader.join();

  EXPECT_LT(publish_time, 1s);
  EXPECT_DOUBLE_EQ(last_price.load(), static_cast<double>(kTicks));
  EXPECT_EQ(stalled->queued(), 16u);
  EXPECT_GT(stalled->dropped(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Keepalive: expired sessions are reaped, touched ones survive.
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, ReapExpiredUsesKeepalive) {
  tickflow::BroadcastHub hub(config(), clock);
  auto silent = hub.connect();
  auto chatty = hub.connect();
  silent->transition(SessionState::Open);
  chatty->transition(SessionState::Open);

  clock.advance_by(40000);
  EXPECT_TRUE(hub.touch(chatty->id()));
  EXPECT_EQ(hub.reapExpired(), 0u);

  clock.advance_by(30000);  // silent: 70s, chatty: 30s
  EXPECT_EQ(hub.reapExpired(), 1u);
  EXPECT_EQ(hub.clientCount(), 1u);

  EXPECT_EQ(silent->state(), SessionState::Closing);
  EXPECT_EQ(silent->close_reason(), CloseReason::KeepaliveExpired);
  EXPECT_EQ(chatty->state(), SessionState::Open);
  EXPECT_FALSE(hub.touch(silent->id()));
}

TEST_F(BroadcastHubTest, ReaperThreadReapsOnItsOwn) {
  tickflow::BroadcastHub hub(config(), clock);
  auto session = hub.connect();
  hub.start_reaper();

  clock.advance_by(60001);
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (hub.clientCount() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  hub.stop_reaper();

  EXPECT_EQ(hub.clientCount(), 0u);
  EXPECT_EQ(session->close_reason(), CloseReason::KeepaliveExpired);
}

// -----------------------------------------------------------------------------
// 6. disconnect() and closeAll().
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, DisconnectAndCloseAll) {
  tickflow::BroadcastHub hub(config(), clock);
  auto a = hub.connect();
  auto b = hub.connect();
  auto c = hub.connect();
  EXPECT_NE(a->id(), b->id());

  hub.disconnect(a->id());
  EXPECT_EQ(a->close_reason(), CloseReason::ClientDisconnect);
  EXPECT_EQ(hub.clientCount(), 2u);
  hub.disconnect(a->id());  // already gone: no-op

  hub.publish(composite("SH600000", 10.0, 1));
  EXPECT_EQ(a->queued(), 1u);  // snapshot only
  EXPECT_EQ(b->queued(), 2u);

  hub.closeAll(CloseReason::ServerShutdown);
  EXPECT_EQ(hub.clientCount(), 0u);
  EXPECT_EQ(b->close_reason(), CloseReason::ServerShutdown);
  EXPECT_EQ(c->close_reason(), CloseReason::ServerShutdown);
}

// -----------------------------------------------------------------------------
// 7. Provider errors reach sessions and health; a tick clears last_error.
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, ErrorsUpdateHealth) {
  tickflow::BroadcastHub hub(config(), clock);
  hub.add_symbol("SH600000");
  auto session = hub.connect();
  next_message(session);  // snapshot

  hub.publishError("SH600000", "http 503", clock.now_ms());
  const json error = next_message(session);
  EXPECT_EQ(error["type"], "error");
  EXPECT_EQ(error["error"], "http 503");

  json health = hub.health();
  EXPECT_EQ(health["last_error"]["SH600000"], "http 503");
  EXPECT_TRUE(health["last_ok_ts"]["SH600000"].is_null());

  hub.publish(composite("SH600000", 10.0, clock.now_ms()));
  health = hub.health();
  EXPECT_TRUE(health["last_error"]["SH600000"].is_null());
  EXPECT_FALSE(health["last_ok_ts"]["SH600000"].is_null());
  EXPECT_EQ(health["tick_count"]["SH600000"], 1);
}

TEST_F(BroadcastHubTest, BrokerErrorsLeaveProviderHealthAlone) {
  tickflow::BroadcastHub hub(config(), clock);
  hub.add_symbol("SH600000");
  auto session = hub.connect();
  next_message(session);  // snapshot

  hub.publishError("SH600000", "broker reply timeout", clock.now_ms(),
                   tickflow::ErrorOrigin::Broker);
  const json error = next_message(session);
  EXPECT_EQ(error["type"], "error");
  EXPECT_EQ(error["error"], "broker reply timeout");

  EXPECT_TRUE(hub.health()["last_error"]["SH600000"].is_null());
  EXPECT_FALSE(hub.snapshot().health.at("SH600000").last_error.has_value());
}

// -----------------------------------------------------------------------------
// 8. Composites from different pipelines may arrive out of account order;
//    the stored account keeps the newest version.
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, AccountNeverStepsBack) {
  tickflow::BroadcastHub hub(config(), clock);

  auto newer = composite("SZ000001", 50.0, 2);
  newer.account.cash = 5000.0;
  newer.account.positions["SZ000001"] =
      tickflow::domain::Position{"SZ000001", 100.0, 50.0};
  newer.account.version = 7;

  auto older = composite("SH600000", 10.0, 1);
  older.account.cash = 10000.0;
  older.account.version = 5;

  hub.publish(newer);
  hub.publish(older);

  auto snap = hub.snapshot();
  EXPECT_DOUBLE_EQ(snap.account.cash, 5000.0);
  EXPECT_EQ(snap.account.positions.size(), 1u);
  EXPECT_EQ(snap.account.version, 7u);
  // The older composite still updates its own symbol.
  EXPECT_DOUBLE_EQ(snap.last.at("SH600000").tick->price, 10.0);

  auto later = composite("SH600000", 11.0, 3);
  later.account.cash = 4000.0;
  later.account.version = 8;
  hub.publish(later);
  EXPECT_DOUBLE_EQ(hub.snapshot().account.cash, 4000.0);

  // An explicit set_account() (engine start) always wins.
  tickflow::domain::AccountSnapshot idle;
  idle.cash = 100.0;
  hub.set_account(idle);
  EXPECT_DOUBLE_EQ(hub.snapshot().account.cash, 100.0);
}

// -----------------------------------------------------------------------------
// 9. Symbol registry and shutdown clearing.
// -----------------------------------------------------------------------------
TEST_F(BroadcastHubTest, RemoveSymbolAndClear) {
  tickflow::BroadcastHub hub(config(), clock);
  hub.add_symbol("SH600000");
  hub.add_symbol("SZ000001");
  hub.set_engine_running(true);
  hub.publish(composite("SZ000001", 9.0, 1));

  hub.remove_symbol("SZ000001");
  auto snap = hub.snapshot();
  EXPECT_EQ(snap.symbols, (std::vector<std::string>{"SH600000"}));
  EXPECT_EQ(snap.last.count("SZ000001"), 0u);
  EXPECT_TRUE(snap.engine_running);

  const json pulled = json::parse(hub.snapshotJson());
  EXPECT_EQ(pulled["symbols"], json::array({"SH600000"}));
  EXPECT_EQ(pulled["ts"], "2023-11-14T22:13:20.000Z");

  hub.clear();
  snap = hub.snapshot();
  EXPECT_TRUE(snap.symbols.empty());
  EXPECT_FALSE(snap.engine_running);
}
