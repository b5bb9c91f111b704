#include "h2rpc/connection-idle-observer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include "h2rpc/channel.hpp"
#include "h2rpc/client-connection-config.hpp"
#include "h2rpc/connection-backoff.hpp"
#include "h2rpc/connection-keepalive.hpp"
#include "h2rpc/connection-manager.hpp"
#include "h2rpc/fake-channel.hpp"
#include "h2rpc/manual-scheduler.hpp"
#include "h2rpc/status.hpp"

namespace h2rpc {

namespace {

using namespace std::chrono_literals;

constexpr auto kIdleTimeout = 5min;
constexpr auto kPingInterval = 10s;
constexpr auto kPingTimeout = 5s;

using Ping = test::FakeChannel::Ping;

constexpr Ping kKeepalivePing{ConnectionIdleObserver::kClientPingData, false};

}  // namespace

class ConnectionIdleObserverTest : public ::testing::Test {
 protected:
  ConnectionIdleObserverTest() {
    manager.getChannel([](const ChannelPtr&, const Status&) {});
    observer.channelActive(channel);
  }

  test::ManualScheduler scheduler;
  test::FakeConnector connector;
  ConnectionManager manager{scheduler, connector, ConnectionBackoff{}};
  std::shared_ptr<test::FakeChannel> channel = test::FakeChannel::Make();
  ConnectionIdleObserver observer{scheduler, manager, kIdleTimeout};
};

TEST_F(ConnectionIdleObserverTest, ChannelActiveIsForwarded) {
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::notReady);
  EXPECT_EQ(manager.state(), ConnectionManager::State::active);
  EXPECT_FALSE(observer.idleTimerScheduled());
}

TEST_F(ConnectionIdleObserverTest, FirstSettingsMakesReady) {
  observer.settingsReceived();
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::ready);
  EXPECT_EQ(manager.state(), ConnectionManager::State::ready);
  EXPECT_TRUE(observer.idleTimerScheduled());

  // Later SETTINGS frames are ignored.
  observer.settingsReceived();
  EXPECT_EQ(manager.state(), ConnectionManager::State::ready);
}

TEST_F(ConnectionIdleObserverTest, IdleTimeoutClosesConnectionOnce) {
  observer.settingsReceived();
  scheduler.advance(kIdleTimeout - 1s);
  EXPECT_FALSE(channel->closed());
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::ready);

  scheduler.advance(1s);
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);
  EXPECT_EQ(channel->nbCloseCalls(), 1U);

  scheduler.advance(kIdleTimeout * 2);
  EXPECT_EQ(channel->nbCloseCalls(), 1U);
}

TEST_F(ConnectionIdleObserverTest, StreamCreatedCancelsIdleTimer) {
  observer.settingsReceived();
  observer.streamCreated(1);
  EXPECT_FALSE(observer.idleTimerScheduled());
  EXPECT_EQ(observer.activeStreams(), 1U);
  scheduler.advance(kIdleTimeout * 2);
  EXPECT_FALSE(channel->closed());
}

TEST_F(ConnectionIdleObserverTest, LastStreamClosedSchedulesIdleTimer) {
  observer.settingsReceived();
  observer.streamCreated(1);
  observer.streamCreated(3);
  observer.streamClosed(1);
  EXPECT_FALSE(observer.idleTimerScheduled());
  observer.streamClosed(3);
  EXPECT_TRUE(observer.idleTimerScheduled());
  EXPECT_EQ(observer.activeStreams(), 0U);

  scheduler.advance(kIdleTimeout / 2);
  observer.streamCreated(5);
  scheduler.advance(kIdleTimeout);
  EXPECT_FALSE(channel->closed());

  observer.streamClosed(5);
  scheduler.advance(kIdleTimeout);
  EXPECT_TRUE(channel->closed());
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);
}

TEST_F(ConnectionIdleObserverTest, UnbalancedStreamClosedIsIgnored) {
  observer.settingsReceived();
  observer.streamClosed(1);
  EXPECT_EQ(observer.activeStreams(), 0U);
  EXPECT_TRUE(observer.idleTimerScheduled());
}

TEST_F(ConnectionIdleObserverTest, GoAwayWithoutStreamsClosesOnNextTick) {
  observer.settingsReceived();
  observer.goAwayReceived();
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);
  EXPECT_FALSE(observer.idleTimerScheduled());
  EXPECT_FALSE(channel->closed());

  scheduler.runPending();
  EXPECT_EQ(channel->nbCloseCalls(), 1U);
}

TEST_F(ConnectionIdleObserverTest, GoAwayWithActiveStreamsIsIgnored) {
  observer.settingsReceived();
  observer.streamCreated(1);
  observer.goAwayReceived();
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::ready);
  scheduler.runPending();
  EXPECT_FALSE(channel->closed());

  observer.streamClosed(1);
  EXPECT_TRUE(observer.idleTimerScheduled());
}

TEST_F(ConnectionIdleObserverTest, GoAwayBeforeReady) {
  observer.goAwayReceived();
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(manager.state(), ConnectionManager::State::active);
  scheduler.runPending();
  EXPECT_TRUE(channel->closed());

  // The manager learns about the closed channel when it becomes inactive.
  observer.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::transientFailure);
}

TEST_F(ConnectionIdleObserverTest, ChannelInactiveIsForwarded) {
  observer.settingsReceived();
  observer.streamCreated(1);
  observer.channelInactive();
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(manager.state(), ConnectionManager::State::transientFailure);
  EXPECT_FALSE(observer.idleTimerScheduled());
}

TEST_F(ConnectionIdleObserverTest, ChannelInactiveAfterIdleIsNotForwarded) {
  observer.settingsReceived();
  scheduler.advance(kIdleTimeout);
  ASSERT_EQ(manager.state(), ConnectionManager::State::idle);

  // A new connection may already be in progress when the old one goes away.
  manager.getChannel([](const ChannelPtr&, const Status&) {});
  ASSERT_EQ(manager.state(), ConnectionManager::State::connecting);
  EXPECT_NO_THROW(observer.channelInactive());
  EXPECT_EQ(manager.state(), ConnectionManager::State::connecting);
}

TEST_F(ConnectionIdleObserverTest, EventsAfterCloseAreIgnored) {
  observer.settingsReceived();
  observer.goAwayReceived();
  observer.streamCreated(1);
  EXPECT_EQ(observer.activeStreams(), 0U);
  observer.streamClosed(1);
  observer.goAwayReceived();
  observer.settingsReceived();
  EXPECT_FALSE(observer.idleTimerScheduled());
  scheduler.advance(kIdleTimeout);
  EXPECT_EQ(channel->nbCloseCalls(), 1U);
}

TEST(ConnectionIdleObserver, NoIdleTimeout) {
  test::ManualScheduler scheduler;
  ConnectionIdleObserver observer(scheduler, ConnectionIdleObserver::kNoIdleTimeout);
  auto channel = test::FakeChannel::Make();
  observer.channelActive(channel);
  observer.settingsReceived();
  EXPECT_FALSE(observer.idleTimerScheduled());
  scheduler.advance(24h);
  EXPECT_FALSE(channel->closed());
}

TEST(ConnectionIdleObserver, ServerRole) {
  test::ManualScheduler scheduler;
  ConnectionIdleObserver observer(scheduler, 1min);
  auto channel = test::FakeChannel::Make();
  observer.channelActive(channel);
  observer.settingsReceived();
  observer.streamCreated(1);
  observer.streamClosed(1);
  scheduler.advance(1min);
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(channel->nbCloseCalls(), 1U);
  observer.channelInactive();
}

TEST(ConnectionIdleObserver, DestructionCancelsIdleTimer) {
  test::ManualScheduler scheduler;
  auto channel = test::FakeChannel::Make();
  {
    ConnectionIdleObserver observer(scheduler, 1min);
    observer.channelActive(channel);
    observer.settingsReceived();
  }
  scheduler.advance(2min);
  EXPECT_FALSE(channel->closed());
}

class ConnectionIdleObserverKeepaliveTest : public ::testing::Test {
 protected:
  explicit ConnectionIdleObserverKeepaliveTest(
      ConnectionKeepalive keepalive = ConnectionKeepalive{}.withInterval(kPingInterval).withTimeout(kPingTimeout))
      : observer(scheduler, manager, kIdleTimeout, keepalive) {
    manager.getChannel([](const ChannelPtr&, const Status&) {});
    observer.channelActive(channel);
    observer.settingsReceived();
  }

  // Acknowledges every keepalive ping sent so far.
  void acknowledgePings() {
    for (const Ping& ping : channel->pings()) {
      if (!ping.ack) {
        observer.pingReceived(ping.opaqueData, true);
      }
    }
  }

  test::ManualScheduler scheduler;
  test::FakeConnector connector;
  ConnectionManager manager{scheduler, connector, ConnectionBackoff{}};
  std::shared_ptr<test::FakeChannel> channel = test::FakeChannel::Make();
  ConnectionIdleObserver observer;
};

TEST_F(ConnectionIdleObserverKeepaliveTest, PingsStartWithFirstStream) {
  scheduler.advance(kPingInterval * 3);
  EXPECT_TRUE(channel->pings().empty());

  observer.streamCreated(1);
  scheduler.advance(kPingInterval - 1s);
  EXPECT_TRUE(channel->pings().empty());
  scheduler.advance(1s);
  EXPECT_EQ(channel->pings(), std::vector<Ping>{kKeepalivePing});
  EXPECT_TRUE(observer.pingTimeoutScheduled());
}

TEST_F(ConnectionIdleObserverKeepaliveTest, AcknowledgedPingsKeepConnectionOpen) {
  observer.streamCreated(1);
  for (int pingPos = 1; pingPos <= 4; ++pingPos) {
    scheduler.advance(kPingInterval);
    ASSERT_EQ(channel->pings().size(), static_cast<std::size_t>(pingPos));
    observer.pingReceived(ConnectionIdleObserver::kClientPingData, true);
    EXPECT_FALSE(observer.pingTimeoutScheduled());
  }
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::ready);
  EXPECT_FALSE(channel->closed());
}

TEST_F(ConnectionIdleObserverKeepaliveTest, UnacknowledgedPingClosesWithoutIdling) {
  observer.streamCreated(1);
  scheduler.advance(kPingInterval);
  scheduler.advance(kPingTimeout - 1s);
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::ready);

  scheduler.advance(1s);
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(channel->nbCloseCalls(), 1U);
  // A dead connection is not idle: the manager waits for the channel to become inactive and reconnects.
  EXPECT_EQ(manager.state(), ConnectionManager::State::ready);

  observer.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::transientFailure);

  scheduler.advance(kPingInterval * 2);
  EXPECT_EQ(channel->pings().size(), 1U);
}

TEST_F(ConnectionIdleObserverKeepaliveTest, AcknowledgmentOfUnknownPingIsIgnored) {
  observer.streamCreated(1);
  scheduler.advance(kPingInterval);
  observer.pingReceived(ConnectionIdleObserver::kClientPingData + 1, true);
  EXPECT_TRUE(observer.pingTimeoutScheduled());
  scheduler.advance(kPingTimeout);
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
}

TEST_F(ConnectionIdleObserverKeepaliveTest, PeerPingIsAcknowledged) {
  observer.pingReceived(42, false);
  EXPECT_EQ(channel->pings(), (std::vector<Ping>{Ping{42, true}}));
  EXPECT_FALSE(observer.pingTimeoutScheduled());
}

TEST_F(ConnectionIdleObserverKeepaliveTest, NoPingWithoutCallsByDefault) {
  observer.streamCreated(1);
  observer.streamClosed(1);
  scheduler.advance(kPingInterval * 3);
  EXPECT_TRUE(channel->pings().empty());
  EXPECT_FALSE(channel->closed());

  observer.streamCreated(3);
  scheduler.advance(kPingInterval);
  EXPECT_EQ(channel->pings(), std::vector<Ping>{kKeepalivePing});
}

TEST_F(ConnectionIdleObserverKeepaliveTest, IdleTimeoutCancelsKeepalive) {
  observer.streamCreated(1);
  observer.streamClosed(1);
  scheduler.advance(kIdleTimeout);
  ASSERT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);
  EXPECT_FALSE(observer.pingTimeoutScheduled());
}

class ConnectionIdleObserverKeepaliveWithoutCallsTest : public ConnectionIdleObserverKeepaliveTest {
 protected:
  ConnectionIdleObserverKeepaliveWithoutCallsTest()
      : ConnectionIdleObserverKeepaliveTest(ConnectionKeepalive{}
                                                .withInterval(kPingInterval)
                                                .withTimeout(kPingTimeout)
                                                .withPermitWithoutCalls()
                                                .withMaxPingsWithoutData(2)
                                                .withMinSentPingIntervalWithoutData(25s)) {
    observer.streamCreated(1);
    observer.streamClosed(1);
  }
};

TEST_F(ConnectionIdleObserverKeepaliveWithoutCallsTest, MinimumIntervalBetweenPings) {
  scheduler.advance(kPingInterval);
  EXPECT_EQ(channel->pings().size(), 1U);
  acknowledgePings();

  // 10s and 20s after the last ping: too early.
  scheduler.advance(kPingInterval * 2);
  EXPECT_EQ(channel->pings().size(), 1U);

  scheduler.advance(kPingInterval);
  EXPECT_EQ(channel->pings().size(), 2U);
  acknowledgePings();
  EXPECT_FALSE(channel->closed());
}

TEST_F(ConnectionIdleObserverKeepaliveWithoutCallsTest, LimitedNumberOfPingsWithoutData) {
  for (int tick = 0; tick < 12; ++tick) {
    scheduler.advance(kPingInterval);
    acknowledgePings();
  }
  EXPECT_EQ(channel->pings().size(), 2U);
  EXPECT_FALSE(channel->closed());

  // A new stream resets the count.
  observer.streamCreated(3);
  scheduler.advance(kPingInterval);
  EXPECT_EQ(channel->pings().size(), 3U);
}

TEST(ConnectionIdleObserver, KeepaliveFromManagerConfig) {
  test::ManualScheduler scheduler;
  test::FakeConnector connector;
  ClientConnectionConfig config;
  config.withIdleTimeout(1min).withKeepalive(
      ConnectionKeepalive{}.withInterval(kPingInterval).withTimeout(kPingTimeout));
  ConnectionManager manager(scheduler, connector, config);
  ConnectionIdleObserver observer(scheduler, manager);

  manager.getChannel([](const ChannelPtr&, const Status&) {});
  auto channel = test::FakeChannel::Make();
  observer.channelActive(channel);
  observer.settingsReceived();
  observer.streamCreated(1);
  scheduler.advance(kPingInterval);
  EXPECT_EQ(channel->pings(), std::vector<Ping>{kKeepalivePing});
  observer.pingReceived(ConnectionIdleObserver::kClientPingData, true);

  observer.streamClosed(1);
  scheduler.advance(1min);
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);
}

TEST(ConnectionIdleObserver, ServerRolePingData) {
  test::ManualScheduler scheduler;
  ConnectionIdleObserver observer(scheduler, ConnectionIdleObserver::kNoIdleTimeout,
                                  ConnectionKeepalive{}.withInterval(kPingInterval).withTimeout(kPingTimeout));
  auto channel = test::FakeChannel::Make();
  observer.channelActive(channel);
  observer.settingsReceived();
  observer.streamCreated(1);
  scheduler.advance(kPingInterval);
  EXPECT_EQ(channel->pings(), (std::vector<Ping>{Ping{ConnectionIdleObserver::kServerPingData, false}}));

  // The acknowledgment of the client keepalive ping does not match.
  observer.pingReceived(ConnectionIdleObserver::kClientPingData, true);
  scheduler.advance(kPingTimeout);
  EXPECT_EQ(observer.state(), ConnectionIdleObserver::State::closed);
  EXPECT_EQ(channel->nbCloseCalls(), 1U);
}

}  // namespace h2rpc
