#include "h2rpc/connection-manager.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "h2rpc/channel.hpp"
#include "h2rpc/client-connection-config.hpp"
#include "h2rpc/connection-backoff.hpp"
#include "h2rpc/connectivity-state-monitor.hpp"
#include "h2rpc/connectivity-state.hpp"
#include "h2rpc/exception.hpp"
#include "h2rpc/fake-channel.hpp"
#include "h2rpc/invalid-state-error.hpp"
#include "h2rpc/manual-scheduler.hpp"
#include "h2rpc/status-code.hpp"
#include "h2rpc/status.hpp"
#include "h2rpc/timedef.hpp"

namespace h2rpc {

namespace {

using namespace std::chrono_literals;

class RecordingDelegate : public ConnectivityStateDelegate {
 public:
  void connectivityStateDidChange(ConnectivityState /*oldState*/, ConnectivityState newState) override {
    states.push_back(newState);
  }

  std::vector<ConnectivityState> states;
};

struct WaiterOutcome {
  ChannelPtr channel;
  Status status;
  int nbCalls{};
};

}  // namespace

class ConnectionManagerTest : public ::testing::Test {
 protected:
  explicit ConnectionManagerTest(std::optional<ConnectionBackoff> backoff = ConnectionBackoff{})
      : manager(scheduler, connector, std::move(backoff), &delegate) {}

  ConnectionManager::ChannelWaiter waiter(WaiterOutcome& outcome) {
    return [&outcome](const ChannelPtr& channel, const Status& status) {
      outcome.channel = channel;
      outcome.status = status;
      ++outcome.nbCalls;
    };
  }

  // Drives the manager up to the ready state and returns its channel.
  std::shared_ptr<test::FakeChannel> makeReady() {
    manager.getChannel(waiter(readyOutcome));
    auto channel = test::FakeChannel::Make();
    manager.channelActive(channel);
    manager.ready();
    return channel;
  }

  test::ManualScheduler scheduler;
  test::FakeConnector connector;
  RecordingDelegate delegate;
  ConnectionManager manager;
  WaiterOutcome readyOutcome;
};

class ConnectionManagerNoBackoffTest : public ConnectionManagerTest {
 protected:
  ConnectionManagerNoBackoffTest() : ConnectionManagerTest(std::nullopt) {}
};

TEST_F(ConnectionManagerTest, StartsIdle) {
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);
  EXPECT_EQ(manager.connectivityState(), ConnectivityState::idle);
  EXPECT_EQ(connector.nbAttempts(), 0U);
}

TEST_F(ConnectionManagerTest, GetChannelConnectsAndWaitsForReady) {
  WaiterOutcome outcome;
  manager.getChannel(waiter(outcome));
  EXPECT_EQ(manager.state(), ConnectionManager::State::connecting);
  ASSERT_EQ(connector.nbAttempts(), 1U);
  ASSERT_TRUE(connector.attempts()[0]);
  EXPECT_DOUBLE_EQ(connector.attempts()[0]->count(), 20.0);

  auto channel = test::FakeChannel::Make();
  manager.channelActive(channel);
  EXPECT_EQ(manager.state(), ConnectionManager::State::active);
  EXPECT_EQ(manager.connectivityState(), ConnectivityState::connecting);
  EXPECT_EQ(outcome.nbCalls, 0);
  EXPECT_EQ(manager.getOptimisticChannel(), channel);

  manager.ready();
  EXPECT_EQ(manager.state(), ConnectionManager::State::ready);
  EXPECT_EQ(outcome.nbCalls, 1);
  EXPECT_EQ(outcome.channel, channel);
  EXPECT_TRUE(outcome.status.isOk());
  EXPECT_EQ(delegate.states, (std::vector<ConnectivityState>{ConnectivityState::connecting, ConnectivityState::ready}));
}

TEST_F(ConnectionManagerTest, GetChannelWhenReadyCompletesImmediately) {
  auto channel = makeReady();
  WaiterOutcome outcome;
  manager.getChannel(waiter(outcome));
  EXPECT_EQ(outcome.nbCalls, 1);
  EXPECT_EQ(outcome.channel, channel);
  EXPECT_EQ(connector.nbAttempts(), 1U);
}

TEST_F(ConnectionManagerTest, SeveralWaitersShareOneAttempt) {
  WaiterOutcome first;
  WaiterOutcome second;
  manager.getChannel(waiter(first));
  manager.getChannel(waiter(second));
  EXPECT_EQ(connector.nbAttempts(), 1U);
  manager.channelActive(test::FakeChannel::Make());
  manager.ready();
  EXPECT_EQ(first.nbCalls, 1);
  EXPECT_EQ(second.nbCalls, 1);
  EXPECT_EQ(first.channel, second.channel);
}

TEST_F(ConnectionManagerTest, OptimisticChannelStartsConnecting) {
  EXPECT_EQ(manager.getOptimisticChannel(), nullptr);
  EXPECT_EQ(manager.state(), ConnectionManager::State::connecting);
  EXPECT_EQ(connector.nbAttempts(), 1U);
}

TEST_F(ConnectionManagerTest, IdleFromReady) {
  makeReady();
  manager.idle();
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);
  EXPECT_EQ(manager.connectivityState(), ConnectivityState::idle);

  // The idled channel becoming inactive is expected.
  manager.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);

  // A new channel is created on demand.
  EXPECT_EQ(manager.getOptimisticChannel(), nullptr);
  EXPECT_EQ(connector.nbAttempts(), 2U);
  auto channel = test::FakeChannel::Make();
  manager.channelActive(channel);
  EXPECT_EQ(manager.state(), ConnectionManager::State::active);
  EXPECT_EQ(manager.getOptimisticChannel(), channel);
}

TEST_F(ConnectionManagerTest, ConnectionFailureReconnectsAfterBackoff) {
  WaiterOutcome outcome;
  manager.getChannel(waiter(outcome));
  manager.connectionFailed("connection refused");
  EXPECT_EQ(manager.state(), ConnectionManager::State::transientFailure);
  EXPECT_EQ(manager.connectivityState(), ConnectivityState::transientFailure);
  EXPECT_EQ(outcome.nbCalls, 0);

  // First backoff is exactly the initial one.
  scheduler.advance(999ms);
  EXPECT_EQ(connector.nbAttempts(), 1U);
  scheduler.advance(1ms);
  EXPECT_EQ(connector.nbAttempts(), 2U);
  EXPECT_EQ(manager.state(), ConnectionManager::State::connecting);

  manager.channelActive(test::FakeChannel::Make());
  manager.ready();
  EXPECT_EQ(outcome.nbCalls, 1);
  EXPECT_TRUE(outcome.status.isOk());
}

TEST_F(ConnectionManagerTest, WaiterRegisteredDuringTransientFailure) {
  manager.getChannel(waiter(readyOutcome));
  manager.connectionFailed("refused");
  WaiterOutcome late;
  manager.getChannel(waiter(late));
  EXPECT_EQ(connector.nbAttempts(), 1U);
  scheduler.advance(1s);
  manager.channelActive(test::FakeChannel::Make());
  manager.ready();
  EXPECT_EQ(readyOutcome.nbCalls, 1);
  EXPECT_EQ(late.nbCalls, 1);
}

TEST_F(ConnectionManagerTest, InactiveBeforeReadyReconnectsAfterBackoff) {
  manager.getChannel(waiter(readyOutcome));
  manager.channelActive(test::FakeChannel::Make());
  manager.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::transientFailure);
  scheduler.advance(1s);
  EXPECT_EQ(connector.nbAttempts(), 2U);
}

TEST_F(ConnectionManagerTest, InactiveWhenReadyReconnectsImmediately) {
  makeReady();
  manager.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::transientFailure);
  EXPECT_EQ(manager.connectivityState(), ConnectivityState::transientFailure);
  scheduler.runPending();
  EXPECT_EQ(manager.state(), ConnectionManager::State::connecting);
  EXPECT_EQ(connector.nbAttempts(), 2U);
}

TEST_F(ConnectionManagerTest, RetryBudgetExhaustionShutsDown) {
  ConnectionManager limited(scheduler, connector,
                            ConnectionBackoff{}.withRetries(ConnectionBackoff::Retries::UpTo(1)).withJitter(0));
  WaiterOutcome outcome;
  limited.getChannel(waiter(outcome));
  ASSERT_EQ(connector.nbAttempts(), 1U);
  EXPECT_TRUE(connector.attempts()[0]);

  limited.connectionFailed("refused");
  EXPECT_EQ(limited.state(), ConnectionManager::State::transientFailure);
  scheduler.advance(1s);
  ASSERT_EQ(connector.nbAttempts(), 2U);
  // Last attempt, without budget left.
  EXPECT_FALSE(connector.attempts()[1]);

  limited.connectionFailed("refused again");
  EXPECT_EQ(limited.state(), ConnectionManager::State::shutdown);
  EXPECT_EQ(limited.connectivityState(), ConnectivityState::shutdown);
  EXPECT_EQ(outcome.nbCalls, 1);
  EXPECT_EQ(outcome.channel, nullptr);
  EXPECT_EQ(outcome.status.code(), StatusCode::unavailable);
  EXPECT_EQ(outcome.status.message(), "refused again");
}

TEST_F(ConnectionManagerNoBackoffTest, ConnectionFailureShutsDown) {
  WaiterOutcome outcome;
  manager.getChannel(waiter(outcome));
  ASSERT_EQ(connector.nbAttempts(), 1U);
  EXPECT_FALSE(connector.attempts()[0]);
  manager.connectionFailed("refused");
  EXPECT_EQ(manager.state(), ConnectionManager::State::shutdown);
  EXPECT_EQ(outcome.nbCalls, 1);
  EXPECT_EQ(outcome.status.code(), StatusCode::unavailable);
}

TEST_F(ConnectionManagerNoBackoffTest, InactiveWhenReadyShutsDown) {
  makeReady();
  manager.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::shutdown);
  scheduler.runPending();
  EXPECT_EQ(connector.nbAttempts(), 1U);
}

TEST_F(ConnectionManagerNoBackoffTest, InactiveBeforeReadyShutsDown) {
  manager.getChannel(waiter(readyOutcome));
  manager.channelActive(test::FakeChannel::Make());
  manager.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::shutdown);
  EXPECT_EQ(readyOutcome.nbCalls, 1);
  EXPECT_EQ(readyOutcome.channel, nullptr);
}

TEST_F(ConnectionManagerTest, ShutdownWhenReadyClosesChannel) {
  auto channel = makeReady();
  manager.shutdown();
  EXPECT_EQ(manager.state(), ConnectionManager::State::shutdown);
  EXPECT_EQ(channel->nbCloseCalls(), 1U);

  // Closing the channel makes it inactive.
  manager.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::shutdown);

  manager.shutdown();
  EXPECT_EQ(channel->nbCloseCalls(), 1U);
  EXPECT_EQ(delegate.states.back(), ConnectivityState::shutdown);
}

TEST_F(ConnectionManagerTest, ShutdownWhileConnecting) {
  manager.getChannel(waiter(readyOutcome));
  manager.shutdown();
  EXPECT_EQ(readyOutcome.nbCalls, 1);
  EXPECT_EQ(readyOutcome.channel, nullptr);
  EXPECT_EQ(readyOutcome.status.code(), StatusCode::unavailable);

  // The attempt completing later is closed right away.
  auto channel = test::FakeChannel::Make();
  manager.channelActive(channel);
  EXPECT_TRUE(channel->closed());
  manager.connectionFailed("too late");
  manager.ready();
  EXPECT_EQ(manager.state(), ConnectionManager::State::shutdown);
}

TEST_F(ConnectionManagerTest, ShutdownWhileActiveClosesCandidate) {
  manager.getChannel(waiter(readyOutcome));
  auto channel = test::FakeChannel::Make();
  manager.channelActive(channel);
  manager.shutdown();
  EXPECT_TRUE(channel->closed());
  EXPECT_EQ(readyOutcome.nbCalls, 1);
  EXPECT_EQ(readyOutcome.channel, nullptr);
}

TEST_F(ConnectionManagerTest, ShutdownCancelsScheduledReconnect) {
  manager.getChannel(waiter(readyOutcome));
  manager.connectionFailed("refused");
  manager.shutdown();
  EXPECT_EQ(readyOutcome.nbCalls, 1);
  scheduler.advance(10s);
  EXPECT_EQ(connector.nbAttempts(), 1U);
  EXPECT_EQ(manager.state(), ConnectionManager::State::shutdown);
}

TEST_F(ConnectionManagerTest, GetChannelAfterShutdownFailsImmediately) {
  manager.shutdown();
  WaiterOutcome outcome;
  manager.getChannel(waiter(outcome));
  EXPECT_EQ(outcome.nbCalls, 1);
  EXPECT_EQ(outcome.channel, nullptr);
  EXPECT_EQ(outcome.status.code(), StatusCode::unavailable);
  EXPECT_EQ(manager.getOptimisticChannel(), nullptr);
  EXPECT_EQ(connector.nbAttempts(), 0U);
}

TEST_F(ConnectionManagerTest, InvalidTransitionsThrow) {
  EXPECT_THROW(manager.ready(), InvalidStateError);
  EXPECT_THROW(manager.idle(), InvalidStateError);
  EXPECT_THROW(manager.channelActive(test::FakeChannel::Make()), InvalidStateError);
  EXPECT_THROW(manager.connectionFailed("not connecting"), InvalidStateError);
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);

  manager.getChannel(waiter(readyOutcome));
  EXPECT_THROW(manager.channelInactive(), InvalidStateError);
  EXPECT_THROW(manager.ready(), InvalidStateError);
  EXPECT_THROW(manager.idle(), InvalidStateError);
  EXPECT_EQ(manager.state(), ConnectionManager::State::connecting);
}

TEST_F(ConnectionManagerTest, InactiveWhileIdleIsIgnored) {
  manager.channelInactive();
  EXPECT_EQ(manager.state(), ConnectionManager::State::idle);
}

TEST_F(ConnectionManagerTest, MonitorCallbacks) {
  int nbReady = 0;
  manager.monitor().onNext(ConnectivityState::ready, [&nbReady] { ++nbReady; });
  makeReady();
  EXPECT_EQ(nbReady, 1);
}

TEST(ConnectionManager, ConstructedFromConfig) {
  test::ManualScheduler scheduler;
  test::FakeConnector connector;
  ClientConnectionConfig config;
  config.withConnectionBackoff(std::nullopt).withIdleTimeout(30s).withMaxReceiveMessageLength(1024);
  ConnectionManager manager(scheduler, connector, config);
  EXPECT_FALSE(manager.config().connectionBackoff);
  EXPECT_EQ(manager.config().idleTimeout, 30s);
  EXPECT_EQ(manager.config().maxReceiveMessageLength, 1024U);

  // Without backoff, the single attempt does not time out and its failure shuts down.
  manager.getChannel([](const ChannelPtr&, const Status&) {});
  ASSERT_EQ(connector.nbAttempts(), 1U);
  EXPECT_FALSE(connector.attempts()[0]);
  manager.connectionFailed("refused");
  EXPECT_EQ(manager.state(), ConnectionManager::State::shutdown);
}

TEST(ConnectionManager, InvalidConfigThrows) {
  test::ManualScheduler scheduler;
  test::FakeConnector connector;
  EXPECT_THROW(ConnectionManager(scheduler, connector, ClientConnectionConfig{}.withIdleTimeout(0s)), exception);
  EXPECT_THROW(ConnectionManager(scheduler, connector, ConnectionBackoff{}.withMultiplier(0.5)), exception);
}

}  // namespace h2rpc
