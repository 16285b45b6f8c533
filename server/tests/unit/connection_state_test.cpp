#include <gtest/gtest.h>

#include "telemetry/connection_state.hpp"

namespace {

using telemetry::ConnectionState;
using telemetry::ConnectionStateMachine;

TEST(ConnectionStateTest, HappyPathReachesActive) {
  ConnectionStateMachine machine;
  EXPECT_EQ(machine.State(), ConnectionState::kConnecting);
  EXPECT_TRUE(machine.Transition(ConnectionState::kAuthenticated));
  EXPECT_TRUE(machine.Transition(ConnectionState::kSubscribed));
  EXPECT_TRUE(machine.Transition(ConnectionState::kActive));
  EXPECT_EQ(telemetry::ToString(machine.State()), "active");
}

TEST(ConnectionStateTest, ReconnectCycleGoesBackThroughSubscribed) {
  ConnectionStateMachine machine;
  machine.Transition(ConnectionState::kAuthenticated);
  machine.Transition(ConnectionState::kSubscribed);
  machine.Transition(ConnectionState::kActive);
  EXPECT_TRUE(machine.Transition(ConnectionState::kReconnecting));
  EXPECT_FALSE(machine.Transition(ConnectionState::kActive));
  EXPECT_TRUE(machine.Transition(ConnectionState::kSubscribed));
  EXPECT_TRUE(machine.Transition(ConnectionState::kActive));
}

TEST(ConnectionStateTest, IllegalTransitionsLeaveStateUnchanged) {
  ConnectionStateMachine machine;
  EXPECT_FALSE(machine.Transition(ConnectionState::kActive));
  EXPECT_FALSE(machine.Transition(ConnectionState::kSubscribed));
  EXPECT_EQ(machine.State(), ConnectionState::kConnecting);
  EXPECT_FALSE(telemetry::IsValidTransition(ConnectionState::kActive, ConnectionState::kAuthenticated));
}

TEST(ConnectionStateTest, AnyStateMayCloseAndClosedIsTerminal) {
  for (auto state : {ConnectionState::kConnecting, ConnectionState::kAuthenticated, ConnectionState::kSubscribed,
                     ConnectionState::kActive, ConnectionState::kReconnecting}) {
    EXPECT_TRUE(telemetry::IsValidTransition(state, ConnectionState::kClosed));
  }
  ConnectionStateMachine machine;
  EXPECT_TRUE(machine.Transition(ConnectionState::kClosed));
  EXPECT_TRUE(machine.IsClosed());
  EXPECT_FALSE(machine.Transition(ConnectionState::kClosed));
  EXPECT_FALSE(machine.Transition(ConnectionState::kAuthenticated));
}

}  // namespace
