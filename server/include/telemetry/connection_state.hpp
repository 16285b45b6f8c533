/*
 * 설명: 게이트웨이 연결 상태 머신.
 *       CONNECTING → AUTHENTICATED → SUBSCRIBED → ACTIVE ⇄ RECONNECTING, 어느 상태에서든 CLOSED.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_state_test.cpp
 */
#pragma once

#include <string_view>

namespace telemetry {

enum class ConnectionState { kConnecting, kAuthenticated, kSubscribed, kActive, kReconnecting, kClosed };

std::string_view ToString(ConnectionState state);
bool IsValidTransition(ConnectionState from, ConnectionState to);

class ConnectionStateMachine {
 public:
  ConnectionState State() const { return state_; }
  // 허용되지 않는 전이는 상태를 바꾸지 않고 false를 반환한다.
  bool Transition(ConnectionState next);
  bool IsClosed() const { return state_ == ConnectionState::kClosed; }

 private:
  ConnectionState state_{ConnectionState::kConnecting};
};

}  // namespace telemetry
