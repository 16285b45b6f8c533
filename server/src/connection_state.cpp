/*
 * 설명: 연결 상태 전이 규칙을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_state_test.cpp
 */
#include "telemetry/connection_state.hpp"

namespace telemetry {

std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kAuthenticated:
      return "authenticated";
    case ConnectionState::kSubscribed:
      return "subscribed";
    case ConnectionState::kActive:
      return "active";
    case ConnectionState::kReconnecting:
      return "reconnecting";
    case ConnectionState::kClosed:
      return "closed";
  }
  return "closed";
}

bool IsValidTransition(ConnectionState from, ConnectionState to) {
  if (from == ConnectionState::kClosed) {
    return false;
  }
  if (to == ConnectionState::kClosed) {
    return true;
  }
  switch (from) {
    case ConnectionState::kConnecting:
      return to == ConnectionState::kAuthenticated;
    case ConnectionState::kAuthenticated:
      return to == ConnectionState::kSubscribed;
    case ConnectionState::kSubscribed:
      return to == ConnectionState::kActive || to == ConnectionState::kReconnecting;
    case ConnectionState::kActive:
      return to == ConnectionState::kReconnecting;
    case ConnectionState::kReconnecting:
      return to == ConnectionState::kSubscribed;
    case ConnectionState::kClosed:
      return false;
  }
  return false;
}

bool ConnectionStateMachine::Transition(ConnectionState next) {
  if (!IsValidTransition(state_, next)) {
    return false;
  }
  state_ = next;
  return true;
}

}  // namespace telemetry
