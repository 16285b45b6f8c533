/*
 * 설명: 분석 이벤트 유형 문자열 변환과 구독 필터 평가를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_bus_test.cpp
 */
#include "telemetry/event_types.hpp"

#include <array>

namespace telemetry {
namespace {
constexpr std::array<std::string_view, kEventTypeCount> kEventTypeNames{
    "meeting:started",
    "meeting:ended",
    "meeting:participant_joined",
    "meeting:participant_left",
    "transcription:started",
    "transcription:progress",
    "transcription:completed",
    "transcription:failed",
    "ai:processing_started",
    "ai:processing_completed",
    "ai:insight_generated",
    "user:login",
    "user:logout",
    "user:activity",
    "api:request",
    "api:error",
    "integration:sync_started",
    "integration:sync_completed",
    "integration:error",
    "billing:payment_received",
    "billing:subscription_changed",
    "alert:triggered",
    "system:health_change",
};
}  // namespace

std::string_view ToString(EventType type) { return kEventTypeNames[static_cast<std::size_t>(type)]; }

std::optional<EventType> ParseEventType(std::string_view text) {
  for (std::size_t i = 0; i < kEventTypeNames.size(); ++i) {
    if (kEventTypeNames[i] == text) {
      return static_cast<EventType>(i);
    }
  }
  return std::nullopt;
}

EventTypeFilter::EventTypeFilter(const std::vector<EventType>& types) {
  for (auto type : types) {
    Add(type);
  }
}

void EventTypeFilter::Add(EventType type) { bits_.set(static_cast<std::size_t>(type)); }

bool EventTypeFilter::Matches(EventType type) const {
  return bits_.none() || bits_.test(static_cast<std::size_t>(type));
}

std::vector<EventType> EventTypeFilter::Types() const {
  std::vector<EventType> types;
  for (std::size_t i = 0; i < kEventTypeCount; ++i) {
    if (bits_.test(i)) {
      types.push_back(static_cast<EventType>(i));
    }
  }
  return types;
}

}  // namespace telemetry
