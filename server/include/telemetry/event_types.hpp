/*
 * 설명: 분석 이벤트 유형의 닫힌 집합과 구독 필터(비트셋)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_bus_test.cpp
 */
#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace telemetry {

enum class EventType : std::uint8_t {
  kMeetingStarted,
  kMeetingEnded,
  kMeetingParticipantJoined,
  kMeetingParticipantLeft,
  kTranscriptionStarted,
  kTranscriptionProgress,
  kTranscriptionCompleted,
  kTranscriptionFailed,
  kAiProcessingStarted,
  kAiProcessingCompleted,
  kAiInsightGenerated,
  kUserLogin,
  kUserLogout,
  kUserActivity,
  kApiRequest,
  kApiError,
  kIntegrationSyncStarted,
  kIntegrationSyncCompleted,
  kIntegrationError,
  kBillingPaymentReceived,
  kBillingSubscriptionChanged,
  kAlertTriggered,
  kSystemHealthChange,
};

inline constexpr std::size_t kEventTypeCount = static_cast<std::size_t>(EventType::kSystemHealthChange) + 1;

std::string_view ToString(EventType type);
std::optional<EventType> ParseEventType(std::string_view text);

// 비어 있는 필터는 모든 유형을 통과시킨다.
class EventTypeFilter {
 public:
  EventTypeFilter() = default;
  explicit EventTypeFilter(const std::vector<EventType>& types);

  void Add(EventType type);
  bool Matches(EventType type) const;
  bool MatchesAll() const { return bits_.none(); }
  std::vector<EventType> Types() const;

 private:
  std::bitset<kEventTypeCount> bits_;
};

}  // namespace telemetry
