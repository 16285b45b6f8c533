/*
 * 설명: 조직 채널과 전역 채널로 분석 이벤트를 팬아웃하고 조직별 최근 이벤트 링 버퍼를 유지한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_bus_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "telemetry/event_types.hpp"
#include "telemetry/observability.hpp"

namespace telemetry {

struct EventMetadata {
  std::optional<std::string> user_id;
  std::optional<std::string> session_id;
  std::optional<std::string> source;
};

struct AnalyticsEvent {
  std::string id;
  EventType type;
  std::string organization_id;
  std::chrono::system_clock::time_point timestamp;
  nlohmann::json payload;
  std::optional<EventMetadata> metadata;

  nlohmann::json ToJson() const;
};

using EventHandler = std::function<void(const AnalyticsEvent&)>;
using SubscriptionId = std::uint64_t;

class AnalyticsEventBus {
 public:
  static constexpr std::size_t kDefaultBufferCapacity = 100;

  AnalyticsEventBus(std::shared_ptr<Observability> observability, std::size_t buffer_capacity);

  // 브로커 장애 시 발행을 건너뛰고 nullopt를 반환한다. 예외를 던지지 않는다.
  std::optional<AnalyticsEvent> Publish(const std::string& org_id, EventType type, const nlohmann::json& payload,
                                        const std::optional<EventMetadata>& metadata = std::nullopt);

  // 핸들러는 발행 스레드에서 동기 호출된다. 핸들러는 큐에 넣기만 하고 즉시 반환해야 한다.
  SubscriptionId SubscribeOrganization(const std::string& org_id, EventHandler handler);
  SubscriptionId SubscribeGlobal(EventHandler handler);
  void Unsubscribe(SubscriptionId id);

  // 최신 limit개를 오래된 것부터 반환한다.
  std::vector<AnalyticsEvent> GetRecent(const std::string& org_id, std::size_t limit) const;
  std::vector<AnalyticsEvent> GetRecentGlobal(std::size_t limit) const;

  std::size_t SubscriberCount() const;
  std::size_t BufferCapacity() const { return buffer_capacity_; }
  void SetOutageInjector(const std::function<bool()>& injector);

 private:
  struct Subscriber {
    std::optional<std::string> organization_id;
    EventHandler handler;
  };

  std::string NextEventId(std::chrono::system_clock::time_point now);
  void AppendToRing(std::deque<AnalyticsEvent>& ring, const AnalyticsEvent& event);
  static std::vector<AnalyticsEvent> TakeRecent(const std::deque<AnalyticsEvent>& ring, std::size_t limit);

  std::shared_ptr<Observability> observability_;
  std::size_t buffer_capacity_;
  SubscriptionId next_subscription_id_{1};
  std::uint64_t event_counter_{0};
  std::map<SubscriptionId, Subscriber> subscribers_;
  std::unordered_map<std::string, std::deque<AnalyticsEvent>> recent_by_org_;
  std::deque<AnalyticsEvent> recent_global_;
  std::function<bool()> outage_injector_;
  mutable std::mutex mutex_;
};

}  // namespace telemetry
