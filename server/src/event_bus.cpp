/*
 * 설명: 분석 이벤트 발행/구독과 조직별 FIFO 링 버퍼를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_bus_test.cpp
 */
#include "telemetry/event_bus.hpp"

#include <algorithm>
#include <sstream>

#include "telemetry/api_response.hpp"

namespace telemetry {

nlohmann::json AnalyticsEvent::ToJson() const {
  nlohmann::json j{{"id", id},
                   {"type", ToString(type)},
                   {"organizationId", organization_id},
                   {"timestamp", FormatIsoTimestamp(timestamp)},
                   {"data", payload}};
  if (metadata) {
    nlohmann::json meta = nlohmann::json::object();
    if (metadata->user_id) {
      meta["userId"] = *metadata->user_id;
    }
    if (metadata->session_id) {
      meta["sessionId"] = *metadata->session_id;
    }
    if (metadata->source) {
      meta["source"] = *metadata->source;
    }
    j["metadata"] = meta;
  }
  return j;
}

AnalyticsEventBus::AnalyticsEventBus(std::shared_ptr<Observability> observability, std::size_t buffer_capacity)
    : observability_(std::move(observability)),
      buffer_capacity_(buffer_capacity == 0 ? kDefaultBufferCapacity : buffer_capacity) {}

std::optional<AnalyticsEvent> AnalyticsEventBus::Publish(const std::string& org_id, EventType type,
                                                         const nlohmann::json& payload,
                                                         const std::optional<EventMetadata>& metadata) {
  AnalyticsEvent event;
  std::vector<EventHandler> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outage_injector_ && outage_injector_()) {
      if (observability_) {
        observability_->Log(LogLevel::kWarn, "analytics.publish_skipped",
                            {{"organizationId", org_id}, {"type", ToString(type)}, {"reason", "broker_unavailable"}});
      }
      return std::nullopt;
    }
    auto now = std::chrono::system_clock::now();
    event = AnalyticsEvent{NextEventId(now), type, org_id, now, payload, metadata};
    AppendToRing(recent_by_org_[org_id], event);
    AppendToRing(recent_global_, event);
    for (const auto& [id, subscriber] : subscribers_) {
      // 조직 채널 구독자는 자신의 조직 이벤트만 받는다.
      if (subscriber.organization_id && *subscriber.organization_id != event.organization_id) {
        continue;
      }
      targets.push_back(subscriber.handler);
    }
  }

  for (const auto& handler : targets) {
    handler(event);
  }
  if (observability_) {
    observability_->IncrementEventsPublished();
    observability_->Log(LogLevel::kDebug, "analytics.published",
                        {{"eventId", event.id},
                         {"type", ToString(type)},
                         {"organizationId", org_id},
                         {"deliveries", targets.size()}});
  }
  return event;
}

SubscriptionId AnalyticsEventBus::SubscribeOrganization(const std::string& org_id, EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_subscription_id_++;
  subscribers_.emplace(id, Subscriber{org_id, std::move(handler)});
  return id;
}

SubscriptionId AnalyticsEventBus::SubscribeGlobal(EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_subscription_id_++;
  subscribers_.emplace(id, Subscriber{std::nullopt, std::move(handler)});
  return id;
}

void AnalyticsEventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(id);
}

std::vector<AnalyticsEvent> AnalyticsEventBus::GetRecent(const std::string& org_id, std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = recent_by_org_.find(org_id);
  if (it == recent_by_org_.end()) {
    return {};
  }
  return TakeRecent(it->second, limit);
}

std::vector<AnalyticsEvent> AnalyticsEventBus::GetRecentGlobal(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return TakeRecent(recent_global_, limit);
}

std::size_t AnalyticsEventBus::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

void AnalyticsEventBus::SetOutageInjector(const std::function<bool()>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  outage_injector_ = injector;
}

std::string AnalyticsEventBus::NextEventId(std::chrono::system_clock::time_point now) {
  std::ostringstream oss;
  oss << "evt_" << std::hex << ToEpochMillis(now) << "_" << ++event_counter_;
  return oss.str();
}

void AnalyticsEventBus::AppendToRing(std::deque<AnalyticsEvent>& ring, const AnalyticsEvent& event) {
  ring.push_back(event);
  while (ring.size() > buffer_capacity_) {
    ring.pop_front();
  }
}

std::vector<AnalyticsEvent> AnalyticsEventBus::TakeRecent(const std::deque<AnalyticsEvent>& ring,
                                                          std::size_t limit) {
  auto count = std::min(limit, ring.size());
  return {ring.end() - static_cast<std::ptrdiff_t>(count), ring.end()};
}

}  // namespace telemetry
