/*
 * 설명: 프레즌스 스냅샷 주기 브로드캐스트를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_scheduler_test.cpp
 */
#include "telemetry/broadcast_scheduler.hpp"

#include <optional>

#include "telemetry/api_response.hpp"
#include "telemetry/errors.hpp"

namespace telemetry {

nlohmann::json PresenceSnapshot::ToJson() const {
  return {{"organizationId", organization_id},
          {"totalUsers", total_users},
          {"timestamp", FormatIsoTimestamp(timestamp)}};
}

nlohmann::json GlobalPresenceSnapshot::ToJson() const {
  nlohmann::json orgs = nlohmann::json::array();
  for (const auto& entry : organizations) {
    orgs.push_back({{"organizationId", entry.organization_id}, {"totalUsers", entry.total_users}});
  }
  return {{"organizations", orgs},
          {"totalUsers", total_users},
          {"organizationCount", organizations.size()},
          {"timestamp", FormatIsoTimestamp(timestamp)}};
}

BroadcastScheduler::BroadcastScheduler(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                                       std::shared_ptr<PresenceSink> sink,
                                       std::shared_ptr<Observability> observability,
                                       std::chrono::milliseconds interval)
    : timer_(ioc), registry_(std::move(registry)), sink_(std::move(sink)), observability_(std::move(observability)),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(5000)) {}

void BroadcastScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  ScheduleTick();
}

void BroadcastScheduler::Stop() {
  running_ = false;
  timer_.cancel();
}

void BroadcastScheduler::ScheduleTick() {
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void BroadcastScheduler::OnTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  TickOnce();
  ScheduleTick();
}

bool BroadcastScheduler::TickOnce(Clock::time_point now) {
  tick_count_.fetch_add(1);
  std::vector<PresenceSnapshot> snapshots;
  std::optional<GlobalPresenceSnapshot> global;
  try {
    // 전부 계산한 뒤에만 밀어낸다. 장애가 나면 이번 틱은 아무것도 보내지 않는다.
    for (const auto& org_id : sink_->PresenceOrganizations()) {
      snapshots.push_back(BuildOrganizationSnapshot(org_id, now));
    }
    if (sink_->HasGlobalPresenceSubscribers()) {
      global = BuildGlobalSnapshot(now);
    }
  } catch (const TransientStoreError& ex) {
    observability_->IncrementTicksSkipped();
    observability_->Log(LogLevel::kWarn, "broadcast.tick_skipped", {{"reason", ex.what()}});
    return false;
  }

  for (const auto& snapshot : snapshots) {
    sink_->PushOrganizationSnapshot(snapshot);
  }
  if (global) {
    sink_->PushGlobalSnapshot(*global);
  }
  observability_->Log(LogLevel::kDebug, "broadcast.tick",
                      {{"organizations", snapshots.size()}, {"global", global.has_value()}});
  return true;
}

PresenceSnapshot BroadcastScheduler::BuildOrganizationSnapshot(const std::string& org_id, Clock::time_point now) {
  auto total = registry_->CountActive(org_id, now);
  return PresenceSnapshot{org_id, total, ClampTimestamp(org_id, now)};
}

GlobalPresenceSnapshot BroadcastScheduler::BuildGlobalSnapshot(Clock::time_point now) const {
  GlobalPresenceSnapshot snapshot;
  snapshot.organizations = registry_->GlobalBreakdown(now);
  snapshot.total_users = 0;
  for (const auto& entry : snapshot.organizations) {
    snapshot.total_users += entry.total_users;
  }
  snapshot.timestamp = now;
  return snapshot;
}

BroadcastScheduler::Clock::time_point BroadcastScheduler::ClampTimestamp(const std::string& org_id,
                                                                         Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& last = last_timestamps_[org_id];
  if (now < last) {
    return last;
  }
  last = now;
  return now;
}

}  // namespace telemetry
