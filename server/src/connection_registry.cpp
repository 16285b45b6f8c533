/*
 * 설명: 조직 단위 프레즌스 등록/해제/하트비트/집계와 만료 스윕을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "telemetry/connection_registry.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include "telemetry/api_response.hpp"
#include "telemetry/errors.hpp"

namespace telemetry {
namespace {
constexpr char kPresencePrefix[] = "presence:org:";
constexpr std::int64_t kMinScore = std::numeric_limits<std::int64_t>::min();
}  // namespace

ConnectionRegistry::ConnectionRegistry(boost::asio::io_context& ioc, std::shared_ptr<SharedStore> store,
                                       std::shared_ptr<Observability> observability,
                                       std::chrono::seconds heartbeat_timeout, std::chrono::seconds sweep_interval)
    : sweep_timer_(ioc), store_(std::move(store)), observability_(std::move(observability)),
      heartbeat_timeout_(heartbeat_timeout), sweep_interval_(sweep_interval) {}

std::string ConnectionRegistry::OrgKey(const std::string& org_id) { return kPresencePrefix + org_id; }

std::string ConnectionRegistry::Member(const std::string& user_id, const std::string& socket_id) {
  return user_id + ":" + socket_id;
}

void ConnectionRegistry::Register(const std::string& org_id, const std::string& user_id, const std::string& socket_id,
                                  Clock::time_point now) {
  bool added = store_->SortedSetAdd(OrgKey(org_id), Member(user_id, socket_id), ToEpochMillis(now));
  if (observability_) {
    observability_->Log(LogLevel::kDebug, "presence.register",
                        {{"organizationId", org_id}, {"userId", user_id}, {"socketId", socket_id}, {"added", added}});
  }
}

void ConnectionRegistry::Unregister(const std::string& org_id, const std::string& user_id,
                                    const std::string& socket_id) {
  bool removed = store_->SortedSetRemove(OrgKey(org_id), Member(user_id, socket_id));
  if (observability_) {
    observability_->Log(LogLevel::kDebug, "presence.unregister",
                        {{"organizationId", org_id}, {"userId", user_id}, {"socketId", socket_id}, {"removed", removed}});
  }
}

void ConnectionRegistry::Heartbeat(const std::string& org_id, const std::string& user_id,
                                   const std::string& socket_id, Clock::time_point now) {
  // ZADD와 같은 의미: 이미 스윕된 항목이면 다시 살아난다.
  store_->SortedSetAdd(OrgKey(org_id), Member(user_id, socket_id), ToEpochMillis(now));
}

std::size_t ConnectionRegistry::CountActive(const std::string& org_id, std::chrono::seconds window,
                                            Clock::time_point now) const {
  auto max_score = ToEpochMillis(now);
  auto min_score = max_score - std::chrono::duration_cast<std::chrono::milliseconds>(window).count();
  return store_->SortedSetCount(OrgKey(org_id), min_score, max_score);
}

std::size_t ConnectionRegistry::CountActive(const std::string& org_id, Clock::time_point now) const {
  return CountActive(org_id, heartbeat_timeout_, now);
}

std::vector<std::string> ConnectionRegistry::OrganizationUsers(const std::string& org_id,
                                                               Clock::time_point now) const {
  auto min_score = ToEpochMillis(now - heartbeat_timeout_);
  auto max_score = ToEpochMillis(now);
  std::set<std::string> users;
  for (const auto& [member, score] : store_->SortedSetMembers(OrgKey(org_id))) {
    if (score < min_score || score > max_score) {
      continue;
    }
    auto pos = member.rfind(':');
    users.insert(pos == std::string::npos ? member : member.substr(0, pos));
  }
  return {users.begin(), users.end()};
}

bool ConnectionRegistry::IsUserOnline(const std::string& org_id, const std::string& user_id,
                                      Clock::time_point now) const {
  auto users = OrganizationUsers(org_id, now);
  return std::binary_search(users.begin(), users.end(), user_id);
}

std::vector<PresenceCount> ConnectionRegistry::GlobalBreakdown(Clock::time_point now) const {
  std::vector<PresenceCount> breakdown;
  const std::string prefix = kPresencePrefix;
  for (const auto& key : store_->KeysWithPrefix(prefix)) {
    auto org_id = key.substr(prefix.size());
    auto count = CountActive(org_id, now);
    if (count > 0) {
      breakdown.push_back(PresenceCount{org_id, count});
    }
  }
  std::sort(breakdown.begin(), breakdown.end(), [](const PresenceCount& a, const PresenceCount& b) {
    if (a.total_users != b.total_users) {
      return a.total_users > b.total_users;
    }
    return a.organization_id < b.organization_id;
  });
  return breakdown;
}

std::size_t ConnectionRegistry::ReapExpired(Clock::time_point now) {
  // now - timeout 보다 엄격히 오래된 점수만 제거한다. 경계값은 CountActive 창에 포함된다.
  auto cutoff = ToEpochMillis(now - heartbeat_timeout_) - 1;
  std::size_t removed = 0;
  for (const auto& key : store_->KeysWithPrefix(kPresencePrefix)) {
    removed += store_->SortedSetRemoveRangeByScore(key, kMinScore, cutoff);
  }
  if (removed > 0 && observability_) {
    observability_->Log(LogLevel::kInfo, "presence.reaped", {{"removed", removed}});
  }
  return removed;
}

RegistryHealth ConnectionRegistry::Health() const {
  RegistryHealth health;
  health.store_reachable = store_->Ping();
  if (!health.store_reachable) {
    return health;
  }
  try {
    auto keys = store_->KeysWithPrefix(kPresencePrefix);
    health.organization_count = keys.size();
    for (const auto& key : keys) {
      health.total_connections += store_->SortedSetSize(key);
    }
  } catch (const TransientStoreError&) {
    health.store_reachable = false;
  }
  return health;
}

void ConnectionRegistry::StartSweep() {
  if (sweeping_.exchange(true)) {
    return;
  }
  ScheduleSweep();
}

void ConnectionRegistry::StopSweep() {
  sweeping_ = false;
  sweep_timer_.cancel();
}

void ConnectionRegistry::ScheduleSweep() {
  sweep_timer_.expires_after(sweep_interval_);
  auto self = shared_from_this();
  sweep_timer_.async_wait([self](const boost::system::error_code& ec) { self->OnSweep(ec); });
}

void ConnectionRegistry::OnSweep(const boost::system::error_code& ec) {
  if (ec || !sweeping_) {
    return;
  }
  try {
    ReapExpired();
    auto purged = store_->PurgeExpired();
    if (purged > 0 && observability_) {
      observability_->Log(LogLevel::kDebug, "store.ttl_purged", {{"removed", purged}});
    }
  } catch (const TransientStoreError& ex) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "presence.sweep_skipped", {{"reason", ex.what()}});
    }
  }
  ScheduleSweep();
}

}  // namespace telemetry
