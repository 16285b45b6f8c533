/*
 * 설명: 공유 저장소 모사 구현. 정렬 집합과 TTL 문자열 키를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/shared_store_test.cpp
 */
#include "telemetry/shared_store.hpp"

#include "telemetry/errors.hpp"

namespace telemetry {
namespace {
// SETEX가 이 횟수만큼 쌓이면 만료 키를 한 번에 정리한다.
constexpr std::size_t kPurgeEveryWrites = 256;
}  // namespace

bool SharedStore::SortedSetAdd(const std::string& key, const std::string& member, std::int64_t score) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto& set = sorted_sets_[key];
  auto it = set.scores.find(member);
  if (it != set.scores.end()) {
    set.ordered.erase({it->second, member});
    it->second = score;
    set.ordered.insert({score, member});
    return false;
  }
  set.scores.emplace(member, score);
  set.ordered.insert({score, member});
  return true;
}

bool SharedStore::SortedSetRemove(const std::string& key, const std::string& member) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto set_it = sorted_sets_.find(key);
  if (set_it == sorted_sets_.end()) {
    return false;
  }
  auto& set = set_it->second;
  auto it = set.scores.find(member);
  if (it == set.scores.end()) {
    return false;
  }
  set.ordered.erase({it->second, member});
  set.scores.erase(it);
  if (set.scores.empty()) {
    sorted_sets_.erase(set_it);
  }
  return true;
}

std::size_t SharedStore::SortedSetCount(const std::string& key, std::int64_t min_score,
                                        std::int64_t max_score) const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto set_it = sorted_sets_.find(key);
  if (set_it == sorted_sets_.end() || min_score > max_score) {
    return 0;
  }
  std::size_t count = 0;
  const auto& ordered = set_it->second.ordered;
  for (auto it = ordered.lower_bound({min_score, std::string{}}); it != ordered.end() && it->first <= max_score;
       ++it) {
    ++count;
  }
  return count;
}

std::size_t SharedStore::SortedSetRemoveRangeByScore(const std::string& key, std::int64_t min_score,
                                                     std::int64_t max_score) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto set_it = sorted_sets_.find(key);
  if (set_it == sorted_sets_.end() || min_score > max_score) {
    return 0;
  }
  auto& set = set_it->second;
  std::size_t removed = 0;
  auto it = set.ordered.lower_bound({min_score, std::string{}});
  while (it != set.ordered.end() && it->first <= max_score) {
    set.scores.erase(it->second);
    it = set.ordered.erase(it);
    ++removed;
  }
  if (set.scores.empty()) {
    sorted_sets_.erase(set_it);
  }
  return removed;
}

std::vector<std::pair<std::string, std::int64_t>> SharedStore::SortedSetMembers(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  std::vector<std::pair<std::string, std::int64_t>> members;
  auto set_it = sorted_sets_.find(key);
  if (set_it == sorted_sets_.end()) {
    return members;
  }
  members.reserve(set_it->second.ordered.size());
  for (const auto& [score, member] : set_it->second.ordered) {
    members.emplace_back(member, score);
  }
  return members;
}

std::size_t SharedStore::SortedSetSize(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto set_it = sorted_sets_.find(key);
  return set_it == sorted_sets_.end() ? 0 : set_it->second.scores.size();
}

std::vector<std::string> SharedStore::KeysWithPrefix(const std::string& prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  std::vector<std::string> keys;
  for (const auto& [key, set] : sorted_sets_) {
    if (key.compare(0, prefix.size(), prefix) == 0) {
      keys.push_back(key);
    }
  }
  return keys;
}

void SharedStore::SetWithTtl(const std::string& key, const std::string& value, std::chrono::seconds ttl,
                             Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  values_[key] = ValueEntry{value, now + ttl};
  if (++writes_since_purge_ >= kPurgeEveryWrites) {
    PurgeExpiredLocked(now);
  }
}

std::optional<std::string> SharedStore::Get(const std::string& key, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  if (it->second.expires_at <= now) {
    values_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

std::size_t SharedStore::PurgeExpired(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  return PurgeExpiredLocked(now);
}

std::size_t SharedStore::ValueCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.size();
}

std::size_t SharedStore::PurgeExpiredLocked(Clock::time_point now) {
  writes_since_purge_ = 0;
  std::size_t removed = 0;
  for (auto it = values_.begin(); it != values_.end();) {
    if (it->second.expires_at <= now) {
      it = values_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

bool SharedStore::Ping() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !(outage_injector_ && outage_injector_());
}

void SharedStore::SetOutageInjector(const std::function<bool()>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  outage_injector_ = injector;
}

void SharedStore::EnsureAvailable() const {
  if (outage_injector_ && outage_injector_()) {
    throw TransientStoreError("공유 저장소에 연결할 수 없습니다");
  }
}

}  // namespace telemetry
