/*
 * 설명: 여러 게이트웨이 인스턴스가 공유하는 저장소(Redis)를 모사한다.
 *       정렬 집합(ZADD/ZREM/ZCOUNT/ZREMRANGEBYSCORE)과 TTL 문자열(SETEX/GET)을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/shared_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace telemetry {

class SharedStore {
 public:
  using Clock = std::chrono::system_clock;

  // 모든 연산은 단일 뮤텍스 아래에서 원자적으로 수행된다.
  // 반환값: 새 멤버면 true, 점수만 갱신했으면 false.
  bool SortedSetAdd(const std::string& key, const std::string& member, std::int64_t score);
  bool SortedSetRemove(const std::string& key, const std::string& member);
  std::size_t SortedSetCount(const std::string& key, std::int64_t min_score, std::int64_t max_score) const;
  std::size_t SortedSetRemoveRangeByScore(const std::string& key, std::int64_t min_score, std::int64_t max_score);
  std::vector<std::pair<std::string, std::int64_t>> SortedSetMembers(const std::string& key) const;
  std::size_t SortedSetSize(const std::string& key) const;
  std::vector<std::string> KeysWithPrefix(const std::string& prefix) const;

  void SetWithTtl(const std::string& key, const std::string& value, std::chrono::seconds ttl,
                  Clock::time_point now = Clock::now());
  std::optional<std::string> Get(const std::string& key, Clock::time_point now = Clock::now());
  // 만료된 TTL 키를 모두 지우고 지운 개수를 반환한다.
  std::size_t PurgeExpired(Clock::time_point now = Clock::now());
  std::size_t ValueCount() const;

  bool Ping() const;

  // true를 반환하는 동안 모든 연산이 TransientStoreError를 던진다.
  void SetOutageInjector(const std::function<bool()>& injector);

 private:
  struct SortedSet {
    std::unordered_map<std::string, std::int64_t> scores;
    std::set<std::pair<std::int64_t, std::string>> ordered;
  };

  struct ValueEntry {
    std::string value;
    Clock::time_point expires_at;
  };

  void EnsureAvailable() const;
  std::size_t PurgeExpiredLocked(Clock::time_point now);

  std::unordered_map<std::string, SortedSet> sorted_sets_;
  std::unordered_map<std::string, ValueEntry> values_;
  std::size_t writes_since_purge_{0};
  std::function<bool()> outage_injector_;
  mutable std::mutex mutex_;
};

}  // namespace telemetry
