/*
 * 설명: 고정 주기로 조직별 동시 접속 스냅샷(과 슈퍼 관리자용 전역 분포)을 만들어 게이트웨이로 밀어낸다.
 *       저장소 장애 시 해당 틱은 건너뛰고 타이머는 항상 다시 건다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_scheduler_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "telemetry/connection_registry.hpp"
#include "telemetry/observability.hpp"

namespace telemetry {

struct PresenceSnapshot {
  std::string organization_id;
  std::size_t total_users;
  std::chrono::system_clock::time_point timestamp;

  nlohmann::json ToJson() const;
};

struct GlobalPresenceSnapshot {
  std::vector<PresenceCount> organizations;
  std::size_t total_users;
  std::chrono::system_clock::time_point timestamp;

  nlohmann::json ToJson() const;
};

// 스냅샷 수신자. 구현은 큐에 넣기만 하고 즉시 반환해야 한다.
class PresenceSink {
 public:
  virtual ~PresenceSink() = default;

  virtual std::vector<std::string> PresenceOrganizations() const = 0;
  virtual bool HasGlobalPresenceSubscribers() const = 0;
  virtual void PushOrganizationSnapshot(const PresenceSnapshot& snapshot) = 0;
  virtual void PushGlobalSnapshot(const GlobalPresenceSnapshot& snapshot) = 0;
};

class BroadcastScheduler : public std::enable_shared_from_this<BroadcastScheduler> {
 public:
  using Clock = std::chrono::system_clock;

  BroadcastScheduler(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                     std::shared_ptr<PresenceSink> sink, std::shared_ptr<Observability> observability,
                     std::chrono::milliseconds interval);

  void Start();
  void Stop();

  // 한 틱을 즉시 수행한다. 저장소 장애로 건너뛰었으면 false.
  bool TickOnce(Clock::time_point now = Clock::now());

  // 저장소 장애 시 TransientStoreError를 던진다.
  PresenceSnapshot BuildOrganizationSnapshot(const std::string& org_id, Clock::time_point now = Clock::now());
  GlobalPresenceSnapshot BuildGlobalSnapshot(Clock::time_point now = Clock::now()) const;

  std::uint64_t TickCount() const { return tick_count_.load(); }
  std::chrono::milliseconds Interval() const { return interval_; }

 private:
  void ScheduleTick();
  void OnTick(const boost::system::error_code& ec);
  Clock::time_point ClampTimestamp(const std::string& org_id, Clock::time_point now);

  boost::asio::steady_timer timer_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<PresenceSink> sink_;
  std::shared_ptr<Observability> observability_;
  std::chrono::milliseconds interval_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> tick_count_{0};
  std::unordered_map<std::string, Clock::time_point> last_timestamps_;
  std::mutex mutex_;
};

}  // namespace telemetry
