/*
 * 설명: 조직 단위 접속(프레즌스) 집합을 공유 저장소의 정렬 집합으로 관리한다.
 *       하트비트가 끊긴 항목은 주기적인 스윕으로 제거한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "telemetry/observability.hpp"
#include "telemetry/shared_store.hpp"

namespace telemetry {

struct PresenceCount {
  std::string organization_id;
  std::size_t total_users;
};

struct RegistryHealth {
  bool store_reachable{false};
  std::size_t organization_count{0};
  std::size_t total_connections{0};
};

class ConnectionRegistry : public std::enable_shared_from_this<ConnectionRegistry> {
 public:
  using Clock = std::chrono::system_clock;

  ConnectionRegistry(boost::asio::io_context& ioc, std::shared_ptr<SharedStore> store,
                     std::shared_ptr<Observability> observability, std::chrono::seconds heartbeat_timeout,
                     std::chrono::seconds sweep_interval);

  // 아래 연산은 저장소 장애 시 TransientStoreError를 전파한다.
  void Register(const std::string& org_id, const std::string& user_id, const std::string& socket_id,
                Clock::time_point now = Clock::now());
  void Unregister(const std::string& org_id, const std::string& user_id, const std::string& socket_id);
  void Heartbeat(const std::string& org_id, const std::string& user_id, const std::string& socket_id,
                 Clock::time_point now = Clock::now());
  std::size_t CountActive(const std::string& org_id, std::chrono::seconds window,
                          Clock::time_point now = Clock::now()) const;
  std::size_t CountActive(const std::string& org_id, Clock::time_point now = Clock::now()) const;

  std::vector<std::string> OrganizationUsers(const std::string& org_id, Clock::time_point now = Clock::now()) const;
  bool IsUserOnline(const std::string& org_id, const std::string& user_id, Clock::time_point now = Clock::now()) const;
  // 활성 접속이 있는 조직 목록. 개수 내림차순, 동률이면 organizationId 오름차순.
  std::vector<PresenceCount> GlobalBreakdown(Clock::time_point now = Clock::now()) const;
  std::size_t ReapExpired(Clock::time_point now = Clock::now());
  RegistryHealth Health() const;

  std::chrono::seconds HeartbeatTimeout() const { return heartbeat_timeout_; }

  void StartSweep();
  void StopSweep();

 private:
  static std::string OrgKey(const std::string& org_id);
  static std::string Member(const std::string& user_id, const std::string& socket_id);
  void ScheduleSweep();
  void OnSweep(const boost::system::error_code& ec);

  boost::asio::steady_timer sweep_timer_;
  std::shared_ptr<SharedStore> store_;
  std::shared_ptr<Observability> observability_;
  std::chrono::seconds heartbeat_timeout_;
  std::chrono::seconds sweep_interval_;
  std::atomic<bool> sweeping_{false};
};

}  // namespace telemetry
