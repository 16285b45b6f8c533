/*
 * 설명: 텔레메트리 코어 서버 전체 수명주기와 서비스 조립을 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp, server/tests/e2e/admin_api_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "telemetry/auth.hpp"
#include "telemetry/broadcast_scheduler.hpp"
#include "telemetry/config.hpp"
#include "telemetry/connection_registry.hpp"
#include "telemetry/db_client.hpp"
#include "telemetry/event_bus.hpp"
#include "telemetry/geo_aggregator.hpp"
#include "telemetry/geo_database.hpp"
#include "telemetry/geo_resolver.hpp"
#include "telemetry/observability.hpp"
#include "telemetry/realtime.hpp"
#include "telemetry/session_geo_repository.hpp"
#include "telemetry/session_geo_tracker.hpp"
#include "telemetry/shared_store.hpp"

namespace telemetry {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<AuthService> GetAuthService() { return auth_service_; }
  std::shared_ptr<SharedStore> GetSharedStore() { return store_; }
  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<AnalyticsEventBus> GetEventBus() { return event_bus_; }
  std::shared_ptr<BroadcastScheduler> GetScheduler() { return scheduler_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<GeoResolver> GetGeoResolver() { return geo_resolver_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void LoadGeoDatabase();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<AuthService> auth_service_;
  std::shared_ptr<SharedStore> store_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<AnalyticsEventBus> event_bus_;
  std::shared_ptr<GeoDatabase> geo_database_;
  std::shared_ptr<GeoResolver> geo_resolver_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<SessionGeoRepository> geo_repository_;
  std::shared_ptr<SessionGeoTracker> geo_tracker_;
  std::shared_ptr<GeoAggregator> geo_aggregator_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<BroadcastScheduler> scheduler_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace telemetry
