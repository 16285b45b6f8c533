/*
 * 설명: 서버 수명주기, 서비스 조립, 리스닝 스레드를 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp, server/tests/e2e/admin_api_test.cpp
 */
#include "telemetry/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "telemetry/http_session.hpp"

namespace telemetry {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           HttpServices services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), services_(std::move(services)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  HttpServices services_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  auth_service_ = std::make_shared<AuthService>(AuthConfig{config.auth_token_secret});
  store_ = std::make_shared<SharedStore>();
  registry_ = std::make_shared<ConnectionRegistry>(ioc_, store_, observability_,
                                                   std::chrono::seconds(config.heartbeat_timeout_seconds),
                                                   std::chrono::seconds(config.presence_sweep_interval_seconds));
  event_bus_ = std::make_shared<AnalyticsEventBus>(observability_, config.event_buffer_capacity);

  geo_database_ = std::make_shared<GeoDatabase>();
  LoadGeoDatabase();
  GeoResolverConfig resolver_config;
  resolver_config.cache_ttl = std::chrono::seconds(config.geo_cache_ttl_seconds);
  resolver_config.truncate_ip = config.geo_truncate_ip;
  resolver_config.hash_salt = config.ip_hash_salt;
  resolver_config.worker_threads = config.geo_worker_threads;
  geo_resolver_ = std::make_shared<GeoResolver>(geo_database_, store_, observability_, resolver_config);

  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  geo_repository_ = std::make_shared<SessionGeoRepository>(db_client_);
  geo_tracker_ = std::make_shared<SessionGeoTracker>(geo_resolver_, geo_repository_, observability_);
  geo_aggregator_ = std::make_shared<GeoAggregator>(
      geo_repository_, GeoAggregatorConfig{.grid_degrees = 0.1, .heatmap_max_points = config.heatmap_max_points});

  coordinator_ = std::make_shared<RealtimeCoordinator>();
  coordinator_->SetObservability(observability_);
  scheduler_ = std::make_shared<BroadcastScheduler>(ioc_, registry_, coordinator_, observability_,
                                                    std::chrono::milliseconds(config.broadcast_interval_ms));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::LoadGeoDatabase() {
  if (config_.geoip_db_path.empty()) {
    observability_->Log(LogLevel::kWarn, "geo.database_missing", {{"reason", "GEOIP_DB_PATH가 비어 있습니다"}});
    return;
  }
  GeoDatabaseLoadResult result;
  std::string error_message;
  if (!geo_database_->LoadFile(config_.geoip_db_path, result, error_message)) {
    // 지오 DB 없이도 서버는 뜬다. 모든 조회가 unknown으로 귀결된다.
    observability_->Log(LogLevel::kWarn, "geo.database_missing",
                        {{"path", config_.geoip_db_path}, {"reason", error_message}});
    return;
  }
  observability_->Log(LogLevel::kInfo, "geo.database_loaded",
                      {{"path", config_.geoip_db_path}, {"loaded", result.loaded}, {"rejected", result.rejected}});
}

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    HttpServices services{auth_service_,
                          GatewayServices{registry_, event_bus_, scheduler_, coordinator_, observability_},
                          store_,
                          geo_resolver_,
                          geo_tracker_,
                          geo_aggregator_};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, std::move(services));
    listener_->Run();
    registry_->StartSweep();
    scheduler_->Start();
    observability_->Log(LogLevel::kInfo, "server.started", {{"port", config_.port}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  coordinator_->CloseAll("server_shutdown");
  scheduler_->Stop();
  registry_->StopSweep();
  geo_resolver_->Shutdown();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&get_env](const char* key, const char* def) {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.auth_token_secret = get_env("AUTH_TOKEN_SECRET", "");
  cfg.handshake_timeout_seconds = get_size("HANDSHAKE_TIMEOUT_SECONDS", "10");
  cfg.heartbeat_timeout_seconds = get_size("HEARTBEAT_TIMEOUT_SECONDS", "30");
  cfg.presence_sweep_interval_seconds = get_size("PRESENCE_SWEEP_INTERVAL_SECONDS", "10");
  cfg.broadcast_interval_ms = get_size("BROADCAST_INTERVAL_MS", "5000");
  cfg.ws_queue_soft_limit = get_size("WS_QUEUE_SOFT_LIMIT", "64");
  cfg.ws_queue_hard_limit = get_size("WS_QUEUE_HARD_LIMIT", "256");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "1048576");
  cfg.event_buffer_capacity = get_size("EVENT_BUFFER_CAPACITY", "100");
  cfg.geoip_db_path = get_env("GEOIP_DB_PATH", "data/geo_ranges.csv");
  cfg.geo_cache_ttl_seconds = get_size("GEO_CACHE_TTL_SECONDS", "86400");
  cfg.geo_truncate_ip = get_env("GEO_TRUNCATE_IP", "true") != "false";
  cfg.ip_hash_salt = get_env("IP_HASH_SALT", "telemetry-geoip-salt");
  cfg.heatmap_max_points = get_size("HEATMAP_MAX_POINTS", "500");
  cfg.geo_worker_threads = get_size("GEO_WORKER_THREADS", "2");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

}  // namespace telemetry
