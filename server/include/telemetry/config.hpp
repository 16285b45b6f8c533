/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace telemetry {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string auth_token_secret;
  std::size_t handshake_timeout_seconds;
  std::size_t heartbeat_timeout_seconds;
  std::size_t presence_sweep_interval_seconds;
  std::size_t broadcast_interval_ms;
  std::size_t ws_queue_soft_limit;
  std::size_t ws_queue_hard_limit;
  std::size_t ws_queue_limit_bytes;
  std::size_t event_buffer_capacity;
  std::string geoip_db_path;
  std::size_t geo_cache_ttl_seconds;
  bool geo_truncate_ip;
  std::string ip_hash_salt;
  std::size_t heatmap_max_points;
  std::size_t geo_worker_threads;
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

}  // namespace telemetry
