/*
 * 설명: 구조화 JSON 로그와 텔레메트리 코어의 메트릭 카운터를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace telemetry {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> organization_id;
  std::optional<std::string> session_id;
  std::string name;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t events_published{0};
  std::uint64_t events_dropped{0};
  std::uint64_t snapshots_sent{0};
  std::uint64_t ticks_skipped{0};
  std::uint64_t slow_consumer_closes{0};
  std::uint64_t isolation_violations{0};
  std::uint64_t auth_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementEventsPublished();
  void AddEventsDropped(std::uint64_t count);
  void IncrementSnapshotsSent(std::uint64_t count = 1);
  void IncrementTicksSkipped();
  void IncrementSlowConsumerCloses();
  void IncrementAuthFailures();
  MetricsSnapshot Snapshot() const;

  // HTTP 요청 단위 액세스 로그.
  void Log(const LogContext& ctx) const;
  // 이름이 있는 이벤트 로그. fields는 객체여야 하며 그대로 병합된다.
  void Log(LogLevel level, std::string_view name, const nlohmann::json& fields = nlohmann::json::object()) const;
  // 테넌트 격리 위반 등 보안 이벤트. 항상 기록되고 카운터를 올린다.
  void SecurityEvent(std::string_view name, const nlohmann::json& fields);

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void SetSink(std::ostream* sink);

 private:
  void Write(const nlohmann::json& line) const;

  LogLevel min_level_;
  std::ostream* sink_;
  mutable std::mutex write_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> events_published_{0};
  std::atomic<std::uint64_t> events_dropped_{0};
  std::atomic<std::uint64_t> snapshots_sent_{0};
  std::atomic<std::uint64_t> ticks_skipped_{0};
  std::atomic<std::uint64_t> slow_consumer_closes_{0};
  std::atomic<std::uint64_t> isolation_violations_{0};
  std::atomic<std::uint64_t> auth_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace telemetry
