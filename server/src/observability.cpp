/*
 * 설명: 구조화 JSON 로그와 텔레메트리 코어의 메트릭 카운터를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 */
#include "telemetry/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

#include "telemetry/api_response.hpp"

namespace telemetry {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : min_level_(min_level), sink_(&std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::IncrementEventsPublished() { events_published_.fetch_add(1); }

void Observability::AddEventsDropped(std::uint64_t count) { events_dropped_.fetch_add(count); }

void Observability::IncrementSnapshotsSent(std::uint64_t count) { snapshots_sent_.fetch_add(count); }

void Observability::IncrementTicksSkipped() { ticks_skipped_.fetch_add(1); }

void Observability::IncrementSlowConsumerCloses() { slow_consumer_closes_.fetch_add(1); }

void Observability::IncrementAuthFailures() { auth_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.events_published = events_published_.load();
  snapshot.events_dropped = events_dropped_.load();
  snapshot.snapshots_sent = snapshots_sent_.load();
  snapshot.ticks_skipped = ticks_skipped_.load();
  snapshot.slow_consumer_closes = slow_consumer_closes_.load();
  snapshot.isolation_violations = isolation_violations_.load();
  snapshot.auth_failures = auth_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(LogLevel::kInfo)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = "info";
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.organization_id) {
    log_json["organizationId"] = *ctx.organization_id;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  Write(log_json);
}

void Observability::Log(LogLevel level, std::string_view name, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["level"] = ToString(level);
  log_json["eventName"] = name;
  log_json["ts"] = FormatIsoTimestamp(std::chrono::system_clock::now());
  Write(log_json);
}

void Observability::SecurityEvent(std::string_view name, const nlohmann::json& fields) {
  isolation_violations_.fetch_add(1);
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["level"] = "warn";
  log_json["category"] = "security";
  log_json["eventName"] = name;
  log_json["ts"] = FormatIsoTimestamp(std::chrono::system_clock::now());
  Write(log_json);
}

void Observability::SetSink(std::ostream* sink) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  sink_ = sink ? sink : &std::cout;
}

void Observability::Write(const nlohmann::json& line) const {
  std::lock_guard<std::mutex> lock(write_mutex_);
  (*sink_) << line.dump() << std::endl;
}

}  // namespace telemetry
