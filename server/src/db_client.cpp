/*
 * 설명: MariaDB 연결과 재시도 로직을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 */
#include "telemetry/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace telemetry {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::ConnectionHandle MariaDbClient::Connect() const {
  ConnectionHandle conn(mysql_init(nullptr));
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout_seconds);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &config_.query_timeout_seconds);
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  if (mysql_set_character_set(conn.get(), "utf8mb4") != 0) {
    RaiseError(conn.get(), "문자셋 설정 실패");
  }
  return conn;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    try {
      auto conn = Connect();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      work(conn.get());
      return;
    } catch (const DbException& ex) {
      if (ex.retryable && attempt < kMaxAttempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    }
  }
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
    RaiseError(conn, ctx);
  }
}

void MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx,
                          const RowHandler& on_row) const {
  Execute(conn, sql, ctx);
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  std::unique_ptr<MYSQL_RES, void (*)(MYSQL_RES*)> guard(res, mysql_free_result);
  while (MYSQL_ROW row = mysql_fetch_row(res)) {
    on_row(row, mysql_fetch_lengths(res));
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::Ping() const {
  try {
    auto conn = Connect();
    return mysql_ping(conn.get()) == 0;
  } catch (const DbException&) {
    return false;
  }
}

bool MariaDbClient::IsRetryable(unsigned int code) {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED || code == CR_CONNECTION_ERROR;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace telemetry
