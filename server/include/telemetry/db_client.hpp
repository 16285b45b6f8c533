/*
 * 설명: MariaDB 연결, 쿼리 실행 헬퍼, 재시도/백오프 정책을 캡슐화한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/session_geo_repository_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace telemetry {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  unsigned int connect_timeout_seconds{2};
  unsigned int query_timeout_seconds{2};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  using RowHandler = std::function<void(MYSQL_ROW row, unsigned long* lengths)>;

  explicit MariaDbClient(const DbConfig& config);

  // 재시도 가능한 오류(데드락, 연결 끊김)는 최대 3회까지 지수 백오프로 재시도한다.
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  void Query(MYSQL* conn, const std::string& sql, const std::string& ctx, const RowHandler& on_row) const;
  std::string Escape(MYSQL* conn, const std::string& value) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  // 연결 한 번만 시도한다. 헬스 체크용.
  bool Ping() const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

 private:
  struct ConnectionCloser {
    void operator()(MYSQL* conn) const {
      if (conn) {
        mysql_close(conn);
      }
    }
  };
  using ConnectionHandle = std::unique_ptr<MYSQL, ConnectionCloser>;

  ConnectionHandle Connect() const;
  static bool IsRetryable(unsigned int code);
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace telemetry
