/*
 * 설명: 세션별 위치 레코드의 영속화 경계. 집계기는 SessionGeoStore 인터페이스만 본다.
 *       MariaDB 구현은 (organization_id, session_id) 기준 upsert와 GROUP BY 집계 쿼리를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/it/session_geo_repository_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "telemetry/db_client.hpp"

namespace telemetry {

struct SessionGeoRecord {
  std::string session_id;
  std::string user_id;
  std::string organization_id;
  std::string country_code;
  std::string country;
  std::string region;
  std::string city;
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::string ip_hash;
  std::chrono::system_clock::time_point created_at;
};

struct GeoGroupCount {
  std::string code;
  std::string name;
  std::size_t count;
};

struct GeoBucketCount {
  double latitude;
  double longitude;
  std::size_t count;
};

class SessionGeoStore {
 public:
  using TimePoint = std::chrono::system_clock::time_point;

  virtual ~SessionGeoStore() = default;

  // 같은 조직의 같은 session_id면 위치 필드만 갱신하고 created_at은 유지한다.
  // 다른 조직이 같은 session_id를 쓰면 별도 레코드가 된다.
  // 재시도 후에도 실패하면 TransientStoreError 또는 DbException을 던진다.
  virtual void Upsert(const SessionGeoRecord& record) = 0;

  // org_id가 비어 있으면 전 조직 대상.
  virtual std::vector<GeoGroupCount> CountByCountry(const std::optional<std::string>& org_id,
                                                    TimePoint since) const = 0;
  virtual std::vector<GeoGroupCount> CountByRegion(const std::string& org_id, const std::string& country_code,
                                                   TimePoint since) const = 0;
  // 좌표가 있는 레코드만 cell_degrees 격자 중심으로 스냅해 센다.
  virtual std::vector<GeoBucketCount> CountByGridCell(const std::string& org_id, TimePoint since,
                                                      double cell_degrees) const = 0;
  // created_at 내림차순으로 최대 limit개.
  virtual std::vector<SessionGeoRecord> RecentSessions(const std::string& org_id, std::size_t limit) const = 0;
  virtual bool Ping() const = 0;
};

class SessionGeoRepository : public SessionGeoStore {
 public:
  explicit SessionGeoRepository(std::shared_ptr<MariaDbClient> db_client);

  void Upsert(const SessionGeoRecord& record) override;
  std::vector<GeoGroupCount> CountByCountry(const std::optional<std::string>& org_id,
                                            TimePoint since) const override;
  std::vector<GeoGroupCount> CountByRegion(const std::string& org_id, const std::string& country_code,
                                           TimePoint since) const override;
  std::vector<GeoBucketCount> CountByGridCell(const std::string& org_id, TimePoint since,
                                              double cell_degrees) const override;
  std::vector<SessionGeoRecord> RecentSessions(const std::string& org_id, std::size_t limit) const override;
  bool Ping() const override { return db_client_->Ping(); }

  std::size_t Count() const;
  std::optional<SessionGeoRecord> Find(const std::string& org_id, const std::string& session_id) const;
  void ClearAll() const;

 private:
  // DbException 중 재시도 가능한 것은 TransientStoreError로 바꿔 올린다.
  void Run(const std::function<void(MYSQL*)>& work) const;
  SessionGeoRecord BuildRecord(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace telemetry
