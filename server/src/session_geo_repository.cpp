/*
 * 설명: 세션 위치 레코드를 MariaDB session_geo_data 테이블에 upsert하고 집계 쿼리를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/it/session_geo_repository_it_test.cpp
 */
#include "telemetry/session_geo_repository.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "telemetry/errors.hpp"

namespace telemetry {
namespace {
constexpr char kColumns[] =
    "session_id, user_id, organization_id, country_code, country, region, city, latitude, longitude, ip_hash, "
    "created_at";

std::string ToDbTimestamp(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  std::time_t tt = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms % 1000);
  return oss.str();
}

std::chrono::system_clock::time_point ParseDbTimestamp(const char* text) {
  if (!text) {
    return {};
  }
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  int millis = 0;
  if (iss.peek() == '.') {
    iss.get();
    std::string fraction;
    iss >> fraction;
    fraction.resize(3, '0');
    millis = std::stoi(fraction);
  }
  return tp + std::chrono::milliseconds(millis);
}

std::string FormatDouble(double value) {
  std::ostringstream oss;
  oss << std::setprecision(10) << value;
  return oss.str();
}

std::string OptionalNumberSql(const std::optional<double>& value) {
  return value ? FormatDouble(*value) : std::string{"NULL"};
}

std::optional<double> ReadOptionalDouble(const char* value) {
  if (!value) {
    return std::nullopt;
  }
  return std::stod(value);
}

std::size_t ToCount(const char* value) { return value ? static_cast<std::size_t>(std::stoull(value)) : 0; }
}  // namespace

SessionGeoRepository::SessionGeoRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void SessionGeoRepository::Run(const std::function<void(MYSQL*)>& work) const {
  try {
    db_client_->WithConnectionRetry(work);
  } catch (const DbException& ex) {
    if (ex.retryable) {
      throw TransientStoreError(ex.what());
    }
    throw;
  }
}

void SessionGeoRepository::Upsert(const SessionGeoRecord& record) {
  Run([&](MYSQL* conn) {
    auto esc = [&](const std::string& value) { return "'" + db_client_->Escape(conn, value) + "'"; };
    std::ostringstream oss;
    oss << "INSERT INTO session_geo_data(" << kColumns << ", updated_at) VALUES(" << esc(record.session_id) << ", "
        << esc(record.user_id) << ", " << esc(record.organization_id) << ", " << esc(record.country_code) << ", "
        << esc(record.country) << ", " << esc(record.region) << ", " << esc(record.city) << ", "
        << OptionalNumberSql(record.latitude) << ", " << OptionalNumberSql(record.longitude) << ", "
        << esc(record.ip_hash) << ", '" << ToDbTimestamp(record.created_at) << "', '"
        << ToDbTimestamp(record.created_at) << "')"
        << " ON DUPLICATE KEY UPDATE country_code=VALUES(country_code), country=VALUES(country),"
        << " region=VALUES(region), city=VALUES(city), latitude=VALUES(latitude), longitude=VALUES(longitude),"
        << " updated_at=VALUES(updated_at);";
    db_client_->Execute(conn, oss.str(), "세션 위치 저장 실패");
  });
}

std::vector<GeoGroupCount> SessionGeoRepository::CountByCountry(const std::optional<std::string>& org_id,
                                                                TimePoint since) const {
  std::vector<GeoGroupCount> groups;
  Run([&](MYSQL* conn) {
    groups.clear();
    std::ostringstream oss;
    oss << "SELECT country_code, MAX(country), COUNT(*) FROM session_geo_data WHERE created_at >= '"
        << ToDbTimestamp(since) << "'";
    if (org_id) {
      oss << " AND organization_id='" << db_client_->Escape(conn, *org_id) << "'";
    }
    oss << " GROUP BY country_code;";
    db_client_->Query(conn, oss.str(), "국가별 집계 실패", [&](MYSQL_ROW row, unsigned long*) {
      groups.push_back(GeoGroupCount{row[0] ? row[0] : "", row[1] ? row[1] : "", ToCount(row[2])});
    });
  });
  return groups;
}

std::vector<GeoGroupCount> SessionGeoRepository::CountByRegion(const std::string& org_id,
                                                               const std::string& country_code,
                                                               TimePoint since) const {
  std::vector<GeoGroupCount> groups;
  Run([&](MYSQL* conn) {
    groups.clear();
    std::ostringstream oss;
    oss << "SELECT region, COUNT(*) FROM session_geo_data WHERE organization_id='"
        << db_client_->Escape(conn, org_id) << "' AND country_code='" << db_client_->Escape(conn, country_code)
        << "' AND region <> '' AND created_at >= '" << ToDbTimestamp(since) << "' GROUP BY region;";
    db_client_->Query(conn, oss.str(), "지역별 집계 실패", [&](MYSQL_ROW row, unsigned long*) {
      std::string region = row[0] ? row[0] : "";
      groups.push_back(GeoGroupCount{region, region, ToCount(row[1])});
    });
  });
  return groups;
}

std::vector<GeoBucketCount> SessionGeoRepository::CountByGridCell(const std::string& org_id, TimePoint since,
                                                                  double cell_degrees) const {
  std::vector<GeoBucketCount> buckets;
  auto cell = FormatDouble(cell_degrees);
  Run([&](MYSQL* conn) {
    buckets.clear();
    std::ostringstream oss;
    oss << "SELECT ROUND(latitude / " << cell << ") * " << cell << " AS lat_cell, ROUND(longitude / " << cell
        << ") * " << cell << " AS lng_cell, COUNT(*) FROM session_geo_data WHERE organization_id='"
        << db_client_->Escape(conn, org_id) << "' AND latitude IS NOT NULL AND longitude IS NOT NULL"
        << " AND created_at >= '" << ToDbTimestamp(since) << "' GROUP BY lat_cell, lng_cell;";
    db_client_->Query(conn, oss.str(), "격자 집계 실패", [&](MYSQL_ROW row, unsigned long*) {
      if (!row[0] || !row[1]) {
        return;
      }
      buckets.push_back(GeoBucketCount{std::stod(row[0]), std::stod(row[1]), ToCount(row[2])});
    });
  });
  return buckets;
}

std::size_t SessionGeoRepository::Count() const {
  std::size_t count = 0;
  Run([&](MYSQL* conn) {
    db_client_->Query(conn, "SELECT COUNT(*) FROM session_geo_data;", "세션 위치 카운트 실패",
                      [&](MYSQL_ROW row, unsigned long*) { count = ToCount(row[0]); });
  });
  return count;
}

std::vector<SessionGeoRecord> SessionGeoRepository::RecentSessions(const std::string& org_id,
                                                                  std::size_t limit) const {
  std::vector<SessionGeoRecord> records;
  Run([&](MYSQL* conn) {
    records.clear();
    std::ostringstream oss;
    oss << "SELECT " << kColumns << " FROM session_geo_data WHERE organization_id='"
        << db_client_->Escape(conn, org_id) << "' ORDER BY created_at DESC, session_id ASC LIMIT " << limit << ";";
    db_client_->Query(conn, oss.str(), "세션 위치 목록 조회 실패",
                      [&](MYSQL_ROW row, unsigned long*) { records.push_back(BuildRecord(row)); });
  });
  return records;
}

std::optional<SessionGeoRecord> SessionGeoRepository::Find(const std::string& org_id,
                                                           const std::string& session_id) const {
  std::optional<SessionGeoRecord> result;
  Run([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kColumns << " FROM session_geo_data WHERE organization_id='"
        << db_client_->Escape(conn, org_id) << "' AND session_id='" << db_client_->Escape(conn, session_id) << "';";
    db_client_->Query(conn, oss.str(), "세션 위치 조회 실패",
                      [&](MYSQL_ROW row, unsigned long*) { result = BuildRecord(row); });
  });
  return result;
}

void SessionGeoRepository::ClearAll() const {
  Run([&](MYSQL* conn) { db_client_->Execute(conn, "DELETE FROM session_geo_data;", "세션 위치 삭제 실패"); });
}

SessionGeoRecord SessionGeoRepository::BuildRecord(MYSQL_ROW row) const {
  auto text = [&](int index) { return std::string(row[index] ? row[index] : ""); };
  SessionGeoRecord record;
  record.session_id = text(0);
  record.user_id = text(1);
  record.organization_id = text(2);
  record.country_code = text(3);
  record.country = text(4);
  record.region = text(5);
  record.city = text(6);
  record.latitude = ReadOptionalDouble(row[7]);
  record.longitude = ReadOptionalDouble(row[8]);
  record.ip_hash = text(9);
  record.created_at = ParseDbTimestamp(row[10]);
  return record;
}

}  // namespace telemetry
