/*
 * 설명: 로컬 IPv4 대역 → 위치 테이블을 CSV에서 읽어 이진 탐색으로 조회한다.
 *       행 형식: start_ip,end_ip,country_code,country,region,city,latitude,longitude
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/geo_resolver_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace telemetry {

struct GeoRange {
  std::uint32_t start;
  std::uint32_t end;
  std::string country_code;
  std::string country;
  std::string region;
  std::string city;
  std::optional<double> latitude;
  std::optional<double> longitude;
};

struct GeoDatabaseLoadResult {
  std::size_t loaded{0};
  std::size_t rejected{0};
};

struct GeoDatabaseFileInfo {
  bool exists{false};
  std::optional<long> age_days;
};

class GeoDatabase {
 public:
  bool LoadFile(const std::string& path, GeoDatabaseLoadResult& result, std::string& error_message);
  GeoDatabaseLoadResult LoadFromStream(std::istream& input);

  std::optional<GeoRange> Lookup(std::uint32_t ipv4) const;
  std::size_t Size() const { return ranges_.size(); }
  bool Empty() const { return ranges_.empty(); }
  const std::string& SourcePath() const { return source_path_; }
  std::optional<std::chrono::system_clock::time_point> LoadedAt() const { return loaded_at_; }

  // 파일 존재 여부와 마지막 수정 이후 경과 일수. 예외를 던지지 않는다.
  static GeoDatabaseFileInfo InspectFile(const std::string& path);

 private:
  std::vector<GeoRange> ranges_;
  std::string source_path_;
  std::optional<std::chrono::system_clock::time_point> loaded_at_;
};

}  // namespace telemetry
