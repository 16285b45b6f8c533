/*
 * 설명: 세션 위치 기록을 국가/지역 분포와 히트맵 격자로 집계한다.
 *       저장소에서 받은 그룹 카운트만 다루므로 기록 수와 무관하게 메모리가 격자 수로 제한된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/geo_aggregator_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "telemetry/session_geo_repository.hpp"

namespace telemetry {

struct GeoShare {
  std::string code;
  std::string name;
  std::size_t count;
  double percentage;

  nlohmann::json ToJson() const;
};

struct HeatmapPoint {
  double latitude;
  double longitude;
  std::size_t weight;
  double normalized_weight;

  nlohmann::json ToJson() const;
};

// 좌표는 소수 첫째 자리(도시 수준)까지만 노출한다.
struct SessionLocation {
  std::string session_id;
  std::string user_id;
  std::string country_code;
  std::string country;
  std::string region;
  std::string city;
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::chrono::system_clock::time_point created_at;

  nlohmann::json ToJson() const;
};

struct SessionLocationPage {
  std::vector<SessionLocation> sessions;
  std::size_t total{0};
};

struct GeoAggregatorConfig {
  double grid_degrees{0.1};
  std::size_t heatmap_max_points{500};
};

class GeoAggregator {
 public:
  using TimePoint = std::chrono::system_clock::time_point;

  static constexpr int kDefaultWindowDays = 30;
  static constexpr int kMaxWindowDays = 365;
  static constexpr std::size_t kDefaultSessionLimit = 100;
  static constexpr std::size_t kMaxSessionLimit = 1000;

  GeoAggregator(std::shared_ptr<SessionGeoStore> store, const GeoAggregatorConfig& config);

  // 저장소 예외(TransientStoreError, DbException)는 그대로 전파된다.
  std::vector<GeoShare> AggregateByCountry(const std::string& org_id, int window_days,
                                           TimePoint now = std::chrono::system_clock::now()) const;
  std::vector<GeoShare> AggregateByRegion(const std::string& org_id, const std::string& country_code,
                                          int window_days, TimePoint now = std::chrono::system_clock::now()) const;
  std::vector<HeatmapPoint> HeatmapPoints(const std::string& org_id, int window_days,
                                          TimePoint now = std::chrono::system_clock::now()) const;
  std::vector<GeoShare> GlobalDistribution(int window_days, TimePoint now = std::chrono::system_clock::now()) const;
  // 최근 kMaxSessionLimit개 중 앞에서 limit개. total은 잘리기 전 개수.
  SessionLocationPage SessionLocations(const std::string& org_id, std::size_t limit) const;
  bool StoreReachable() const { return store_->Ping(); }

  // count 내림차순, code 오름차순. 같은 code는 합친다.
  static std::vector<GeoShare> RankShares(const std::vector<GeoGroupCount>& groups);
  // 격자 스냅 후 weight 내림차순(동률은 위도, 경도 오름차순)으로 최대 cap개.
  static std::vector<HeatmapPoint> RankBuckets(const std::vector<GeoBucketCount>& buckets, double grid_degrees,
                                               std::size_t cap);

  std::size_t HeatmapCap() const { return config_.heatmap_max_points; }

 private:
  static TimePoint WindowStart(int window_days, TimePoint now);

  std::shared_ptr<SessionGeoStore> store_;
  GeoAggregatorConfig config_;
};

}  // namespace telemetry
