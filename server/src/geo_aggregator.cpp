/*
 * 설명: 국가/지역 분포 비율 계산과 히트맵 격자 순위를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/geo_aggregator_test.cpp
 */
#include "telemetry/geo_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <utility>

#include "telemetry/api_response.hpp"

namespace telemetry {

nlohmann::json GeoShare::ToJson() const {
  return {{"code", code}, {"name", name}, {"count", count}, {"percentage", percentage}};
}

nlohmann::json HeatmapPoint::ToJson() const {
  return {{"lat", latitude}, {"lng", longitude}, {"weight", weight}, {"normalizedWeight", normalized_weight}};
}

nlohmann::json SessionLocation::ToJson() const {
  auto number = [](const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
  };
  return {{"sessionId", session_id},
          {"userId", user_id},
          {"location",
           {{"country", country},
            {"countryCode", country_code},
            {"region", region},
            {"city", city},
            {"latitude", number(latitude)},
            {"longitude", number(longitude)}}},
          {"createdAt", FormatIsoTimestamp(created_at)}};
}

GeoAggregator::GeoAggregator(std::shared_ptr<SessionGeoStore> store, const GeoAggregatorConfig& config)
    : store_(std::move(store)), config_(config) {
  if (config_.grid_degrees <= 0.0) {
    config_.grid_degrees = 0.1;
  }
}

GeoAggregator::TimePoint GeoAggregator::WindowStart(int window_days, TimePoint now) {
  int days = std::clamp(window_days, 1, kMaxWindowDays);
  return now - std::chrono::hours(24) * days;
}

std::vector<GeoShare> GeoAggregator::AggregateByCountry(const std::string& org_id, int window_days,
                                                        TimePoint now) const {
  return RankShares(store_->CountByCountry(org_id, WindowStart(window_days, now)));
}

std::vector<GeoShare> GeoAggregator::AggregateByRegion(const std::string& org_id, const std::string& country_code,
                                                       int window_days, TimePoint now) const {
  return RankShares(store_->CountByRegion(org_id, country_code, WindowStart(window_days, now)));
}

std::vector<HeatmapPoint> GeoAggregator::HeatmapPoints(const std::string& org_id, int window_days,
                                                       TimePoint now) const {
  auto buckets = store_->CountByGridCell(org_id, WindowStart(window_days, now), config_.grid_degrees);
  return RankBuckets(buckets, config_.grid_degrees, config_.heatmap_max_points);
}

std::vector<GeoShare> GeoAggregator::GlobalDistribution(int window_days, TimePoint now) const {
  return RankShares(store_->CountByCountry(std::nullopt, WindowStart(window_days, now)));
}

SessionLocationPage GeoAggregator::SessionLocations(const std::string& org_id, std::size_t limit) const {
  auto records = store_->RecentSessions(org_id, kMaxSessionLimit);
  auto round_coordinate = [](const std::optional<double>& value) -> std::optional<double> {
    if (!value) {
      return std::nullopt;
    }
    return std::round(*value * 10.0) / 10.0;
  };
  SessionLocationPage page;
  page.total = records.size();
  std::size_t count = std::min(std::clamp<std::size_t>(limit, 1, kMaxSessionLimit), records.size());
  page.sessions.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto& record = records[i];
    page.sessions.push_back(SessionLocation{record.session_id, record.user_id, record.country_code, record.country,
                                            record.region, record.city, round_coordinate(record.latitude),
                                            round_coordinate(record.longitude), record.created_at});
  }
  return page;
}

std::vector<GeoShare> GeoAggregator::RankShares(const std::vector<GeoGroupCount>& groups) {
  std::map<std::string, GeoShare> merged;
  std::size_t total = 0;
  for (const auto& group : groups) {
    if (group.count == 0) {
      continue;
    }
    auto [it, inserted] = merged.try_emplace(group.code, GeoShare{group.code, group.name, 0, 0.0});
    if (it->second.name.empty()) {
      it->second.name = group.name;
    }
    it->second.count += group.count;
    total += group.count;
  }

  std::vector<GeoShare> shares;
  shares.reserve(merged.size());
  for (auto& entry : merged) {
    auto share = std::move(entry.second);
    share.percentage = static_cast<double>(share.count) * 100.0 / static_cast<double>(total);
    shares.push_back(std::move(share));
  }
  std::sort(shares.begin(), shares.end(), [](const GeoShare& a, const GeoShare& b) {
    if (a.count != b.count) {
      return a.count > b.count;
    }
    return a.code < b.code;
  });
  return shares;
}

std::vector<HeatmapPoint> GeoAggregator::RankBuckets(const std::vector<GeoBucketCount>& buckets,
                                                     double grid_degrees, std::size_t cap) {
  // 셀은 정수 인덱스로 식별한다.
  std::map<std::pair<std::int64_t, std::int64_t>, std::size_t> cells;
  for (const auto& bucket : buckets) {
    if (bucket.count == 0) {
      continue;
    }
    auto lat_index = static_cast<std::int64_t>(std::llround(bucket.latitude / grid_degrees));
    auto lng_index = static_cast<std::int64_t>(std::llround(bucket.longitude / grid_degrees));
    cells[{lat_index, lng_index}] += bucket.count;
  }

  std::vector<std::pair<std::pair<std::int64_t, std::int64_t>, std::size_t>> ranked(cells.begin(), cells.end());
  std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    return a.first < b.first;
  });
  if (ranked.size() > cap) {
    ranked.resize(cap);
  }

  std::vector<HeatmapPoint> points;
  points.reserve(ranked.size());
  double max_weight = ranked.empty() ? 1.0 : static_cast<double>(ranked.front().second);
  for (const auto& [cell, weight] : ranked) {
    points.push_back(HeatmapPoint{static_cast<double>(cell.first) * grid_degrees,
                                  static_cast<double>(cell.second) * grid_degrees, weight,
                                  static_cast<double>(weight) / max_weight});
  }
  return points;
}

}  // namespace telemetry
