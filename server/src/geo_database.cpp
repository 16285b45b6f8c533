/*
 * 설명: CSV 기반 로컬 지오 데이터베이스 적재와 대역 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/geo_resolver_test.cpp
 */
#include "telemetry/geo_database.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <boost/asio/ip/address_v4.hpp>

namespace telemetry {
namespace {
std::vector<std::string> SplitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') {
      if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
        field.push_back('"');
        ++i;
      } else {
        quoted = !quoted;
      }
    } else if (c == ',' && !quoted) {
      fields.push_back(field);
      field.clear();
    } else if (c != '\r') {
      field.push_back(c);
    }
  }
  fields.push_back(field);
  return fields;
}

std::optional<std::uint32_t> ParseIpv4(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  if (std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    try {
      auto value = std::stoull(text);
      if (value > 0xFFFFFFFFull) {
        return std::nullopt;
      }
      return static_cast<std::uint32_t>(value);
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address_v4(text, ec);
  if (ec) {
    return std::nullopt;
  }
  return address.to_uint();
}

std::optional<double> ParseCoordinate(const std::string& text, double limit) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    double value = std::stod(text, &idx);
    if (idx != text.size() || value < -limit || value > limit) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}
}  // namespace

bool GeoDatabase::LoadFile(const std::string& path, GeoDatabaseLoadResult& result, std::string& error_message) {
  std::ifstream input(path);
  if (!input) {
    error_message = "지오 데이터베이스 파일을 열 수 없습니다: " + path;
    return false;
  }
  result = LoadFromStream(input);
  source_path_ = path;
  loaded_at_ = std::chrono::system_clock::now();
  return true;
}

GeoDatabaseFileInfo GeoDatabase::InspectFile(const std::string& path) {
  GeoDatabaseFileInfo info;
  if (path.empty()) {
    return info;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    return info;
  }
  info.exists = true;
  auto modified = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return info;
  }
  auto age = std::filesystem::file_time_type::clock::now() - modified;
  info.age_days = static_cast<long>(std::chrono::duration_cast<std::chrono::hours>(age).count() / 24);
  return info;
}

GeoDatabaseLoadResult GeoDatabase::LoadFromStream(std::istream& input) {
  GeoDatabaseLoadResult result;
  std::vector<GeoRange> ranges;
  std::string line;
  while (std::getline(input, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    auto fields = SplitCsvLine(line);
    if (fields.size() < 8) {
      ++result.rejected;
      continue;
    }
    auto start = ParseIpv4(fields[0]);
    auto end = ParseIpv4(fields[1]);
    if (!start || !end || *start > *end || fields[2].size() != 2) {
      // 헤더 행도 여기서 걸러진다.
      ++result.rejected;
      continue;
    }
    ranges.push_back(GeoRange{*start, *end, fields[2], fields[3], fields[4], fields[5],
                              ParseCoordinate(fields[6], 90.0), ParseCoordinate(fields[7], 180.0)});
  }
  std::sort(ranges.begin(), ranges.end(), [](const GeoRange& a, const GeoRange& b) { return a.start < b.start; });
  result.loaded = ranges.size();
  ranges_ = std::move(ranges);
  return result;
}

std::optional<GeoRange> GeoDatabase::Lookup(std::uint32_t ipv4) const {
  auto it = std::upper_bound(ranges_.begin(), ranges_.end(), ipv4,
                             [](std::uint32_t value, const GeoRange& range) { return value < range.start; });
  if (it == ranges_.begin()) {
    return std::nullopt;
  }
  --it;
  if (ipv4 > it->end) {
    return std::nullopt;
  }
  return *it;
}

}  // namespace telemetry
