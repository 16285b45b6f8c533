/*
 * 설명: IP 주소를 위치로 변환한다. 캐시(24시간 TTL) → 로컬 지오 DB 순으로 조회하며,
 *       사설/루프백/잘못된 주소와 조회 실패는 모두 "unknown" 센티널로 귀결된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/geo_resolver_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "telemetry/geo_database.hpp"
#include "telemetry/observability.hpp"
#include "telemetry/shared_store.hpp"

namespace telemetry {

inline constexpr char kUnknownCountryCode[] = "XX";
inline constexpr char kUnknownCountry[] = "Unknown";

struct GeoLocation {
  std::string ip_key;
  std::string country_code;
  std::string country;
  std::string region;
  std::string city;
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::chrono::system_clock::time_point resolved_at;

  bool IsUnknown() const { return country_code == kUnknownCountryCode; }
  nlohmann::json ToJson() const;
  static GeoLocation FromJson(const nlohmann::json& j);
  static GeoLocation Unknown(std::string ip_key = {});
};

struct GeoResolverConfig {
  std::chrono::seconds cache_ttl{std::chrono::hours(24)};
  bool truncate_ip{true};
  std::string hash_salt{"telemetry-geoip-salt"};
  std::size_t worker_threads{2};
};

struct GeoResolverStats {
  std::uint64_t cache_hits{0};
  std::uint64_t database_lookups{0};
  std::uint64_t unknown_results{0};
};

class GeoResolver {
 public:
  GeoResolver(std::shared_ptr<const GeoDatabase> database, std::shared_ptr<SharedStore> cache,
              std::shared_ptr<Observability> observability, const GeoResolverConfig& config);
  ~GeoResolver();

  GeoResolver(const GeoResolver&) = delete;
  GeoResolver& operator=(const GeoResolver&) = delete;

  // 예외를 던지지 않는다. 실패는 Unknown()으로 표현된다.
  GeoLocation Resolve(const std::string& ip);
  // 조회를 전용 워커 풀에서 수행한다. handler는 워커 스레드에서 호출된다.
  void AsyncResolve(const std::string& ip, std::function<void(GeoLocation)> handler);
  // 워커 풀에 임의 작업을 올린다. 지오 조회에 이어지는 후속 처리용.
  void Post(std::function<void()> work);

  std::string HashIp(const std::string& ip) const;
  static std::string MaskIp(const std::string& ip);
  static bool IsNonRoutable(const std::string& ip);
  static std::string TruncateIp(const std::string& ip);

  GeoResolverStats Stats() const;
  bool DatabaseLoaded() const { return database_ && !database_->Empty(); }
  std::size_t DatabaseSize() const { return database_ ? database_->Size() : 0; }
  std::optional<std::chrono::system_clock::time_point> DatabaseLoadedAt() const {
    return database_ ? database_->LoadedAt() : std::nullopt;
  }
  void Shutdown();

 private:
  GeoLocation LookupDatabase(const std::string& ip, const std::string& ip_key);

  std::shared_ptr<const GeoDatabase> database_;
  std::shared_ptr<SharedStore> cache_;
  std::shared_ptr<Observability> observability_;
  GeoResolverConfig config_;
  boost::asio::thread_pool pool_;
  std::atomic<std::uint64_t> cache_hits_{0};
  std::atomic<std::uint64_t> database_lookups_{0};
  std::atomic<std::uint64_t> unknown_results_{0};
};

}  // namespace telemetry
