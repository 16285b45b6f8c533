/*
 * 설명: 캐시 우선 IP 위치 조회, 사설 주소 단락, IP 해시/마스킹을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/geo_resolver_test.cpp
 */
#include "telemetry/geo_resolver.hpp"

#include <array>
#include <iomanip>
#include <sstream>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <openssl/evp.h>

#include "telemetry/api_response.hpp"
#include "telemetry/errors.hpp"

namespace telemetry {
namespace {
constexpr char kCachePrefix[] = "geoip:";

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool InRange(std::uint32_t value, std::uint32_t network, int prefix) {
  std::uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
  return (value & mask) == (network & mask);
}

bool IsNonRoutableV4(const boost::asio::ip::address_v4& v4) {
  auto value = v4.to_uint();
  return InRange(value, 0x00000000u, 8) ||   // 0.0.0.0/8
         InRange(value, 0x0A000000u, 8) ||   // 10.0.0.0/8
         InRange(value, 0x64400000u, 10) ||  // 100.64.0.0/10
         InRange(value, 0x7F000000u, 8) ||   // 127.0.0.0/8
         InRange(value, 0xA9FE0000u, 16) ||  // 169.254.0.0/16
         InRange(value, 0xAC100000u, 12) ||  // 172.16.0.0/12
         InRange(value, 0xC0A80000u, 16) ||  // 192.168.0.0/16
         InRange(value, 0xE0000000u, 4) ||   // 224.0.0.0/4
         value == 0xFFFFFFFFu;
}

std::optional<boost::asio::ip::address> ParseAddress(const std::string& ip) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(ip, ec);
  if (ec) {
    return std::nullopt;
  }
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return boost::asio::ip::address{boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6())};
  }
  return address;
}

nlohmann::json OptionalNumber(const std::optional<double>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<double> ReadOptionalNumber(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<double>();
}
}  // namespace

nlohmann::json GeoLocation::ToJson() const {
  return {{"ipKey", ip_key},
          {"countryCode", country_code},
          {"country", country},
          {"region", region},
          {"city", city},
          {"lat", OptionalNumber(latitude)},
          {"lng", OptionalNumber(longitude)},
          {"resolvedAt", ToEpochMillis(resolved_at)}};
}

GeoLocation GeoLocation::FromJson(const nlohmann::json& j) {
  GeoLocation location;
  location.ip_key = j.value("ipKey", "");
  location.country_code = j.value("countryCode", kUnknownCountryCode);
  location.country = j.value("country", kUnknownCountry);
  location.region = j.value("region", "");
  location.city = j.value("city", "");
  location.latitude = ReadOptionalNumber(j, "lat");
  location.longitude = ReadOptionalNumber(j, "lng");
  location.resolved_at =
      std::chrono::system_clock::time_point(std::chrono::milliseconds(j.value("resolvedAt", std::int64_t{0})));
  return location;
}

GeoLocation GeoLocation::Unknown(std::string ip_key) {
  GeoLocation location;
  location.ip_key = std::move(ip_key);
  location.country_code = kUnknownCountryCode;
  location.country = kUnknownCountry;
  location.resolved_at = std::chrono::system_clock::now();
  return location;
}

GeoResolver::GeoResolver(std::shared_ptr<const GeoDatabase> database, std::shared_ptr<SharedStore> cache,
                         std::shared_ptr<Observability> observability, const GeoResolverConfig& config)
    : database_(std::move(database)), cache_(std::move(cache)), observability_(std::move(observability)),
      config_(config), pool_(config.worker_threads == 0 ? 1 : config.worker_threads) {}

GeoResolver::~GeoResolver() { Shutdown(); }

void GeoResolver::Shutdown() {
  pool_.stop();
  pool_.join();
}

GeoLocation GeoResolver::Resolve(const std::string& ip) {
  if (IsNonRoutable(ip)) {
    unknown_results_.fetch_add(1);
    return GeoLocation::Unknown();
  }

  auto ip_key = HashIp(config_.truncate_ip ? TruncateIp(ip) : ip);
  auto cache_key = kCachePrefix + ip_key;
  if (cache_) {
    try {
      auto cached = cache_->Get(cache_key);
      if (cached) {
        auto parsed = nlohmann::json::parse(*cached, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
          cache_hits_.fetch_add(1);
          return GeoLocation::FromJson(parsed);
        }
      }
    } catch (const TransientStoreError& ex) {
      if (observability_) {
        observability_->Log(LogLevel::kDebug, "geo.cache_unavailable", {{"reason", ex.what()}});
      }
    }
  }

  auto location = LookupDatabase(ip, ip_key);
  if (location.IsUnknown()) {
    unknown_results_.fetch_add(1);
  }

  if (cache_) {
    try {
      // 미스(unknown)도 캐시한다.
      cache_->SetWithTtl(cache_key, location.ToJson().dump(), config_.cache_ttl);
    } catch (const TransientStoreError& ex) {
      if (observability_) {
        observability_->Log(LogLevel::kDebug, "geo.cache_write_skipped", {{"reason", ex.what()}});
      }
    }
  }
  return location;
}

void GeoResolver::AsyncResolve(const std::string& ip, std::function<void(GeoLocation)> handler) {
  boost::asio::post(pool_, [this, ip, handler = std::move(handler)]() { handler(Resolve(ip)); });
}

void GeoResolver::Post(std::function<void()> work) { boost::asio::post(pool_, std::move(work)); }

GeoLocation GeoResolver::LookupDatabase(const std::string& ip, const std::string& ip_key) {
  auto address = ParseAddress(ip);
  if (!address || !address->is_v4() || !database_) {
    // 로컬 DB는 IPv4 대역만 담고 있다.
    return GeoLocation::Unknown(ip_key);
  }
  database_lookups_.fetch_add(1);
  auto range = database_->Lookup(address->to_v4().to_uint());
  if (!range) {
    if (observability_) {
      observability_->Log(LogLevel::kDebug, "geo.address_not_found", {{"ip", MaskIp(ip)}});
    }
    return GeoLocation::Unknown(ip_key);
  }
  GeoLocation location;
  location.ip_key = ip_key;
  location.country_code = range->country_code;
  location.country = range->country.empty() ? std::string{kUnknownCountry} : range->country;
  location.region = range->region;
  location.city = range->city;
  location.latitude = range->latitude;
  location.longitude = range->longitude;
  location.resolved_at = std::chrono::system_clock::now();
  return location;
}

std::string GeoResolver::HashIp(const std::string& ip) const {
  auto input = ip + config_.hash_salt;
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
    // 해시 실패 시 원문 대신 고정 키를 쓴다.
    return "unhashable";
  }
  return BytesToHex(digest.data(), digest_len);
}

std::string GeoResolver::MaskIp(const std::string& ip) {
  auto address = ParseAddress(ip);
  if (!address) {
    return "invalid";
  }
  if (address->is_v4()) {
    auto bytes = address->to_v4().to_bytes();
    std::ostringstream oss;
    oss << static_cast<int>(bytes[0]) << '.' << static_cast<int>(bytes[1]) << '.' << static_cast<int>(bytes[2])
        << ".xxx";
    return oss.str();
  }
  auto bytes = address->to_v6().to_bytes();
  std::ostringstream oss;
  oss << std::hex;
  for (int group = 0; group < 4; ++group) {
    oss << ((bytes[group * 2] << 8) | bytes[group * 2 + 1]) << ':';
  }
  oss << "xxxx:xxxx:xxxx:xxxx";
  return oss.str();
}

bool GeoResolver::IsNonRoutable(const std::string& ip) {
  auto address = ParseAddress(ip);
  if (!address) {
    return true;
  }
  if (address->is_v4()) {
    return IsNonRoutableV4(address->to_v4());
  }
  auto v6 = address->to_v6();
  auto bytes = v6.to_bytes();
  bool unique_local = (bytes[0] & 0xFE) == 0xFC;  // fc00::/7
  return v6.is_loopback() || v6.is_unspecified() || v6.is_link_local() || v6.is_site_local() ||
         v6.is_multicast() || unique_local;
}

std::string GeoResolver::TruncateIp(const std::string& ip) {
  auto address = ParseAddress(ip);
  if (!address) {
    return ip;
  }
  if (address->is_v4()) {
    auto bytes = address->to_v4().to_bytes();
    bytes[3] = 0;
    return boost::asio::ip::address_v4(bytes).to_string();
  }
  auto bytes = address->to_v6().to_bytes();
  for (std::size_t i = 6; i < bytes.size(); ++i) {
    bytes[i] = 0;
  }
  return boost::asio::ip::address_v6(bytes).to_string();
}

GeoResolverStats GeoResolver::Stats() const {
  GeoResolverStats stats;
  stats.cache_hits = cache_hits_.load();
  stats.database_lookups = database_lookups_.load();
  stats.unknown_results = unknown_results_.load();
  return stats;
}

}  // namespace telemetry
