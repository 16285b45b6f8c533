/*
 * 설명: 세션 위치 추적(조회 후 upsert)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_geo_tracker_test.cpp
 */
#include "telemetry/session_geo_tracker.hpp"

#include "telemetry/errors.hpp"

namespace telemetry {

std::string_view ToString(TrackOutcome outcome) {
  switch (outcome) {
    case TrackOutcome::kStored:
      return "stored";
    case TrackOutcome::kSkippedUnknown:
      return "skipped_unknown";
    case TrackOutcome::kFailed:
      return "failed";
  }
  return "failed";
}

SessionGeoTracker::SessionGeoTracker(std::shared_ptr<GeoResolver> resolver, std::shared_ptr<SessionGeoStore> store,
                                     std::shared_ptr<Observability> observability)
    : resolver_(std::move(resolver)), store_(std::move(store)), observability_(std::move(observability)) {}

TrackOutcome SessionGeoTracker::Track(const TrackRequest& request, std::chrono::system_clock::time_point now) {
  auto location = resolver_->Resolve(request.ip);
  if (location.IsUnknown()) {
    observability_->Log(LogLevel::kDebug, "geo.track_skipped",
                        {{"sessionId", request.session_id}, {"ip", GeoResolver::MaskIp(request.ip)}});
    return TrackOutcome::kSkippedUnknown;
  }

  SessionGeoRecord record;
  record.session_id = request.session_id;
  record.user_id = request.user_id;
  record.organization_id = request.organization_id;
  record.country_code = location.country_code;
  record.country = location.country;
  record.region = location.region;
  record.city = location.city;
  record.latitude = location.latitude;
  record.longitude = location.longitude;
  record.ip_hash = location.ip_key.empty() ? resolver_->HashIp(request.ip) : location.ip_key;
  record.created_at = now;

  try {
    store_->Upsert(record);
  } catch (const TransientStoreError& ex) {
    observability_->Log(LogLevel::kWarn, "geo.track_failed",
                        {{"sessionId", request.session_id}, {"reason", ex.what()}, {"transient", true}});
    return TrackOutcome::kFailed;
  } catch (const DbException& ex) {
    observability_->Log(LogLevel::kError, "geo.track_failed",
                        {{"sessionId", request.session_id}, {"reason", ex.what()}, {"code", ex.code}});
    return TrackOutcome::kFailed;
  }

  observability_->Log(LogLevel::kDebug, "geo.track_stored",
                      {{"sessionId", request.session_id},
                       {"organizationId", request.organization_id},
                       {"countryCode", record.country_code}});
  return TrackOutcome::kStored;
}

void SessionGeoTracker::TrackAsync(TrackRequest request, std::function<void(TrackOutcome)> on_done) {
  resolver_->Post([this, request = std::move(request), on_done = std::move(on_done)]() {
    auto outcome = Track(request);
    if (on_done) {
      on_done(outcome);
    }
  });
}

}  // namespace telemetry
