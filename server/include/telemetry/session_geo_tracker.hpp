/*
 * 설명: 세션 IP를 위치로 변환해 session_id 기준으로 기록한다. 호출자에게 예외를 던지지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_geo_tracker_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "telemetry/geo_resolver.hpp"
#include "telemetry/observability.hpp"
#include "telemetry/session_geo_repository.hpp"

namespace telemetry {

enum class TrackOutcome { kStored, kSkippedUnknown, kFailed };

std::string_view ToString(TrackOutcome outcome);

struct TrackRequest {
  std::string session_id;
  std::string user_id;
  std::string organization_id;
  std::string ip;
};

class SessionGeoTracker {
 public:
  SessionGeoTracker(std::shared_ptr<GeoResolver> resolver, std::shared_ptr<SessionGeoStore> store,
                    std::shared_ptr<Observability> observability);

  TrackOutcome Track(const TrackRequest& request,
                     std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
  // 조회와 저장을 지오 워커 풀에서 수행한다. on_done은 워커 스레드에서 호출된다(없어도 된다).
  void TrackAsync(TrackRequest request, std::function<void(TrackOutcome)> on_done = {});

 private:
  std::shared_ptr<GeoResolver> resolver_;
  std::shared_ptr<SessionGeoStore> store_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace telemetry
