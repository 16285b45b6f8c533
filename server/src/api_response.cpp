/*
 * 설명: JSON 응답 엔벨로프를 생성하고 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "telemetry/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace telemetry {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", FormatIsoTimestamp(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", FormatIsoTimestamp(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  auto millis = ToEpochMillis(tp) % 1000;
  if (millis < 0) {
    millis += 1000;
  }
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace telemetry
