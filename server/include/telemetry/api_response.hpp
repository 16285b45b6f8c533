/*
 * 설명: REST/WS 응답 엔벨로프 생성과 시각 포맷을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace telemetry {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

// 밀리초 정밀도의 UTC ISO-8601 문자열 (예: 2024-05-01T12:00:00.250Z).
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp);
std::int64_t ToEpochMillis(std::chrono::system_clock::time_point tp);

}  // namespace telemetry
