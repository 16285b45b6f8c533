/*
 * 설명: 텔레메트리 코어 전반에서 쓰는 예외 타입과 와이어 에러 코드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <stdexcept>
#include <string>

namespace telemetry {

// 저장소/브로커가 일시적으로 응답하지 않을 때 던진다. 호출자는 건너뛰거나 재시도한다.
class TransientStoreError : public std::runtime_error {
 public:
  explicit TransientStoreError(const std::string& message) : std::runtime_error(message) {}
};

namespace error_code {
inline constexpr char kAuthError[] = "auth_error";
inline constexpr char kTenantIsolationViolation[] = "tenant_isolation_violation";
inline constexpr char kSlowConsumer[] = "slow_consumer";
inline constexpr char kBadRequest[] = "bad_request";
inline constexpr char kForbidden[] = "forbidden";
inline constexpr char kNotFound[] = "not_found";
inline constexpr char kInternalError[] = "internal_error";
inline constexpr char kStoreUnavailable[] = "store_unavailable";
}  // namespace error_code

}  // namespace telemetry
