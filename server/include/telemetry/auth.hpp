/*
 * 설명: 베어러 토큰(HS256 서명)을 검증해 사용자/조직/역할 신원을 복원한다.
 *       토큰 발급은 외부 인증 서비스의 책임이며, Sign은 내부 도구와 테스트용이다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_test.cpp, server/tests/e2e/gateway_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace telemetry {

inline constexpr char kRoleSuperAdmin[] = "super_admin";
inline constexpr char kRolePlatformAdmin[] = "platform_admin";
inline constexpr char kRoleSupportAdmin[] = "support_admin";

struct Identity {
  std::string user_id;
  std::string organization_id;
  std::string role;

  // super_admin/platform_admin 만 조직 경계를 넘는 전역 뷰를 볼 수 있다.
  bool IsSuperAdmin() const { return role == kRoleSuperAdmin || role == kRolePlatformAdmin; }
  // 운영 상태(헬스) 조회 권한.
  bool IsOperator() const { return IsSuperAdmin() || role == kRoleSupportAdmin; }
  bool CanAccessOrganization(const std::string& org_id) const {
    return IsSuperAdmin() || org_id == organization_id;
  }
};

struct AuthConfig {
  std::string token_secret;
};

class AuthService {
 public:
  explicit AuthService(const AuthConfig& config);

  std::optional<Identity> Verify(const std::string& token, std::string& error_message,
                                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
  std::string Sign(const Identity& identity, std::chrono::system_clock::time_point expires_at) const;

 private:
  std::string ComputeSignature(const std::string& signing_input) const;

  AuthConfig config_;
};

}  // namespace telemetry
