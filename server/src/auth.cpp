/*
 * 설명: HS256 베어러 토큰 서명 검증과 클레임 해석을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_test.cpp
 */
#include "telemetry/auth.hpp"

#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace telemetry {

namespace {
std::string Base64UrlEncode(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(4 * ((len + 2) / 3) + 1);
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
  out.resize(static_cast<std::size_t>(written));
  for (auto& c : out) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  return out;
}

std::string Base64UrlEncode(const std::string& text) {
  return Base64UrlEncode(reinterpret_cast<const unsigned char*>(text.data()), text.size());
}

std::optional<std::string> Base64UrlDecode(std::string text) {
  for (auto& c : text) {
    if (c == '-') {
      c = '+';
    } else if (c == '_') {
      c = '/';
    }
  }
  std::size_t padding = (4 - text.size() % 4) % 4;
  if (padding == 3) {
    return std::nullopt;
  }
  text.append(padding, '=');
  std::vector<unsigned char> buffer(text.size() / 4 * 3 + 1);
  int len = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
  if (len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 바이트까지 길이에 포함한다.
  return std::string(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(len) - padding);
}

std::optional<std::string> ClaimString(const nlohmann::json& claims, const char* key) {
  auto it = claims.find(key);
  if (it == claims.end()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<long long>());
  }
  return std::nullopt;
}
}  // namespace

AuthService::AuthService(const AuthConfig& config) : config_(config) {}

std::optional<Identity> AuthService::Verify(const std::string& token, std::string& error_message,
                                            std::chrono::system_clock::time_point now) const {
  if (config_.token_secret.empty()) {
    error_message = "토큰 검증 키가 설정되지 않았습니다";
    return std::nullopt;
  }
  auto first_dot = token.find('.');
  auto second_dot = first_dot == std::string::npos ? std::string::npos : token.find('.', first_dot + 1);
  if (second_dot == std::string::npos || token.find('.', second_dot + 1) != std::string::npos) {
    error_message = "토큰 형식이 올바르지 않습니다";
    return std::nullopt;
  }

  auto signing_input = token.substr(0, second_dot);
  auto expected = ComputeSignature(signing_input);
  auto provided = token.substr(second_dot + 1);
  if (expected.size() != provided.size() || CRYPTO_memcmp(expected.data(), provided.data(), expected.size()) != 0) {
    error_message = "토큰 서명이 유효하지 않습니다";
    return std::nullopt;
  }

  auto header_text = Base64UrlDecode(token.substr(0, first_dot));
  auto claims_text = Base64UrlDecode(token.substr(first_dot + 1, second_dot - first_dot - 1));
  if (!header_text || !claims_text) {
    error_message = "토큰 인코딩이 올바르지 않습니다";
    return std::nullopt;
  }

  try {
    auto header = nlohmann::json::parse(*header_text);
    if (!header.is_object() || header.value("alg", "") != "HS256") {
      error_message = "지원하지 않는 서명 알고리즘입니다";
      return std::nullopt;
    }
    auto claims = nlohmann::json::parse(*claims_text);
    if (!claims.is_object()) {
      error_message = "클레임 형식이 올바르지 않습니다";
      return std::nullopt;
    }
    auto exp_it = claims.find("exp");
    if (exp_it == claims.end() || !exp_it->is_number()) {
      error_message = "만료 시각(exp)이 없습니다";
      return std::nullopt;
    }
    auto expires_at = std::chrono::system_clock::time_point(std::chrono::seconds(exp_it->get<long long>()));
    if (expires_at <= now) {
      error_message = "토큰이 만료되었습니다";
      return std::nullopt;
    }
    auto user_id = ClaimString(claims, "sub");
    auto org_id = ClaimString(claims, "org");
    if (!user_id || user_id->empty() || !org_id || org_id->empty()) {
      error_message = "sub/org 클레임이 필요합니다";
      return std::nullopt;
    }
    return Identity{*user_id, *org_id, ClaimString(claims, "role").value_or("member")};
  } catch (const nlohmann::json::exception&) {
    error_message = "토큰 JSON 파싱 오류";
    return std::nullopt;
  }
}

std::string AuthService::Sign(const Identity& identity, std::chrono::system_clock::time_point expires_at) const {
  nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
  nlohmann::json claims{{"sub", identity.user_id},
                        {"org", identity.organization_id},
                        {"role", identity.role},
                        {"exp", std::chrono::duration_cast<std::chrono::seconds>(expires_at.time_since_epoch()).count()}};
  auto signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(claims.dump());
  return signing_input + "." + ComputeSignature(signing_input);
}

std::string AuthService::ComputeSignature(const std::string& signing_input) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), config_.token_secret.data(), static_cast<int>(config_.token_secret.size()),
       reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(), digest, &digest_len);
  return Base64UrlEncode(digest, digest_len);
}

}  // namespace telemetry
