/*
 * 설명: 로그인 입력으로 세션 토큰을 발급하고, 요청 쿠키에서 플레이어 신원을 복원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_gateway_test.cpp, server/tests/e2e/login_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "foxnavy/player_identity.hpp"
#include "foxnavy/token_codec.hpp"

namespace foxnavy {

// 쿠키 Max-Age와 만료 시각 계산이 넘치지 않도록 10년으로 제한한다.
inline constexpr std::chrono::seconds kSessionMaxAgeLimit{10LL * 365 * 24 * 60 * 60};

struct SessionGrant {
  PlayerIdentity identity;
  std::string token;
  // 쿠키 Max-Age. Decode가 적용하는 만료와 같은 값이어야 한다.
  std::chrono::seconds max_age;
};

class SessionGateway {
 public:
  // max_age가 (0, kSessionMaxAgeLimit] 밖이면 std::invalid_argument를 던진다.
  SessionGateway(std::shared_ptr<const TokenCodec> codec, std::chrono::seconds max_age);

  std::optional<SessionGrant> BeginSession(const std::string& name, const std::string& mode,
                                           std::string& error_code, std::string& error_message) const;

  AuthResult Authenticate(const std::optional<std::string>& cookie_value) const;
  AuthResult Authenticate(const std::optional<std::string>& cookie_value,
                          std::chrono::system_clock::time_point now) const;

  std::chrono::seconds MaxAge() const { return max_age_; }

 private:
  std::shared_ptr<const TokenCodec> codec_;
  std::chrono::seconds max_age_;
};

}  // namespace foxnavy
