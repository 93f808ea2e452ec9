/*
 * 설명: 로그인 검증 후 토큰 발급과 쿠키 값 인증을 TokenCodec에 위임한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_gateway_test.cpp, server/tests/e2e/login_flow_test.cpp
 */
#include "foxnavy/session_gateway.hpp"

#include <stdexcept>
#include <utility>

#include "foxnavy/player_name.hpp"

namespace foxnavy {

SessionGateway::SessionGateway(std::shared_ptr<const TokenCodec> codec, std::chrono::seconds max_age)
    : codec_(std::move(codec)), max_age_(max_age) {
  if (!codec_) {
    throw std::invalid_argument("SessionGateway requires a TokenCodec");
  }
  if (max_age_.count() <= 0 || max_age_ > kSessionMaxAgeLimit) {
    throw std::invalid_argument("session max_age out of range");
  }
}

std::optional<SessionGrant> SessionGateway::BeginSession(const std::string& name, const std::string& mode,
                                                         std::string& error_code, std::string& error_message) const {
  auto validation = ValidatePlayerName(name, true);
  if (!validation.valid) {
    error_code = "invalid_player_name";
    error_message = validation.error_message;
    return std::nullopt;
  }
  auto game_mode = ParseGameMode(mode);
  if (!game_mode) {
    error_code = "invalid_game_mode";
    error_message = "Invalid game mode: " + mode;
    return std::nullopt;
  }

  SessionGrant grant;
  grant.identity = PlayerIdentity{GeneratePlayerId(), validation.clean_name, *game_mode};
  grant.token = codec_->Mint(grant.identity);
  grant.max_age = max_age_;
  return grant;
}

AuthResult SessionGateway::Authenticate(const std::optional<std::string>& cookie_value) const {
  return Authenticate(cookie_value, std::chrono::system_clock::now());
}

AuthResult SessionGateway::Authenticate(const std::optional<std::string>& cookie_value,
                                        std::chrono::system_clock::time_point now) const {
  if (!cookie_value) {
    return AuthResult::Failure(AuthError::kMissing);
  }
  return codec_->Decode(*cookie_value, now, max_age_);
}

}  // namespace foxnavy
