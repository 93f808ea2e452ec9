/*
 * 설명: 플레이어 신원을 서명된 세션 토큰으로 발급하고, 서명/형식/만료를 검증해 복원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "foxnavy/player_identity.hpp"

namespace foxnavy {

enum class AuthError { kNone, kMissing, kBadSignature, kMalformed, kExpired };

std::string AuthErrorName(AuthError error);

struct AuthResult {
  std::optional<PlayerIdentity> identity;
  AuthError error{AuthError::kNone};
  std::chrono::system_clock::time_point issued_at{};

  bool ok() const { return identity.has_value(); }

  static AuthResult Success(PlayerIdentity identity, std::chrono::system_clock::time_point issued_at);
  static AuthResult Failure(AuthError error);
};

// 토큰 형식: base64url(payload) "." base64url(HMAC-SHA256(secret, base64url(payload)))
// payload는 {"id","name","mode","iat"} JSON 객체이며 iat는 유닉스 초 단위다.
// 상태를 갖지 않으므로 여러 스레드에서 공유해도 된다.
class TokenCodec {
 public:
  static constexpr char kDelimiter = '.';

  // 빈 secret이면 std::invalid_argument를 던진다.
  explicit TokenCodec(std::string secret);

  std::string Mint(const PlayerIdentity& identity) const;
  std::string Mint(const PlayerIdentity& identity, std::chrono::system_clock::time_point issued_at) const;

  // 어떤 입력에도 예외를 던지지 않고 실패는 AuthError로만 보고한다.
  AuthResult Decode(const std::string& token, std::chrono::system_clock::time_point now,
                    std::chrono::seconds max_age) const;

 private:
  std::string Sign(const std::string& encoded_payload) const;

  std::string secret_;
};

}  // namespace foxnavy
