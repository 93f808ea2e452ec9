/*
 * 설명: 세션 토큰의 직렬화, HMAC 서명, 상수 시간 검증과 만료 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#include "foxnavy/token_codec.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "foxnavy/crypto.hpp"

namespace foxnavy {

namespace {
// 9999-12-31T23:59:59Z. 이보다 큰 iat는 time_point로 옮길 때 넘친다.
constexpr std::uint64_t kMaxIssuedAtSeconds = 253402300799ULL;

std::int64_t ToUnixSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::optional<PlayerIdentity> ParseIdentity(const nlohmann::json& payload) {
  if (!payload.contains("id") || !payload["id"].is_string()) {
    return std::nullopt;
  }
  if (!payload.contains("name") || !payload["name"].is_string()) {
    return std::nullopt;
  }
  if (!payload.contains("mode") || !payload["mode"].is_string()) {
    return std::nullopt;
  }
  PlayerIdentity identity;
  identity.player_id = payload["id"].get<std::string>();
  identity.player_name = payload["name"].get<std::string>();
  if (identity.player_id.empty()) {
    return std::nullopt;
  }
  // 발급 시에는 정규화된 이름만 쓰므로 "human" 별칭은 토큰에 나타나지 않는다.
  auto mode_name = payload["mode"].get<std::string>();
  if (mode_name == "computer") {
    identity.game_mode = GameMode::kComputer;
  } else if (mode_name == "multiplayer") {
    identity.game_mode = GameMode::kMultiplayer;
  } else {
    return std::nullopt;
  }
  return identity;
}
}  // namespace

std::string AuthErrorName(AuthError error) {
  switch (error) {
    case AuthError::kNone:
      return "none";
    case AuthError::kMissing:
      return "missing";
    case AuthError::kBadSignature:
      return "bad_signature";
    case AuthError::kMalformed:
      return "malformed";
    case AuthError::kExpired:
      return "expired";
  }
  return "unknown";
}

AuthResult AuthResult::Success(PlayerIdentity identity, std::chrono::system_clock::time_point issued_at) {
  AuthResult result;
  result.identity = std::move(identity);
  result.error = AuthError::kNone;
  result.issued_at = issued_at;
  return result;
}

AuthResult AuthResult::Failure(AuthError error) {
  AuthResult result;
  result.error = error;
  return result;
}

TokenCodec::TokenCodec(std::string secret) : secret_(std::move(secret)) {
  if (secret_.empty()) {
    throw std::invalid_argument("session secret must not be empty");
  }
}

std::string TokenCodec::Mint(const PlayerIdentity& identity) const {
  return Mint(identity, std::chrono::system_clock::now());
}

std::string TokenCodec::Mint(const PlayerIdentity& identity, std::chrono::system_clock::time_point issued_at) const {
  if (identity.player_id.empty()) {
    throw std::invalid_argument("player_id must not be empty");
  }
  auto iat = ToUnixSeconds(issued_at);
  if (iat < 0 || static_cast<std::uint64_t>(iat) > kMaxIssuedAtSeconds) {
    throw std::invalid_argument("issued_at out of range");
  }

  nlohmann::json payload{{"id", identity.player_id},
                         {"name", identity.player_name},
                         {"mode", GameModeName(identity.game_mode)},
                         {"iat", static_cast<std::uint64_t>(iat)}};
  std::string serialized;
  try {
    serialized = payload.dump();
  } catch (const nlohmann::json::type_error& ex) {
    // UTF-8이 아닌 문자열은 JSON으로 직렬화할 수 없다.
    throw std::invalid_argument(std::string("identity is not valid UTF-8: ") + ex.what());
  }

  auto encoded = Base64UrlEncode(serialized);
  return encoded + kDelimiter + Sign(encoded);
}

AuthResult TokenCodec::Decode(const std::string& token, std::chrono::system_clock::time_point now,
                              std::chrono::seconds max_age) const {
  auto pos = token.rfind(kDelimiter);
  if (pos == std::string::npos) {
    return AuthResult::Failure(AuthError::kBadSignature);
  }
  auto encoded = token.substr(0, pos);
  auto signature = token.substr(pos + 1);
  if (!ConstantTimeEquals(Sign(encoded), signature)) {
    return AuthResult::Failure(AuthError::kBadSignature);
  }

  auto serialized = Base64UrlDecode(encoded);
  if (!serialized) {
    return AuthResult::Failure(AuthError::kMalformed);
  }
  auto payload = nlohmann::json::parse(*serialized, nullptr, false);
  if (payload.is_discarded() || !payload.is_object()) {
    return AuthResult::Failure(AuthError::kMalformed);
  }
  auto identity = ParseIdentity(payload);
  if (!identity) {
    return AuthResult::Failure(AuthError::kMalformed);
  }
  if (!payload.contains("iat") || !payload["iat"].is_number_unsigned()) {
    return AuthResult::Failure(AuthError::kMalformed);
  }
  auto iat = payload["iat"].get<std::uint64_t>();
  if (iat > kMaxIssuedAtSeconds) {
    return AuthResult::Failure(AuthError::kMalformed);
  }

  // 초 단위로 비교한다. iat + max_age 초까지는 유효하다.
  auto age = ToUnixSeconds(now) - static_cast<std::int64_t>(iat);
  if (age > max_age.count()) {
    return AuthResult::Failure(AuthError::kExpired);
  }
  std::chrono::system_clock::time_point issued_at{std::chrono::seconds(static_cast<std::int64_t>(iat))};
  return AuthResult::Success(std::move(*identity), issued_at);
}

std::string TokenCodec::Sign(const std::string& encoded_payload) const {
  return Base64UrlEncode(HmacSha256(secret_, encoded_payload));
}

}  // namespace foxnavy
