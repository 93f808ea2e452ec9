/*
 * 설명: 게임 모드 변환과 플레이어 식별자 생성을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_gateway_test.cpp
 */
#include "foxnavy/player_identity.hpp"

#include "foxnavy/crypto.hpp"

namespace foxnavy {

namespace {
constexpr std::size_t kPlayerIdBytes = 16;
}  // namespace

std::optional<GameMode> ParseGameMode(const std::string& value) {
  if (value == "computer") {
    return GameMode::kComputer;
  }
  if (value == "multiplayer" || value == "human") {
    return GameMode::kMultiplayer;
  }
  return std::nullopt;
}

std::string GameModeName(GameMode mode) {
  switch (mode) {
    case GameMode::kComputer:
      return "computer";
    case GameMode::kMultiplayer:
      return "multiplayer";
  }
  return "computer";
}

bool operator==(const PlayerIdentity& lhs, const PlayerIdentity& rhs) {
  return lhs.player_id == rhs.player_id && lhs.player_name == rhs.player_name && lhs.game_mode == rhs.game_mode;
}

bool operator!=(const PlayerIdentity& lhs, const PlayerIdentity& rhs) { return !(lhs == rhs); }

std::string GeneratePlayerId() { return Base64UrlEncode(RandomBytes(kPlayerIdBytes)); }

}  // namespace foxnavy
