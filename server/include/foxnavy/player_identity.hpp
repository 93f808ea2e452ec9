/*
 * 설명: 로그인으로 확정되는 플레이어 신원과 게임 모드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp, server/tests/unit/session_gateway_test.cpp
 */
#pragma once

#include <optional>
#include <string>

namespace foxnavy {

enum class GameMode { kComputer, kMultiplayer };

// "human"은 기존 로그인 폼이 보내던 멀티플레이 값이다.
std::optional<GameMode> ParseGameMode(const std::string& value);
std::string GameModeName(GameMode mode);

struct PlayerIdentity {
  std::string player_id;
  std::string player_name;
  GameMode game_mode{GameMode::kComputer};
};

bool operator==(const PlayerIdentity& lhs, const PlayerIdentity& rhs);
bool operator!=(const PlayerIdentity& lhs, const PlayerIdentity& rhs);

// 16 바이트 난수를 base64url로 인코딩한 22자 식별자.
std::string GeneratePlayerId();

}  // namespace foxnavy
