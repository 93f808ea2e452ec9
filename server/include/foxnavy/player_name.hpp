/*
 * 설명: 로그인 폼의 플레이어 이름 검증 규칙을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/player_name_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace foxnavy {

struct PlayerNameValidation {
  bool valid{false};
  std::string error_message;
  std::string css_class;
  std::string clean_name;
};

constexpr std::size_t kPlayerNameMinLength = 2;
constexpr std::size_t kPlayerNameMaxLength = 20;

PlayerNameValidation ValidatePlayerName(const std::string& raw, bool strip_quotes);

}  // namespace foxnavy
