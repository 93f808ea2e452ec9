/*
 * 설명: 플레이어 이름의 공백/따옴표 정리와 길이, 문자 규칙을 검사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/player_name_test.cpp
 */
#include "foxnavy/player_name.hpp"

#include <algorithm>

namespace foxnavy {

namespace {
std::string StripChars(const std::string& value, const char* chars) {
  auto begin = value.find_first_not_of(chars);
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(chars);
  return value.substr(begin, end - begin + 1);
}

bool IsAsciiAlnum(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

PlayerNameValidation ValidationError(const std::string& message) {
  PlayerNameValidation result;
  result.valid = false;
  result.error_message = message;
  result.css_class = "error";
  return result;
}
}  // namespace

PlayerNameValidation ValidatePlayerName(const std::string& raw, bool strip_quotes) {
  std::string clean = StripChars(raw, " \t\r\n\v\f");
  if (strip_quotes) {
    clean = StripChars(clean, "\"'");
  }

  if (clean.empty()) {
    return ValidationError("Player name is required");
  }
  if (clean.size() < kPlayerNameMinLength || clean.size() > kPlayerNameMaxLength) {
    return ValidationError("Player name must be between 2 and 20 characters");
  }
  bool allowed = std::all_of(clean.begin(), clean.end(), [](char c) { return c == ' ' || IsAsciiAlnum(c); });
  if (!allowed) {
    return ValidationError("Player name can only contain letter, numbers and spaces");
  }

  PlayerNameValidation result;
  result.valid = true;
  result.css_class = "valid";
  result.clean_name = clean;
  return result;
}

}  // namespace foxnavy
