/*
 * 설명: 세션 쿠키의 Set-Cookie 문자열 생성과 Cookie 헤더 파싱을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cookie_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace foxnavy {

inline constexpr const char* kSessionCookieName = "session";

std::string BuildSessionCookie(const std::string& token, std::chrono::seconds max_age, bool secure);
std::string BuildClearedSessionCookie(bool secure);

std::optional<std::string> FindCookie(std::string_view header, std::string_view name);

}  // namespace foxnavy
