/*
 * 설명: 세션 쿠키 속성(HttpOnly, SameSite, Max-Age, Secure)을 조립하고 Cookie 헤더를 파싱한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cookie_test.cpp
 */
#include "foxnavy/cookie.hpp"

#include <sstream>

namespace foxnavy {

namespace {
std::string_view Trim(std::string_view value) {
  auto begin = value.find_first_not_of(" \t");
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

std::string BuildCookie(const std::string& value, long long max_age, bool secure) {
  std::ostringstream oss;
  oss << kSessionCookieName << "=" << value << "; Path=/; Max-Age=" << max_age << "; HttpOnly; SameSite=Lax";
  if (secure) {
    oss << "; Secure";
  }
  return oss.str();
}
}  // namespace

std::string BuildSessionCookie(const std::string& token, std::chrono::seconds max_age, bool secure) {
  return BuildCookie(token, static_cast<long long>(max_age.count()), secure);
}

std::string BuildClearedSessionCookie(bool secure) { return BuildCookie("", 0, secure); }

std::optional<std::string> FindCookie(std::string_view header, std::string_view name) {
  std::size_t pos = 0;
  while (pos <= header.size()) {
    auto semi = header.find(';', pos);
    auto pair = Trim(header.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
    auto eq = pair.find('=');
    if (eq != std::string_view::npos && Trim(pair.substr(0, eq)) == name) {
      auto value = Trim(pair.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      return std::string(value);
    }
    if (semi == std::string_view::npos) {
      break;
    }
    pos = semi + 1;
  }
  return std::nullopt;
}

}  // namespace foxnavy
