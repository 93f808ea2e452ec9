/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/login_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace foxnavy {

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::string session_secret;
  std::size_t session_max_age_seconds;
  bool cookie_secure;
  bool test_mode;
};

// SESSION_SECRET이 비어 있거나 숫자 설정이 정수가 아니거나 범위를 벗어나면 std::runtime_error를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace foxnavy
