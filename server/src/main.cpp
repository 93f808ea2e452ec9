/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다. 설정 오류는 시작 단계에서 종료 사유가 된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/login_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

#include "foxnavy/app.hpp"

int main() {
  using namespace foxnavy;
  std::unique_ptr<ServerApp> app;
  try {
    auto config = LoadConfigFromEnv();
    app = std::make_unique<ServerApp>(config);
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, [](int) {
    std::cout << "SIGINT 수신, 종료를 준비합니다\n";
  });

  app->Run();
  return 0;
}
