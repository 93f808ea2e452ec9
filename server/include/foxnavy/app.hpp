/*
 * 설명: 서버 전체 수명주기와 세션/로비/테스트 훅 구성 요소의 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/login_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "foxnavy/config.hpp"
#include "foxnavy/lobby.hpp"
#include "foxnavy/observability.hpp"
#include "foxnavy/session_gateway.hpp"
#include "foxnavy/test_control.hpp"
#include "foxnavy/token_codec.hpp"

namespace foxnavy {

class Listener;

class ServerApp {
 public:
  // 서명 키가 비어 있으면 std::invalid_argument를 던진다.
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<const SessionGateway> GetSessionGateway() const { return gateway_; }
  std::shared_ptr<Lobby> GetLobby() { return lobby_; }
  std::shared_ptr<TestControl> GetTestControl() { return test_control_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<const TokenCodec> codec_;
  std::shared_ptr<const SessionGateway> gateway_;
  std::shared_ptr<Lobby> lobby_;
  std::shared_ptr<TestControl> test_control_;
  std::shared_ptr<Observability> observability_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace foxnavy
