/*
 * 설명: HTTP 연결을 처리하고 로그인/세션/로비/테스트 초기화 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/login_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "foxnavy/config.hpp"
#include "foxnavy/lobby.hpp"
#include "foxnavy/observability.hpp"
#include "foxnavy/session_gateway.hpp"
#include "foxnavy/test_control.hpp"

namespace foxnavy {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<const SessionGateway> gateway,
              std::shared_ptr<Lobby> lobby,
              std::shared_ptr<TestControl> test_control,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleLogin(const std::shared_ptr<Response>& res);
  void HandlePlayerName(const std::shared_ptr<Response>& res);
  void HandleLogout(const std::shared_ptr<Response>& res);
  void SendResponse(std::shared_ptr<Response> res);
  AuthResult AuthenticateRequest();
  std::unordered_map<std::string, std::string> ParseBody();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<const SessionGateway> gateway_;
  std::shared_ptr<Lobby> lobby_;
  std::shared_ptr<TestControl> test_control_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> player_id_;
};

}  // namespace foxnavy
