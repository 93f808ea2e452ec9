/*
 * 설명: 서버 수명주기와 리스닝 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/login_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "foxnavy/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "foxnavy/http_session.hpp"

namespace foxnavy {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<const SessionGateway> gateway, std::shared_ptr<Lobby> lobby,
           std::shared_ptr<TestControl> test_control, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), gateway_(std::move(gateway)),
        lobby_(std::move(lobby)), test_control_(std::move(test_control)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket),
                                          self->config_,
                                          self->gateway_,
                                          self->lobby_,
                                          self->test_control_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<const SessionGateway> gateway_;
  std::shared_ptr<Lobby> lobby_;
  std::shared_ptr<TestControl> test_control_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  codec_ = std::make_shared<TokenCodec>(config.session_secret);
  gateway_ = std::make_shared<SessionGateway>(codec_, std::chrono::seconds(config.session_max_age_seconds));
  lobby_ = std::make_shared<Lobby>();
  observability_ = std::make_shared<Observability>(config.log_level);
  test_control_ = TestControl::Create(config_, {lobby_});
  if (test_control_) {
    observability_->Log(LogContext{"startup", std::nullopt, std::nullopt, "test_hooks_enabled", 0});
  }
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, gateway_, lobby_, test_control_, observability_);
    listener_->Run();
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_flag = [&](const char* key) {
    auto value = get_env(key, "");
    return value == "1" || value == "true" || value == "TRUE" || value == "yes";
  };
  // 부호 있는 정수로 읽어 [min, max] 범위를 벗어나면 거부한다.
  auto get_ranged = [&](const char* key, const char* def, long long min, long long max) {
    auto value = get_env(key, def);
    long long parsed = 0;
    std::size_t consumed = 0;
    try {
      parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
      throw std::runtime_error(std::string(key) + " 값이 정수가 아닙니다: " + value);
    }
    if (consumed != value.size()) {
      throw std::runtime_error(std::string(key) + " 값이 정수가 아닙니다: " + value);
    }
    if (parsed < min || parsed > max) {
      throw std::runtime_error(std::string(key) + " 값이 허용 범위(" + std::to_string(min) + "~" +
                               std::to_string(max) + ")를 벗어났습니다: " + value);
    }
    return parsed;
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(get_ranged("SERVER_PORT", "8080", 1, 65535));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.session_secret = get_env("SESSION_SECRET", "");
  if (cfg.session_secret.empty()) {
    throw std::runtime_error("SESSION_SECRET이 설정되지 않았습니다");
  }
  cfg.session_max_age_seconds = static_cast<std::size_t>(
      get_ranged("SESSION_MAX_AGE_SECONDS", "86400", 1, static_cast<long long>(kSessionMaxAgeLimit.count())));
  cfg.cookie_secure = get_flag("SESSION_COOKIE_SECURE");
  cfg.test_mode = get_flag("TESTING");
  return cfg;
}

}  // namespace foxnavy
