/*
 * 설명: 구조화 로그와 요청/인증 실패 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/login_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "foxnavy/token_codec.hpp"

namespace foxnavy {

struct LogContext {
  std::string trace_id;
  std::optional<std::string> player_id;
  std::optional<std::string> reason;
  std::string name;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t sessions_started{0};
  std::uint64_t auth_missing{0};
  std::uint64_t auth_bad_signature{0};
  std::uint64_t auth_malformed{0};
  std::uint64_t auth_expired{0};
  std::uint64_t lobby_players{0};
};

class Observability {
 public:
  explicit Observability(std::string log_level = "info");

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordSessionStarted(const std::string& trace_id, const PlayerIdentity& identity);
  void RecordAuthSuccess(const std::string& trace_id, const PlayerIdentity& identity) const;
  void RecordAuthFailure(const std::string& trace_id, AuthError error);
  MetricsSnapshot Snapshot(std::uint64_t lobby_players) const;
  void Log(const LogContext& ctx) const;
  bool DebugEnabled() const { return log_level_ == "debug"; }

 private:
  std::string log_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> sessions_started_{0};
  std::atomic<std::uint64_t> auth_missing_{0};
  std::atomic<std::uint64_t> auth_bad_signature_{0};
  std::atomic<std::uint64_t> auth_malformed_{0};
  std::atomic<std::uint64_t> auth_expired_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace foxnavy
