/*
 * 설명: 구조화 로그와 요청/인증 실패 메트릭 카운터를 관리한다.
 *       토큰 값과 서명 키는 로그에 남기지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "foxnavy/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace foxnavy {

namespace {
std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

Observability::Observability(std::string log_level) : log_level_(std::move(log_level)) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordSessionStarted(const std::string& trace_id, const PlayerIdentity& identity) {
  sessions_started_.fetch_add(1);
  Log(LogContext{trace_id, identity.player_id, std::nullopt, "session_started", 0});
}

void Observability::RecordAuthSuccess(const std::string& trace_id, const PlayerIdentity& identity) const {
  if (!DebugEnabled()) {
    return;
  }
  Log(LogContext{trace_id, identity.player_id, std::nullopt, "auth_ok", 0});
}

void Observability::RecordAuthFailure(const std::string& trace_id, AuthError error) {
  switch (error) {
    case AuthError::kMissing:
      auth_missing_.fetch_add(1);
      break;
    case AuthError::kBadSignature:
      auth_bad_signature_.fetch_add(1);
      break;
    case AuthError::kMalformed:
      auth_malformed_.fetch_add(1);
      break;
    case AuthError::kExpired:
      auth_expired_.fetch_add(1);
      break;
    case AuthError::kNone:
      return;
  }
  Log(LogContext{trace_id, std::nullopt, AuthErrorName(error), "auth_failed", 0});
}

MetricsSnapshot Observability::Snapshot(std::uint64_t lobby_players) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.sessions_started = sessions_started_.load();
  snapshot.auth_missing = auth_missing_.load();
  snapshot.auth_bad_signature = auth_bad_signature_.load();
  snapshot.auth_malformed = auth_malformed_.load();
  snapshot.auth_expired = auth_expired_.load();
  snapshot.lobby_players = lobby_players;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  if (ctx.reason) {
    log_json["reason"] = *ctx.reason;
  }
  std::lock_guard<std::mutex> lock(LogMutex());
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace foxnavy
