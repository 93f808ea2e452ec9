/*
 * 설명: HTTP 요청을 처리하고 로그인/세션/로비/테스트 초기화 경로를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/login_flow_test.cpp
 */
#include "foxnavy/http_session.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "foxnavy/api_response.hpp"
#include "foxnavy/cookie.hpp"
#include "foxnavy/player_name.hpp"

namespace foxnavy {

namespace {
std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string UrlDecode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '+') {
      out.push_back(' ');
    } else if (value[i] == '%' && i + 2 < value.size() && HexValue(value[i + 1]) >= 0 &&
               HexValue(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseFormParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

void SetJsonBody(HttpSession::Response& res, boost::beast::http::status status, const nlohmann::json& envelope) {
  res.result(status);
  res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res.body() = envelope.dump();
  res.content_length(res.body().size());
}

nlohmann::json IdentityJson(const PlayerIdentity& identity) {
  return {{"playerId", identity.player_id},
          {"playerName", identity.player_name},
          {"gameMode", GameModeName(identity.game_mode)}};
}

const char* RedirectFor(GameMode mode) { return mode == GameMode::kMultiplayer ? "/lobby" : "/start-game"; }
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<const SessionGateway> gateway,
                         std::shared_ptr<Lobby> lobby,
                         std::shared_ptr<TestControl> test_control,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), gateway_(std::move(gateway)), lobby_(std::move(lobby)),
      test_control_(std::move(test_control)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  player_id_.reset();
  observability_->IncrementRequest();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "foxnavy-server");
  res->set(http::field::cache_control, "no-store");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(payload));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(lobby_->Size());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"sessions", {{"started", snapshot.sessions_started}}},
                        {"authFailures",
                         {{"missing", snapshot.auth_missing},
                          {"badSignature", snapshot.auth_bad_signature},
                          {"malformed", snapshot.auth_malformed},
                          {"expired", snapshot.auth_expired}}},
                        {"lobby", {{"players", snapshot.lobby_players}}}};
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/login") {
    HandleLogin(res);
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/player-name") {
    HandlePlayerName(res);
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/logout") {
    HandleLogout(res);
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/api/session") {
    auto auth = AuthenticateRequest();
    if (!auth.ok()) {
      SetJsonBody(*res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "No session found - please login"));
      return SendResponse(res);
    }
    auto data = IdentityJson(*auth.identity);
    data["issuedAt"] = ToIsoString(auth.issued_at);
    data["expiresAt"] = ToIsoString(auth.issued_at + gateway_->MaxAge());
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/api/lobby") {
    auto auth = AuthenticateRequest();
    if (!auth.ok()) {
      SetJsonBody(*res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "No session found - please login"));
      return SendResponse(res);
    }
    nlohmann::json players = nlohmann::json::array();
    for (const auto& player : lobby_->Players()) {
      players.push_back({{"playerName", player.player_name}, {"self", player.player_id == auth.identity->player_id}});
    }
    nlohmann::json data{{"version", lobby_->Version()},
                        {"joined", lobby_->Contains(auth.identity->player_id)},
                        {"players", players}};
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  // 테스트 훅이 없으면 이 경로는 존재하지 않는 경로와 같게 취급된다.
  if (test_control_ && req_.method() == http::verb::post && path == "/test/reset-lobby") {
    test_control_->ResetTestState();
    observability_->Log(LogContext{trace_id_, std::nullopt, std::nullopt, "test_state_reset", 0});
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope({{"status", "lobby cleared"}}));
    return SendResponse(res);
  }

  SetJsonBody(*res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  SendResponse(res);
}

void HttpSession::HandleLogin(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  std::unordered_map<std::string, std::string> form;
  try {
    form = ParseBody();
  } catch (const std::exception&) {
    SetJsonBody(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "요청 본문이 올바르지 않습니다"));
    return;
  }

  std::string error_code;
  std::string error_message;
  auto grant = gateway_->BeginSession(form["player_name"], form["game_mode"], error_code, error_message);
  if (!grant) {
    SetJsonBody(*res, http::status::bad_request, MakeErrorEnvelope(error_code, error_message));
    return;
  }
  if (grant->identity.game_mode == GameMode::kMultiplayer &&
      !lobby_->Join(grant->identity, error_code, error_message)) {
    SetJsonBody(*res, http::status::conflict, MakeErrorEnvelope(error_code, error_message));
    return;
  }

  player_id_ = grant->identity.player_id;
  observability_->RecordSessionStarted(trace_id_, grant->identity);
  res->set(http::field::set_cookie, BuildSessionCookie(grant->token, grant->max_age, config_.cookie_secure));

  const char* redirect = RedirectFor(grant->identity.game_mode);
  if (req_.find("HX-Request") != req_.end()) {
    res->result(http::status::no_content);
    res->set("HX-Redirect", redirect);
    res->content_length(0);
    return;
  }
  auto data = IdentityJson(grant->identity);
  data["redirect"] = redirect;
  SetJsonBody(*res, http::status::see_other, MakeSuccessEnvelope(data));
  res->set(http::field::location, redirect);
}

void HttpSession::HandlePlayerName(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  std::unordered_map<std::string, std::string> form;
  try {
    form = ParseBody();
  } catch (const std::exception&) {
    SetJsonBody(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "요청 본문이 올바르지 않습니다"));
    return;
  }
  const auto& name = form["player_name"];
  auto validation = ValidatePlayerName(name, false);
  nlohmann::json data{{"playerName", name},
                      {"valid", validation.valid},
                      {"errorMessage", validation.error_message},
                      {"cssClass", validation.css_class}};
  SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleLogout(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  auto auth = AuthenticateRequest();
  bool left_lobby = auth.ok() && lobby_->Leave(auth.identity->player_id);
  res->set(http::field::set_cookie, BuildClearedSessionCookie(config_.cookie_secure));
  SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope({{"loggedOut", true}, {"leftLobby", left_lobby}}));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, player_id_, std::nullopt, std::string(req_.target()), latency});
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

AuthResult HttpSession::AuthenticateRequest() {
  std::optional<std::string> cookie_value;
  auto cookie_it = req_.find(boost::beast::http::field::cookie);
  if (cookie_it != req_.end()) {
    cookie_value = FindCookie(std::string(cookie_it->value()), kSessionCookieName);
  }
  auto auth = gateway_->Authenticate(cookie_value);
  if (!auth.ok()) {
    observability_->RecordAuthFailure(trace_id_, auth.error);
    return auth;
  }
  player_id_ = auth.identity->player_id;
  observability_->RecordAuthSuccess(trace_id_, *auth.identity);
  return auth;
}

std::unordered_map<std::string, std::string> HttpSession::ParseBody() {
  auto content_type = std::string(req_[boost::beast::http::field::content_type]);
  if (content_type.rfind("application/json", 0) != 0) {
    return ParseFormParams(req_.body());
  }
  auto body_json = nlohmann::json::parse(req_.body());
  if (!body_json.is_object()) {
    throw std::runtime_error("invalid body");
  }
  std::unordered_map<std::string, std::string> fields;
  for (const auto& key : {"player_name", "game_mode"}) {
    if (!body_json.contains(key)) {
      continue;
    }
    if (!body_json[key].is_string()) {
      throw std::runtime_error("invalid body");
    }
    fields.emplace(key, body_json[key].get<std::string>());
  }
  return fields;
}

}  // namespace foxnavy
