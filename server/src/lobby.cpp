/*
 * 설명: 로비 입장/퇴장과 버전 증가, 테스트용 초기화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lobby_test.cpp
 */
#include "foxnavy/lobby.hpp"

#include <algorithm>

namespace foxnavy {

bool Lobby::Join(const PlayerIdentity& identity, std::string& error_code, std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto same_name = std::find_if(players_.begin(), players_.end(), [&](const PlayerIdentity& p) {
    return p.player_name == identity.player_name;
  });
  if (same_name != players_.end()) {
    error_code = "duplicate_player";
    error_message = "Player name '" + identity.player_name + "' already exists in lobby";
    return false;
  }
  players_.push_back(identity);
  ++version_;
  return true;
}

bool Lobby::Leave(const std::string& player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(players_.begin(), players_.end(),
                         [&](const PlayerIdentity& p) { return p.player_id == player_id; });
  if (it == players_.end()) {
    return false;
  }
  players_.erase(it);
  ++version_;
  return true;
}

bool Lobby::Contains(const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(players_.begin(), players_.end(),
                     [&](const PlayerIdentity& p) { return p.player_id == player_id; });
}

std::vector<PlayerIdentity> Lobby::Players() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return players_;
}

std::size_t Lobby::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return players_.size();
}

std::uint64_t Lobby::Version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

void Lobby::ResetForTest() {
  std::lock_guard<std::mutex> lock(mutex_);
  players_.clear();
  version_ = 0;
}

}  // namespace foxnavy
