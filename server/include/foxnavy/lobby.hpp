/*
 * 설명: 멀티플레이 로그인 플레이어가 대기하는 인메모리 로비를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lobby_test.cpp, server/tests/e2e/login_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "foxnavy/player_identity.hpp"
#include "foxnavy/test_control.hpp"

namespace foxnavy {

class Lobby : public ResettableState {
 public:
  bool Join(const PlayerIdentity& identity, std::string& error_code, std::string& error_message);
  bool Leave(const std::string& player_id);
  bool Contains(const std::string& player_id) const;
  std::vector<PlayerIdentity> Players() const;
  std::size_t Size() const;
  std::uint64_t Version() const;

  void ResetForTest() override;

 private:
  std::vector<PlayerIdentity> players_;
  std::uint64_t version_{0};
  mutable std::mutex mutex_;
};

}  // namespace foxnavy
