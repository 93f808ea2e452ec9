#include <string>

#include <gtest/gtest.h>

#include "foxnavy/lobby.hpp"

namespace {

foxnavy::PlayerIdentity Player(const std::string& id, const std::string& name) {
  return foxnavy::PlayerIdentity{id, name, foxnavy::GameMode::kMultiplayer};
}

TEST(LobbyTest, JoinAndLeaveBumpVersion) {
  foxnavy::Lobby lobby;
  std::string error_code;
  std::string error_message;

  ASSERT_TRUE(lobby.Join(Player("p1", "Alice"), error_code, error_message));
  ASSERT_TRUE(lobby.Join(Player("p2", "Bob"), error_code, error_message));
  EXPECT_EQ(lobby.Size(), 2u);
  EXPECT_EQ(lobby.Version(), 2u);
  EXPECT_TRUE(lobby.Contains("p1"));

  EXPECT_TRUE(lobby.Leave("p1"));
  EXPECT_FALSE(lobby.Contains("p1"));
  EXPECT_EQ(lobby.Version(), 3u);
  ASSERT_EQ(lobby.Players().size(), 1u);
  EXPECT_EQ(lobby.Players()[0].player_name, "Bob");
}

TEST(LobbyTest, DuplicateNameRejected) {
  foxnavy::Lobby lobby;
  std::string error_code;
  std::string error_message;
  ASSERT_TRUE(lobby.Join(Player("p1", "Alice"), error_code, error_message));

  EXPECT_FALSE(lobby.Join(Player("p2", "Alice"), error_code, error_message));
  EXPECT_EQ(error_code, "duplicate_player");
  EXPECT_EQ(error_message, "Player name 'Alice' already exists in lobby");
  EXPECT_EQ(lobby.Version(), 1u);
}

TEST(LobbyTest, LeaveUnknownPlayerIsNoop) {
  foxnavy::Lobby lobby;
  EXPECT_FALSE(lobby.Leave("ghost"));
  EXPECT_EQ(lobby.Version(), 0u);
}

TEST(LobbyTest, ResetForTestClearsEverything) {
  foxnavy::Lobby lobby;
  std::string error_code;
  std::string error_message;
  ASSERT_TRUE(lobby.Join(Player("p1", "Alice"), error_code, error_message));

  lobby.ResetForTest();
  EXPECT_EQ(lobby.Size(), 0u);
  EXPECT_EQ(lobby.Version(), 0u);
  EXPECT_TRUE(lobby.Join(Player("p3", "Alice"), error_code, error_message));
}

}  // namespace
