#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "foxnavy/session_gateway.hpp"

namespace {

constexpr std::chrono::seconds kMaxAge{600};

class SessionGatewayTest : public ::testing::Test {
 protected:
  std::shared_ptr<const foxnavy::TokenCodec> codec_ = std::make_shared<foxnavy::TokenCodec>("gateway-secret");
  foxnavy::SessionGateway gateway_{codec_, kMaxAge};

  foxnavy::SessionGrant Begin(const std::string& name, const std::string& mode) {
    std::string error_code;
    std::string error_message;
    auto grant = gateway_.BeginSession(name, mode, error_code, error_message);
    EXPECT_TRUE(grant.has_value()) << error_code << ": " << error_message;
    return grant.value_or(foxnavy::SessionGrant{});
  }
};

TEST_F(SessionGatewayTest, LoginThenAuthenticateReturnsSameIdentity) {
  auto grant = Begin("Ada", "multiplayer");

  auto result = gateway_.Authenticate(grant.token);
  ASSERT_TRUE(result.ok()) << foxnavy::AuthErrorName(result.error);
  EXPECT_EQ(result.identity->player_name, "Ada");
  EXPECT_EQ(result.identity->game_mode, foxnavy::GameMode::kMultiplayer);
  EXPECT_EQ(result.identity->player_id, grant.identity.player_id);
}

TEST_F(SessionGatewayTest, GrantCarriesCookieMaxAge) {
  auto grant = Begin("Ada", "computer");
  EXPECT_EQ(grant.max_age, kMaxAge);
  EXPECT_EQ(gateway_.MaxAge(), kMaxAge);
  EXPECT_EQ(grant.identity.game_mode, foxnavy::GameMode::kComputer);
}

TEST_F(SessionGatewayTest, PlayerIdsAreFreshAndUrlSafe) {
  std::set<std::string> ids;
  for (int i = 0; i < 50; ++i) {
    auto grant = Begin("Ada", "computer");
    EXPECT_EQ(grant.identity.player_id.size(), 22u);
    EXPECT_EQ(grant.identity.player_id.find_first_not_of(
                  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"),
              std::string::npos);
    ids.insert(grant.identity.player_id);
  }
  EXPECT_EQ(ids.size(), 50u);
}

TEST_F(SessionGatewayTest, NameIsTrimmedAndUnquoted) {
  EXPECT_EQ(Begin("   Ada  ", "computer").identity.player_name, "Ada");
  EXPECT_EQ(Begin("\"Grace Hopper\"", "computer").identity.player_name, "Grace Hopper");
}

TEST_F(SessionGatewayTest, HumanIsAcceptedAsMultiplayer) {
  EXPECT_EQ(Begin("Ada", "human").identity.game_mode, foxnavy::GameMode::kMultiplayer);
}

TEST_F(SessionGatewayTest, RejectsEmptyName) {
  std::string error_code;
  std::string error_message;
  auto grant = gateway_.BeginSession("   ", "computer", error_code, error_message);
  EXPECT_FALSE(grant.has_value());
  EXPECT_EQ(error_code, "invalid_player_name");
  EXPECT_EQ(error_message, "Player name is required");
}

TEST_F(SessionGatewayTest, RejectsUnknownMode) {
  std::string error_code;
  std::string error_message;
  auto grant = gateway_.BeginSession("Ada", "chess", error_code, error_message);
  EXPECT_FALSE(grant.has_value());
  EXPECT_EQ(error_code, "invalid_game_mode");
  EXPECT_EQ(error_message, "Invalid game mode: chess");
}

TEST_F(SessionGatewayTest, MissingCookieIsMissing) {
  auto result = gateway_.Authenticate(std::nullopt);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, foxnavy::AuthError::kMissing);
  EXPECT_FALSE(result.identity.has_value());
}

TEST_F(SessionGatewayTest, EmptyCookieIsNotMissing) {
  auto result = gateway_.Authenticate(std::string{});
  EXPECT_EQ(result.error, foxnavy::AuthError::kBadSignature);
}

TEST_F(SessionGatewayTest, ExpiresLazilyOnAuthenticate) {
  auto grant = Begin("Ada", "multiplayer");
  auto later = std::chrono::system_clock::now() + kMaxAge + std::chrono::seconds(2);
  auto result = gateway_.Authenticate(grant.token, later);
  EXPECT_EQ(result.error, foxnavy::AuthError::kExpired);
}

TEST_F(SessionGatewayTest, SecretRotationSurfacesAsBadSignature) {
  auto grant = Begin("Ada", "multiplayer");
  foxnavy::SessionGateway rotated(std::make_shared<foxnavy::TokenCodec>("rotated-secret"), kMaxAge);
  EXPECT_EQ(rotated.Authenticate(grant.token).error, foxnavy::AuthError::kBadSignature);
}

TEST(SessionGatewayConstructionTest, RejectsInvalidArguments) {
  EXPECT_THROW(foxnavy::SessionGateway(nullptr, kMaxAge), std::invalid_argument);
  EXPECT_THROW(foxnavy::SessionGateway(std::make_shared<foxnavy::TokenCodec>("s"), std::chrono::seconds(0)),
               std::invalid_argument);
  EXPECT_THROW(foxnavy::SessionGateway(std::make_shared<foxnavy::TokenCodec>("s"), std::chrono::seconds(-1)),
               std::invalid_argument);
  EXPECT_THROW(foxnavy::SessionGateway(std::make_shared<foxnavy::TokenCodec>("s"),
                                       foxnavy::kSessionMaxAgeLimit + std::chrono::seconds(1)),
               std::invalid_argument);
  EXPECT_NO_THROW(foxnavy::SessionGateway(std::make_shared<foxnavy::TokenCodec>("s"), foxnavy::kSessionMaxAgeLimit));
}

}  // namespace
