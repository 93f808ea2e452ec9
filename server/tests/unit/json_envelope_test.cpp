#include <string>

#include <gtest/gtest.h>

#include "foxnavy/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"playerName", "Ada"}};
  auto env = foxnavy::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = foxnavy::MakeErrorEnvelope("unauthorized", "No session found - please login");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "unauthorized");
  EXPECT_EQ(env["error"]["message"], "No session found - please login");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, TimestampIsUtcIso8601) {
  auto env = foxnavy::MakeSuccessEnvelope(nlohmann::json::object());
  auto ts = env["meta"]["timestamp"].get<std::string>();
  ASSERT_EQ(ts.size(), 20u);
  EXPECT_EQ(ts[10], 'T');
  EXPECT_EQ(ts.back(), 'Z');
}
