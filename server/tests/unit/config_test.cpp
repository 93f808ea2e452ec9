#include <cstdlib>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "foxnavy/config.hpp"
#include "foxnavy/session_gateway.hpp"

namespace {

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { Clear(); }
  void TearDown() override { Clear(); }

  static void Clear() {
    for (const char* key : {"SERVER_PORT", "LOG_LEVEL", "SESSION_SECRET", "SESSION_MAX_AGE_SECONDS",
                            "SESSION_COOKIE_SECURE", "TESTING"}) {
      unsetenv(key);
    }
  }
};

TEST_F(ConfigTest, MissingSecretIsFatal) {
  EXPECT_THROW(foxnavy::LoadConfigFromEnv(), std::runtime_error);
  setenv("SESSION_SECRET", "", 1);
  EXPECT_THROW(foxnavy::LoadConfigFromEnv(), std::runtime_error);
}

TEST_F(ConfigTest, DefaultsApplyWhenOnlySecretSet) {
  setenv("SESSION_SECRET", "dev-secret", 1);
  auto cfg = foxnavy::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.session_secret, "dev-secret");
  EXPECT_EQ(cfg.session_max_age_seconds, 86400u);
  EXPECT_FALSE(cfg.cookie_secure);
  EXPECT_FALSE(cfg.test_mode);
}

TEST_F(ConfigTest, ReadsOverrides) {
  setenv("SESSION_SECRET", "s", 1);
  setenv("SERVER_PORT", "9000", 1);
  setenv("LOG_LEVEL", "debug", 1);
  setenv("SESSION_MAX_AGE_SECONDS", "120", 1);
  setenv("SESSION_COOKIE_SECURE", "true", 1);
  setenv("TESTING", "1", 1);
  auto cfg = foxnavy::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9000);
  EXPECT_EQ(cfg.log_level, "debug");
  EXPECT_EQ(cfg.session_max_age_seconds, 120u);
  EXPECT_TRUE(cfg.cookie_secure);
  EXPECT_TRUE(cfg.test_mode);
}

TEST_F(ConfigTest, ZeroMaxAgeRejected) {
  setenv("SESSION_SECRET", "s", 1);
  setenv("SESSION_MAX_AGE_SECONDS", "0", 1);
  EXPECT_THROW(foxnavy::LoadConfigFromEnv(), std::runtime_error);
}

TEST_F(ConfigTest, MaxAgeMustBePositiveInteger) {
  setenv("SESSION_SECRET", "s", 1);
  for (const char* value : {"-1", "abc", "", "60s", "1.5"}) {
    setenv("SESSION_MAX_AGE_SECONDS", value, 1);
    EXPECT_THROW(foxnavy::LoadConfigFromEnv(), std::runtime_error) << "value: " << value;
  }
}

TEST_F(ConfigTest, MaxAgeCappedAtLimit) {
  setenv("SESSION_SECRET", "s", 1);
  auto limit = std::to_string(foxnavy::kSessionMaxAgeLimit.count());
  setenv("SESSION_MAX_AGE_SECONDS", limit.c_str(), 1);
  EXPECT_EQ(foxnavy::LoadConfigFromEnv().session_max_age_seconds,
            static_cast<std::size_t>(foxnavy::kSessionMaxAgeLimit.count()));

  auto over = std::to_string(foxnavy::kSessionMaxAgeLimit.count() + 1);
  setenv("SESSION_MAX_AGE_SECONDS", over.c_str(), 1);
  EXPECT_THROW(foxnavy::LoadConfigFromEnv(), std::runtime_error);
  setenv("SESSION_MAX_AGE_SECONDS", "20000000000", 1);
  EXPECT_THROW(foxnavy::LoadConfigFromEnv(), std::runtime_error);
}

TEST_F(ConfigTest, PortMustFitTcpRange) {
  setenv("SESSION_SECRET", "s", 1);
  for (const char* value : {"70000", "0", "-80", "http"}) {
    setenv("SERVER_PORT", value, 1);
    EXPECT_THROW(foxnavy::LoadConfigFromEnv(), std::runtime_error) << "value: " << value;
  }
  setenv("SERVER_PORT", "65535", 1);
  EXPECT_EQ(foxnavy::LoadConfigFromEnv().port, 65535);
}

}  // namespace
