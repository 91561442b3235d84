#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "mudlink/config.hpp"

namespace {

class ScopedEnv {
 public:
  ScopedEnv(const char* key, const char* value) : key_(key) { ::setenv(key, value, 1); }
  ~ScopedEnv() { ::unsetenv(key_); }

 private:
  const char* key_;
};

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
  auto cfg = mudlink::DefaultConfig();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.subject_root, "chat");
  EXPECT_EQ(cfg.rate_limit_window_seconds, 60u);
  EXPECT_EQ(cfg.rate_limit_direct, 30u);
  EXPECT_EQ(cfg.rate_limit_location, 20u);
  EXPECT_EQ(cfg.rate_limit_broadcast, 10u);
  EXPECT_EQ(cfg.rate_limit_system, 100u);
  EXPECT_EQ(cfg.pending_max_per_identity, 50u);
  EXPECT_EQ(cfg.pending_ttl_seconds, 60u);
  EXPECT_EQ(cfg.janitor_interval_seconds, 300u);
  EXPECT_DOUBLE_EQ(cfg.janitor_memory_threshold, 0.8);
  EXPECT_EQ(cfg.max_connection_age_seconds, 300u);
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
  ScopedEnv port("SERVER_PORT", "9090");
  ScopedEnv node("NODE_ID", "node-7");
  ScopedEnv direct("RATE_LIMIT_DIRECT", "5");
  ScopedEnv threshold("JANITOR_MEMORY_THRESHOLD", "0.5");

  auto cfg = mudlink::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9090);
  EXPECT_EQ(cfg.node_id, "node-7");
  EXPECT_EQ(cfg.rate_limit_direct, 5u);
  EXPECT_DOUBLE_EQ(cfg.janitor_memory_threshold, 0.5);
  EXPECT_EQ(cfg.rate_limit_location, 20u);
}

TEST(ConfigTest, MalformedValuesAreRejected) {
  {
    ScopedEnv bad("PENDING_TTL_SECONDS", "soon");
    EXPECT_THROW(mudlink::LoadConfigFromEnv(), std::invalid_argument);
  }
  {
    ScopedEnv bad("JANITOR_MEMORY_THRESHOLD", "1.5");
    EXPECT_THROW(mudlink::LoadConfigFromEnv(), std::out_of_range);
  }
}

}  // namespace
