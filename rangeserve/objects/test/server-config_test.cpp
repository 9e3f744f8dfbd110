#include "rangeserve/server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace rangeserve {

TEST(ServerConfigTest, DefaultShouldBeValid) {
  ServerConfig cfg;
  EXPECT_NO_THROW(cfg.validate());
  EXPECT_EQ(cfg.port, 0);
  EXPECT_EQ(cfg.connectionTimeout, std::chrono::seconds{120});
  EXPECT_EQ(cfg.maxHeaderBytes, 8192U);
}

TEST(ServerConfigTest, FluentSetters) {
  ServerConfig cfg;
  cfg.withPort(8080)
      .withReusePort()
      .withConnectionTimeout(std::chrono::seconds{3})
      .withMaxHeaderBytes(4096)
      .withPollInterval(std::chrono::milliseconds{20})
      .withMaxDrainPeriod(std::chrono::milliseconds{0});
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_TRUE(cfg.reusePort);
  EXPECT_EQ(cfg.connectionTimeout, std::chrono::seconds{3});
  EXPECT_EQ(cfg.maxHeaderBytes, 4096U);
  EXPECT_EQ(cfg.pollInterval, std::chrono::milliseconds{20});
  EXPECT_NO_THROW(cfg.validate());
}

TEST(ServerConfigTest, InvalidValues) {
  ServerConfig cfg;
  cfg.withMaxHeaderBytes(16);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = ServerConfig{};
  cfg.withConnectionTimeout(std::chrono::milliseconds{0});
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = ServerConfig{};
  cfg.withPollInterval(std::chrono::milliseconds{0});
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = ServerConfig{};
  cfg.withMaxDrainPeriod(std::chrono::milliseconds{-1});
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

}  // namespace rangeserve
