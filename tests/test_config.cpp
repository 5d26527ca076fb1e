// Tests for configuration validation.
#include "syncplay/syncplay.h"

#include <gtest/gtest.h>

TEST(ConfigValidationTest, DefaultsAreValid) {
  syncplay::Config config;
  std::string error;
  EXPECT_TRUE(config.Validate(&error)) << error;
  EXPECT_EQ(config.http_port, 8080);
  EXPECT_EQ(config.control_port, 9999);
  EXPECT_EQ(config.trigger_port, 9998);
  EXPECT_EQ(config.sync_delay.count(), 3000);
  EXPECT_EQ(config.precision_margin.count(), 50);
}

TEST(ConfigValidationTest, RejectsEmptyDeviceName) {
  syncplay::Config config;
  config.device_name.clear();
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("device_name"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsMultilineDeviceName) {
  syncplay::Config config;
  config.device_name = "two\nlines";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("device_name"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsInvalidBindAddress) {
  syncplay::Config config;
  config.bind_address = "999.999.999.999";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("bind_address"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsInvalidBroadcastAddress) {
  syncplay::Config config;
  config.broadcast_address = "not-an-ip";
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("broadcast_address"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsZeroOrCollidingPorts) {
  syncplay::Config config;
  config.http_port = 0;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("ports"), std::string::npos);

  config = syncplay::Config{};
  config.trigger_port = config.control_port;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("trigger_port"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsNonPositiveDelays) {
  syncplay::Config config;
  config.sync_delay = std::chrono::milliseconds(0);
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("sync_delay"), std::string::npos);

  config = syncplay::Config{};
  config.precision_margin = std::chrono::milliseconds(-1);
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("precision_margin"), std::string::npos);

  config = syncplay::Config{};
  config.clock_sample_count = 0;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("clock sampling"), std::string::npos);

  config = syncplay::Config{};
  config.read_timeout = std::chrono::milliseconds(0);
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("timeouts"), std::string::npos);
}

TEST(ConfigValidationTest, StartFailsOnInvalidConfig) {
  syncplay::Config config;
  config.device_name.clear();
  std::string logged;
  config.log_callback = [&](const std::string& line) { logged = line; };
  syncplay::HostSession session(config);
  EXPECT_FALSE(session.Start());
  EXPECT_FALSE(session.IsRunning());
  EXPECT_NE(session.GetLastError().find("device_name"), std::string::npos);
  EXPECT_NE(logged.find("device_name"), std::string::npos);
}
