#include <gtest/gtest.h>

#include "config.hpp"
#include "payload_controller_config.hpp"

using namespace sat_payload;

// ═══════════════════════════════════════════════════════════════════════════
// Default values
// ═══════════════════════════════════════════════════════════════════════════

TEST(PayloadControllerConfigTest, DefaultsAreValid) {
  PayloadControllerConfig cfg{};
  EXPECT_TRUE(cfg.IsValid());
}

TEST(PayloadControllerConfigTest, DefaultTimings) {
  PayloadControllerConfig cfg{};
  EXPECT_EQ(cfg.telemetry_period_ms, 10000u);
  EXPECT_EQ(cfg.boot_timeout_ms, 120000u);
  EXPECT_EQ(cfg.shutdown_timeout_ms, 10000u);
  EXPECT_EQ(cfg.response_window_ms, 15u);
  EXPECT_EQ(cfg.response_poll_ms, 1u);
}

TEST(PayloadControllerConfigTest, DefaultRetryLimits) {
  PayloadControllerConfig cfg{};
  EXPECT_EQ(cfg.max_packet_retries, 3);
  EXPECT_EQ(cfg.max_boot_attempts, 3);
}

// ═══════════════════════════════════════════════════════════════════════════
// IsValid
// ═══════════════════════════════════════════════════════════════════════════

TEST(PayloadControllerConfigTest, IsValid_ZeroRetries_Invalid) {
  PayloadControllerConfig cfg{};
  cfg.max_packet_retries = 0;
  EXPECT_FALSE(cfg.IsValid());
}

TEST(PayloadControllerConfigTest, IsValid_PollLongerThanWindow_Invalid) {
  PayloadControllerConfig cfg{};
  cfg.response_window_ms = 10;
  cfg.response_poll_ms = 11;
  EXPECT_FALSE(cfg.IsValid());
}

TEST(PayloadControllerConfigTest, IsValid_ShortBootTimeout_Invalid) {
  PayloadControllerConfig cfg{};
  cfg.boot_timeout_ms = 999;
  EXPECT_FALSE(cfg.IsValid());
}

TEST(PayloadControllerConfigTest, IsValid_ZeroBootAttempts_Valid) {
  PayloadControllerConfig cfg{};
  cfg.max_boot_attempts = 0;
  EXPECT_TRUE(cfg.IsValid()) << "Zero disables automatic re-boot";
}

TEST(PayloadControllerConfigTest, IsValid_BoundaryValues) {
  PayloadControllerConfig cfg{};
  cfg.telemetry_period_ms = 100;
  cfg.boot_timeout_ms = 600000;
  cfg.shutdown_timeout_ms = 120000;
  cfg.response_window_ms = 1000;
  cfg.response_poll_ms = 1000;
  cfg.max_packet_retries = 10;
  cfg.max_boot_attempts = 10;
  EXPECT_TRUE(cfg.IsValid());
}

// ═══════════════════════════════════════════════════════════════════════════
// Clamp / Reset
// ═══════════════════════════════════════════════════════════════════════════

TEST(PayloadControllerConfigTest, Clamp_BringsEverythingIntoRange) {
  PayloadControllerConfig cfg{};
  cfg.telemetry_period_ms = 1;
  cfg.boot_timeout_ms = 10000000;
  cfg.shutdown_timeout_ms = 0;
  cfg.response_window_ms = 5000;
  cfg.response_poll_ms = 0;
  cfg.max_packet_retries = 50;
  cfg.max_boot_attempts = 200;

  cfg.Clamp();

  EXPECT_TRUE(cfg.IsValid());
  EXPECT_EQ(cfg.telemetry_period_ms, 100u);
  EXPECT_EQ(cfg.boot_timeout_ms, 600000u);
  EXPECT_EQ(cfg.shutdown_timeout_ms, 100u);
  EXPECT_EQ(cfg.response_window_ms, 1000u);
  EXPECT_EQ(cfg.response_poll_ms, 1u);
  EXPECT_EQ(cfg.max_packet_retries, 10);
  EXPECT_EQ(cfg.max_boot_attempts, 10);
}

TEST(PayloadControllerConfigTest, Clamp_PollFollowsWindow) {
  PayloadControllerConfig cfg{};
  cfg.response_window_ms = 5;
  cfg.response_poll_ms = 8;
  cfg.Clamp();
  EXPECT_EQ(cfg.response_poll_ms, 5u);
  EXPECT_TRUE(cfg.IsValid());
}

TEST(PayloadControllerConfigTest, Clamp_KeepsValidConfig) {
  PayloadControllerConfig cfg{};
  cfg.telemetry_period_ms = 2500;
  cfg.max_packet_retries = 5;
  cfg.Clamp();
  EXPECT_EQ(cfg.telemetry_period_ms, 2500u);
  EXPECT_EQ(cfg.max_packet_retries, 5);
}

TEST(PayloadControllerConfigTest, Reset_RestoresDefaults) {
  PayloadControllerConfig cfg{};
  cfg.telemetry_period_ms = 500;
  cfg.max_packet_retries = 1;
  cfg.Reset();
  EXPECT_EQ(cfg.telemetry_period_ms,
            config::PayloadConfig::kTelemetryPeriodMs);
  EXPECT_EQ(cfg.max_packet_retries, config::PayloadConfig::kMaxPacketRetries);
}
