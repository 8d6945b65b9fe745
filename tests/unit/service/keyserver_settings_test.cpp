#include <gtest/gtest.h>

#include <string>

#include "eks/foundation/config_manager.hpp"
#include "eks/foundation/error_code.hpp"
#include "eks/service/keyserver_settings.hpp"

using namespace eks::service;
using eks::foundation::ConfigManager;
using eks::foundation::ErrorCode;
using eks::foundation::LogFormat;
using eks::foundation::LogLevel;

namespace {

eks::foundation::ServiceResult<KeyserverSettings> settingsFrom(const std::string& yaml) {
    ConfigManager config;
    auto loaded = config.loadFromString(yaml);
    EXPECT_TRUE(loaded.hasValue()) << yaml;
    return loadKeyserverSettings(config);
}

void expectInvalid(const std::string& yaml, std::string_view key) {
    auto settings = settingsFrom(yaml);
    ASSERT_TRUE(settings.hasError()) << yaml;
    EXPECT_EQ(settings.error().code(), ErrorCode::ConfigInvalidValue) << yaml;
    EXPECT_NE(settings.error().message().find(key), std::string_view::npos)
        << settings.error().message();
}

}  // namespace

TEST(KeyserverSettingsTest, DefaultsWithEmptyConfig) {
    ConfigManager config;
    auto settings = loadKeyserverSettings(config);
    ASSERT_TRUE(settings.hasValue());

    const auto& s = settings.value();
    EXPECT_EQ(s.http.bindAddress, "127.0.0.1");
    EXPECT_EQ(s.http.port, 3030);
    EXPECT_EQ(s.workerThreads, 4u);
    EXPECT_EQ(s.http.maxBodyBytes, 65536u);
    EXPECT_EQ(s.http.readTimeout.count(), 5000);
    EXPECT_EQ(s.database.path, "keys.sqlite");
    EXPECT_EQ(s.database.maxConnections, 4u);
    EXPECT_EQ(s.keyserver.challengeTtl.count(), 300);
    EXPECT_EQ(s.keyserver.minRsaBits, 2048);
    EXPECT_FALSE(s.stateKeyHex.has_value());
    EXPECT_EQ(s.logLevel, LogLevel::Info);
    EXPECT_EQ(s.logFormat, LogFormat::Text);
}

TEST(KeyserverSettingsTest, ReadsEveryKey) {
    auto settings = settingsFrom(R"(
server:
  bind_address: 0.0.0.0
  port: 8080
  worker_threads: 16
  max_body_bytes: 4096
  read_timeout_ms: 250
database:
  path: /var/lib/ember/keys.sqlite
  max_connections: 8
keyserver:
  challenge_ttl_seconds: 60
  min_rsa_bits: 3072
  state_key_hex: "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"
logging:
  level: debug
  format: json
)");
    ASSERT_TRUE(settings.hasValue());

    const auto& s = settings.value();
    EXPECT_EQ(s.http.bindAddress, "0.0.0.0");
    EXPECT_EQ(s.http.port, 8080);
    EXPECT_EQ(s.workerThreads, 16u);
    EXPECT_EQ(s.http.maxBodyBytes, 4096u);
    EXPECT_EQ(s.http.readTimeout.count(), 250);
    EXPECT_EQ(s.database.path, "/var/lib/ember/keys.sqlite");
    EXPECT_EQ(s.database.maxConnections, 8u);
    EXPECT_EQ(s.keyserver.challengeTtl.count(), 60);
    EXPECT_EQ(s.keyserver.minRsaBits, 3072);
    ASSERT_TRUE(s.stateKeyHex.has_value());
    EXPECT_EQ(s.stateKeyHex->size(), 64u);
    EXPECT_EQ(s.logLevel, LogLevel::Debug);
    EXPECT_EQ(s.logFormat, LogFormat::Json);
}

TEST(KeyserverSettingsTest, PortZeroAndTtlZeroAreAllowed) {
    auto settings = settingsFrom(
        "server:\n  port: 0\nkeyserver:\n  challenge_ttl_seconds: 0\n");
    ASSERT_TRUE(settings.hasValue());
    EXPECT_EQ(settings.value().http.port, 0);
    EXPECT_EQ(settings.value().keyserver.challengeTtl.count(), 0);
}

TEST(KeyserverSettingsTest, EmptyStateKeyMeansRandom) {
    auto settings = settingsFrom("keyserver:\n  state_key_hex: \"\"\n");
    ASSERT_TRUE(settings.hasValue());
    EXPECT_FALSE(settings.value().stateKeyHex.has_value());
}

TEST(KeyserverSettingsTest, OutOfRangeValues) {
    expectInvalid("server:\n  port: 70000\n", "server.port");
    expectInvalid("server:\n  port: -1\n", "server.port");
    expectInvalid("server:\n  worker_threads: 0\n", "server.worker_threads");
    expectInvalid("server:\n  max_body_bytes: 0\n", "server.max_body_bytes");
    expectInvalid("server:\n  read_timeout_ms: 0\n", "server.read_timeout_ms");
    expectInvalid("database:\n  path: \"\"\n", "database.path");
    expectInvalid("database:\n  max_connections: 0\n", "database.max_connections");
    expectInvalid("keyserver:\n  challenge_ttl_seconds: -5\n", "keyserver.challenge_ttl_seconds");
    expectInvalid("keyserver:\n  min_rsa_bits: 512\n", "keyserver.min_rsa_bits");
}

TEST(KeyserverSettingsTest, BadStateKey) {
    expectInvalid("keyserver:\n  state_key_hex: abcd\n", "keyserver.state_key_hex");
    expectInvalid("keyserver:\n  state_key_hex: \"" + std::string(64, 'g') + "\"\n",
                  "keyserver.state_key_hex");
}

TEST(KeyserverSettingsTest, BadLogging) {
    expectInvalid("logging:\n  level: loud\n", "logging.level");
    expectInvalid("logging:\n  format: xml\n", "logging.format");
}

TEST(KeyserverSettingsTest, WrongTypeIsTypeMismatch) {
    auto settings = settingsFrom("server:\n  port: eighty\n");
    ASSERT_TRUE(settings.hasError());
    EXPECT_EQ(settings.error().code(), ErrorCode::ConfigTypeMismatch);
}
