#include "application/service_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include <gtest/gtest.h>

using masumi::application::ConfigReaderError;
using masumi::application::ServiceConfig;
using namespace masumi::application;

namespace {
  ServiceConfig validConfig() {
    auto config = ServiceConfig::Defaults();
    config.payment_service_url = "https://payment.example.org/api/v1";
    config.payment_api_key = "secret";
    return config;
  }
}  // namespace

/**
 * @given defaults without the required entries
 * @when validated
 * @then MISSING_ENTRY is returned, and a completed config passes
 */
TEST(ServiceConfigTest, RequiredEntries) {
  auto missing = validateConfig(ServiceConfig::Defaults());
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), ConfigReaderError::MISSING_ENTRY);

  auto no_key = validConfig();
  no_key.payment_api_key.clear();
  EXPECT_EQ(validateConfig(no_key).error(), ConfigReaderError::MISSING_ENTRY);

  EXPECT_TRUE(validateConfig(validConfig()));
}

/**
 * @given configs with a bad url or zero interval
 * @when validated
 * @then INVALID_VALUE is returned
 */
TEST(ServiceConfigTest, InvalidValues) {
  auto bad_url = validConfig();
  bad_url.payment_service_url = "ftp://payment.example.org";
  EXPECT_EQ(validateConfig(bad_url).error(), ConfigReaderError::INVALID_VALUE);

  auto bad_registry = validConfig();
  bad_registry.registry_service_url = "registry";
  EXPECT_EQ(validateConfig(bad_registry).error(), ConfigReaderError::INVALID_VALUE);

  auto zero_interval = validConfig();
  zero_interval.monitor_interval_ms = 0;
  EXPECT_EQ(validateConfig(zero_interval).error(), ConfigReaderError::INVALID_VALUE);
}

/**
 * @given the defaults
 * @when read
 * @then they match the documented values
 */
TEST(ServiceConfigTest, Defaults) {
  auto config = ServiceConfig::Defaults();
  EXPECT_EQ(config.network, "Preprod");
  EXPECT_EQ(config.payment_type, "WEB3_CARDANO_V1");
  EXPECT_EQ(config.monitor_interval_ms, 60000u);
  EXPECT_EQ(config.status_page_limit, 10u);
  EXPECT_EQ(config.log_level, "info");
}

/**
 * @given JSON config text
 * @when parsed and overlaid on the defaults
 * @then present entries win and absent ones keep their default
 */
TEST(ServiceConfigTest, ParseAndOverlay) {
  auto parsed = parseConfig(R"({
    "payment_service_url": "http://localhost:3001/api/v1",
    "payment_api_key": "abc",
    "network": "Mainnet",
    "monitor_interval_ms": 5000
  })");
  ASSERT_TRUE(parsed);

  auto config = overlay(ServiceConfig::Defaults(), parsed.value());
  EXPECT_EQ(config.payment_service_url, "http://localhost:3001/api/v1");
  EXPECT_EQ(config.payment_api_key, "abc");
  EXPECT_EQ(config.network, "Mainnet");
  EXPECT_EQ(config.monitor_interval_ms, 5000u);
  EXPECT_EQ(config.payment_type, "WEB3_CARDANO_V1");
  EXPECT_EQ(config.status_page_limit, 10u);
  EXPECT_TRUE(validateConfig(config));
}

/**
 * @given malformed config text or entries of the wrong type
 * @when parsed
 * @then PARSER_ERROR or INVALID_VALUE is returned
 */
TEST(ServiceConfigTest, ParseErrors) {
  EXPECT_EQ(parseConfig("{").error(), ConfigReaderError::PARSER_ERROR);
  EXPECT_EQ(parseConfig("[1, 2]").error(), ConfigReaderError::PARSER_ERROR);
  EXPECT_EQ(parseConfig(R"({"payment_api_key": 7})").error(), ConfigReaderError::INVALID_VALUE);
  EXPECT_EQ(parseConfig(R"({"monitor_interval_ms": -1})").error(), ConfigReaderError::INVALID_VALUE);
  EXPECT_EQ(parseConfig(R"({"monitor_interval_ms": 0})").error(), ConfigReaderError::INVALID_VALUE);
  EXPECT_EQ(parseConfig(R"({"status_page_limit": 0})").error(), ConfigReaderError::INVALID_VALUE);
}

/**
 * @given a config file on disk and a missing path
 * @when loaded
 * @then the file entries are read and the missing one is FILE_NOT_FOUND
 */
TEST(ServiceConfigTest, LoadFile) {
  const std::string path = ::testing::TempDir() + "masumi_service_config_test.json";
  {
    std::ofstream file(path);
    file << R"({"payment_service_url": "https://p.example.org", "status_page_limit": 25})";
  }
  auto loaded = loadConfigFile(path);
  std::remove(path.c_str());
  ASSERT_TRUE(loaded);
  EXPECT_EQ(loaded.value().payment_service_url, "https://p.example.org");
  EXPECT_EQ(loaded.value().status_page_limit, 25u);

  auto missing = loadConfigFile(path);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), ConfigReaderError::FILE_NOT_FOUND);
}

/**
 * @given MASUMI_* variables in the environment
 * @when the environment config is loaded and overlaid
 * @then the variables override the defaults
 */
TEST(ServiceConfigTest, Environment) {
  setenv("MASUMI_PAYMENT_URL", "https://env.example.org", 1);
  setenv("MASUMI_PAYMENT_KEY", "env-key", 1);
  setenv("MASUMI_NETWORK", "Mainnet", 1);
  unsetenv("MASUMI_REGISTRY_URL");
  unsetenv("MASUMI_REGISTRY_KEY");

  auto config = overlay(ServiceConfig::Defaults(), loadConfigFromEnvironment());
  EXPECT_EQ(config.payment_service_url, "https://env.example.org");
  EXPECT_EQ(config.payment_api_key, "env-key");
  EXPECT_EQ(config.network, "Mainnet");
  EXPECT_TRUE(config.registry_service_url.empty());
  EXPECT_TRUE(validateConfig(config));

  unsetenv("MASUMI_PAYMENT_URL");
  unsetenv("MASUMI_PAYMENT_KEY");
  unsetenv("MASUMI_NETWORK");
}
