#include <stdlib.h>

#include <gtest/gtest.h>

#include "../src/common/configuration.h"
#include "test_helpers.h"

using namespace Rxcache;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().resetToDefaults();
    }
    void TearDown() override {
        unsetenv("RXCACHE_BUILD_WORKERS");
        unsetenv("RXCACHE_BUILD_FAIL_IF_NOT_CACHED");
        Configuration::getInstance().resetToDefaults();
    }
};

TEST_F(ConfigurationTest, Defaults) {
    const RxcacheConfig& config = Configuration::getInstance().config();
    EXPECT_EQ(config.cache.path.get(), "rxcui.cache");
    EXPECT_EQ(config.remote.base_url.get(), "https://rxnav.nlm.nih.gov/REST");
    EXPECT_EQ(config.remote.retry_limit.get(), 40);
    EXPECT_EQ(config.remote.retry_delay_ms.get(), 15000);
    EXPECT_EQ(config.remote.stats_interval.get(), 500u);
    EXPECT_EQ(config.build.workers.get(), 4);
    EXPECT_FALSE(config.build.fail_if_not_cached.get());
    EXPECT_EQ(config.build.va_root_class.get(), "VA000");
    EXPECT_TRUE(Configuration::getInstance().validate());
}

TEST_F(ConfigurationTest, LoadFromStringOverridesOnlyGivenKeys) {
    Configuration& configuration = Configuration::getInstance();
    ASSERT_TRUE(configuration.loadFromString(R"(
rxcache:
  cache:
    path: "/data/rx.cache"
  remote:
    retry_delay_ms: 0
  build:
    workers: 8
    fail_if_not_cached: true
)"));
    EXPECT_EQ(configuration.getCachePath(), "/data/rx.cache");
    EXPECT_EQ(configuration.getWorkerCount(), 8);
    EXPECT_EQ(configuration.config().remote.retry_delay_ms.get(), 0);
    EXPECT_TRUE(configuration.config().build.fail_if_not_cached.get());
    EXPECT_EQ(configuration.getRetryLimit(), 40);
}

TEST_F(ConfigurationTest, EnvironmentBeatsFile) {
    Configuration& configuration = Configuration::getInstance();
    ASSERT_TRUE(configuration.loadFromString("rxcache:\n  build:\n    workers: 8\n"));
    setenv("RXCACHE_BUILD_WORKERS", "2", 1);
    setenv("RXCACHE_BUILD_FAIL_IF_NOT_CACHED", "yes", 1);
    EXPECT_EQ(configuration.getWorkerCount(), 2);
    EXPECT_TRUE(configuration.config().build.fail_if_not_cached.get());
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBack) {
    setenv("RXCACHE_BUILD_WORKERS", "many", 1);
    EXPECT_EQ(Configuration::getInstance().getWorkerCount(), 4);
}

TEST_F(ConfigurationTest, ValidationCollectsEveryError) {
    Configuration& configuration = Configuration::getInstance();
    EXPECT_FALSE(configuration.loadFromString(R"(
rxcache:
  remote:
    retry_limit: 0
    retry_delay_ms: -1
  build:
    workers: 0
)"));
    auto errors = configuration.getValidationErrors();
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigurationTest, OverlongSocketPathRejected) {
    Configuration& configuration = Configuration::getInstance();
    configuration.config().channel.socket_path.set("/tmp/" + std::string(200, 's') + ".sock");
    EXPECT_FALSE(configuration.validate());
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(Configuration::getInstance().loadFromString("rxcache: [unclosed"));
}

TEST_F(ConfigurationTest, LoadFromFile) {
    Rxcache::testing_util::TempDir dir;
    std::string path = dir.File("rxcache.yaml");
    Rxcache::testing_util::WriteStringToFile(path, "rxcache:\n  build:\n    va_root_class: \"VA100\"\n");
    ASSERT_TRUE(Configuration::getInstance().loadFromFile(path));
    EXPECT_EQ(GetConfig().config().build.va_root_class.get(), "VA100");
    EXPECT_FALSE(Configuration::getInstance().loadFromFile(dir.File("missing.yaml")));
}
