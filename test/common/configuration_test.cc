#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include "../test_util.h"

#include <cstdlib>

using namespace Seastitch;
using namespace Seastitch::testing_util;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("SEASTITCH_FRAGMENT_SIZE");
        unsetenv("SEASTITCH_INSTRUMENT_ID");
        Configuration::getInstance().reset();
    }

    Configuration& config_ = Configuration::getInstance();
};

TEST_F(ConfigurationTest, Defaults) {
    EXPECT_TRUE(config_.validate());
    EXPECT_EQ(config_.getInstrumentId(), 0);
    EXPECT_EQ(config_.getDefaultFragmentSize(), 8192u);
    EXPECT_EQ(config_.getStopTimeoutSec(), 60);
    EXPECT_EQ(config_.config().mission.cache_file.get(), "processed_files.cache");
    EXPECT_EQ(config_.config().mission.lock_file.get(), ".seastitch_lock");
    EXPECT_TRUE(config_.config().loggers.empty());
}

TEST_F(ConfigurationTest, LoadFromString) {
    ASSERT_TRUE(config_.loadFromString(R"(
seastitch:
  mission:
    instrument_id: 45
    cache_file: cache.txt
  fragments:
    default_fragment_size: 4096
    transfer_manifest: comm.yml
  guard:
    stop_timeout_sec: 5
    poll_interval_ms: 50
  loggers:
    - prefix: sc
    - prefix: tm
      strip_files: true
)"));
    const SeastitchConfig& c = config_.config();
    EXPECT_EQ(config_.getInstrumentId(), 45);
    EXPECT_EQ(c.mission.cache_file.get(), "cache.txt");
    // Unset keys keep their defaults
    EXPECT_EQ(c.mission.lock_file.get(), ".seastitch_lock");
    EXPECT_EQ(config_.getDefaultFragmentSize(), 4096u);
    EXPECT_EQ(c.fragments.transfer_manifest.get(), "comm.yml");
    EXPECT_EQ(config_.getStopTimeoutSec(), 5);
    EXPECT_EQ(c.guard.poll_interval_ms.get(), 50);
    ASSERT_EQ(c.loggers.size(), 2u);
    EXPECT_EQ(c.loggers[0].prefix, "sc");
    EXPECT_FALSE(c.loggers[0].strip_files);
    EXPECT_TRUE(c.loggers[1].strip_files);
}

TEST_F(ConfigurationTest, LoadFromFile) {
    TempDir dir;
    WriteFile(dir.File("seastitch.yaml"), "seastitch:\n  mission:\n    instrument_id: 7\n");
    ASSERT_TRUE(config_.loadFromFile(dir.File("seastitch.yaml")));
    EXPECT_EQ(config_.getInstrumentId(), 7);
    EXPECT_FALSE(config_.loadFromFile(dir.File("missing.yaml")));
}

TEST_F(ConfigurationTest, ValidationCollectsEveryError) {
    EXPECT_FALSE(config_.loadFromString(R"(
seastitch:
  mission:
    instrument_id: 1000
    cache_file: ""
  fragments:
    default_fragment_size: 0
  loggers:
    - prefix: sg
    - prefix: abc
)"));
    std::vector<std::string> errors = config_.getValidationErrors();
    EXPECT_EQ(errors.size(), 5u);
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(config_.loadFromString("seastitch: [unclosed"));
    EXPECT_FALSE(config_.loadFromString("seastitch:\n  mission:\n    instrument_id: forty\n"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config_.loadFromString("seastitch:\n  fragments:\n    default_fragment_size: 4096\n"));
    setenv("SEASTITCH_FRAGMENT_SIZE", "2048", 1);
    EXPECT_EQ(config_.getDefaultFragmentSize(), 2048u);
    setenv("SEASTITCH_INSTRUMENT_ID", "not-a-number", 1);
    EXPECT_EQ(config_.getInstrumentId(), 0);
}
