#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "common/configuration.h"

using namespace VerifyRep;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("VERIFYREP_WORKER_THREADS");
        unsetenv("VERIFYREP_REPLICATION_ENABLED");
        Configuration::getInstance().reset();
    }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    const Configuration& configuration = Configuration::getInstance();
    EXPECT_TRUE(configuration.validate());
    EXPECT_EQ(configuration.getScanCaching(), 1);
    EXPECT_EQ(configuration.getWorkerThreads(), 4);
    EXPECT_EQ(configuration.getMaxPartitionAttempts(), 2);
    EXPECT_TRUE(configuration.isReplicationEnabled());
}

TEST_F(ConfigurationTest, LoadFromString) {
    Configuration& configuration = Configuration::getInstance();
    ASSERT_TRUE(configuration.loadFromString(R"(
verifyrep:
  registry:
    address: "registry.example:2181"
  local:
    scan_address: "primary.example:16020"
  scan:
    caching: 100
  job:
    worker_threads: 8
    max_partition_attempts: 3
  replication:
    enabled: false
)"));
    EXPECT_EQ(configuration.getRegistryAddress(), "registry.example:2181");
    EXPECT_EQ(configuration.getLocalScanAddress(), "primary.example:16020");
    EXPECT_EQ(configuration.getScanCaching(), 100);
    EXPECT_EQ(configuration.getWorkerThreads(), 8);
    EXPECT_EQ(configuration.getMaxPartitionAttempts(), 3);
    EXPECT_FALSE(configuration.isReplicationEnabled());
}

TEST_F(ConfigurationTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "verifyrep_config_test.yaml";
    {
        std::ofstream out(path);
        out << "verifyrep:\n  scan:\n    rpc_timeout_ms: 1234\n";
    }
    Configuration& configuration = Configuration::getInstance();
    ASSERT_TRUE(configuration.loadFromFile(path));
    EXPECT_EQ(configuration.config().scan.rpc_timeout_ms.get(), 1234);
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, MissingFileFailsToLoad) {
    EXPECT_FALSE(Configuration::getInstance().loadFromFile("/nonexistent/verifyrep.yaml"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    Configuration& configuration = Configuration::getInstance();
    ASSERT_TRUE(configuration.loadFromString("verifyrep:\n  job:\n    worker_threads: 8\n"));
    setenv("VERIFYREP_WORKER_THREADS", "16", 1);
    setenv("VERIFYREP_REPLICATION_ENABLED", "off", 1);
    EXPECT_EQ(configuration.getWorkerThreads(), 16);
    EXPECT_FALSE(configuration.isReplicationEnabled());
}

TEST_F(ConfigurationTest, BooleanEnvironmentValues) {
    Configuration& configuration = Configuration::getInstance();
    setenv("VERIFYREP_REPLICATION_ENABLED", "NO", 1);
    EXPECT_FALSE(configuration.isReplicationEnabled());
    setenv("VERIFYREP_REPLICATION_ENABLED", "On", 1);
    EXPECT_TRUE(configuration.isReplicationEnabled());

    // Non-ASCII bytes are not a boolean, the configured value stays
    configuration.config().replication.enabled.set(false);
    setenv("VERIFYREP_REPLICATION_ENABLED", "\xC3\x9C\xFF", 1);
    EXPECT_FALSE(configuration.isReplicationEnabled());
}

TEST_F(ConfigurationTest, ValidationReportsEveryError) {
    Configuration& configuration = Configuration::getInstance();
    EXPECT_FALSE(configuration.loadFromString(R"(
verifyrep:
  scan:
    caching: 0
  job:
    worker_threads: 0
    max_partition_attempts: 0
)"));
    EXPECT_EQ(configuration.getValidationErrors().size(), 3u);
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(Configuration::getInstance().loadFromString("verifyrep: [unterminated"));
}
