#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include "../../src/pipeline/pipeline_config.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace Handoff;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("HANDOFF_SOURCE_LENGTH");
        unsetenv("HANDOFF_TRACE_ITEMS");
        unsetenv("HANDOFF_LOG_LEVEL");
        Configuration::getInstance().reset();
    }

    Configuration& configuration() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, Defaults) {
    const HandoffConfig& config = configuration().config();
    EXPECT_EQ(config.pipeline.source_length.get(), 10);
    EXPECT_EQ(config.pipeline.capacity.get(), 0);
    EXPECT_EQ(config.pipeline.backend.get(), "monitor");
    EXPECT_EQ(config.source.policy.get(), "mixed");
    EXPECT_FALSE(config.logging.trace_items.get());
    EXPECT_TRUE(configuration().validate());
}

TEST_F(ConfigurationTest, LoadFromString) {
    ASSERT_TRUE(configuration().loadFromString(R"(
handoff:
  pipeline:
    source_length: 1000
    capacity: 7
    backend: mpmc
  source:
    policy: reals
    seed: 99
  logging:
    trace_items: true
)"));

    const HandoffConfig& config = configuration().config();
    EXPECT_EQ(config.pipeline.source_length.get(), 1000);
    EXPECT_EQ(config.pipeline.capacity.get(), 7);
    EXPECT_EQ(config.pipeline.backend.get(), "mpmc");
    EXPECT_EQ(config.source.policy.get(), "reals");
    EXPECT_EQ(config.source.seed.get(), 99);
    EXPECT_TRUE(config.logging.trace_items.get());
    EXPECT_FALSE(config.logging.print_sequences.get());
}

TEST_F(ConfigurationTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "handoff_config_test.yaml";
    {
        std::ofstream out(path);
        out << "handoff:\n  pipeline:\n    source_length: 4\n";
    }
    EXPECT_TRUE(configuration().loadFromFile(path));
    EXPECT_EQ(configuration().config().pipeline.source_length.get(), 4);
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, MissingFileFails) {
    EXPECT_FALSE(configuration().loadFromFile("/nonexistent/handoff.yaml"));
}

TEST_F(ConfigurationTest, MalformedValueFails) {
    EXPECT_FALSE(configuration().loadFromString("handoff:\n  pipeline:\n    source_length: many\n"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFileValue) {
    ASSERT_TRUE(configuration().loadFromString("handoff:\n  pipeline:\n    source_length: 4\n"));
    setenv("HANDOFF_SOURCE_LENGTH", "25", 1);
    setenv("HANDOFF_TRACE_ITEMS", "yes", 1);
    EXPECT_EQ(configuration().config().pipeline.source_length.get(), 25);
    EXPECT_TRUE(configuration().config().logging.trace_items.get());
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBack) {
    setenv("HANDOFF_SOURCE_LENGTH", "lots", 1);
    EXPECT_EQ(configuration().config().pipeline.source_length.get(), 10);

    configuration().config().pipeline.source_length.set(6);
    setenv("HANDOFF_SOURCE_LENGTH", "-1", 1);
    EXPECT_EQ(configuration().config().pipeline.source_length.get(), 6);
    setenv("HANDOFF_SOURCE_LENGTH", "12abc", 1);
    EXPECT_EQ(configuration().config().pipeline.source_length.get(), 6);

    setenv("HANDOFF_LOG_LEVEL", "2.5", 1);
    EXPECT_EQ(configuration().config().logging.verbosity.get(), 0);
    setenv("HANDOFF_TRACE_ITEMS", "maybe", 1);
    EXPECT_FALSE(configuration().config().logging.trace_items.get());
}

TEST_F(ConfigurationTest, ValidationCollectsErrors) {
    configuration().config().logging.verbosity.set(-1);
    configuration().config().pipeline.backend.set("");
    EXPECT_FALSE(configuration().validate());
    EXPECT_EQ(configuration().getValidationErrors().size(), 2);
}

TEST_F(ConfigurationTest, BuildsPipelineOptions) {
    HandoffConfig& config = configuration().config();
    config.pipeline.source_length.set(8);
    config.pipeline.backend.set("mpmc");
    config.source.policy.set("integers");
    config.source.seed.set(5);

    PipelineOptions options;
    std::string error;
    ASSERT_TRUE(PipelineOptionsFromConfig(config, options, error)) << error;
    EXPECT_EQ(options.source_length, 8);
    EXPECT_EQ(options.capacity, 0);
    EXPECT_EQ(options.backend, ChannelBackend::kMpmc);
    EXPECT_EQ(options.policy, SourcePolicy::kIntegers);
    EXPECT_EQ(options.seed, 5);
}

TEST_F(ConfigurationTest, UnknownNamesAreRejected) {
    PipelineOptions options;
    std::string error;

    configuration().config().source.policy.set("primes");
    EXPECT_FALSE(PipelineOptionsFromConfig(configuration().config(), options, error));
    EXPECT_NE(error.find("primes"), std::string::npos);

    configuration().config().source.policy.set("mixed");
    configuration().config().pipeline.backend.set("ring");
    EXPECT_FALSE(PipelineOptionsFromConfig(configuration().config(), options, error));
    EXPECT_NE(error.find("ring"), std::string::npos);
}
