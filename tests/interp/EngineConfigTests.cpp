//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/interp/EngineConfigTests.cpp
// Purpose: Verify environment overrides and validation of engine settings.
// Key invariants: Malformed environment values leave the field unchanged.
// Ownership/Lifetime: Each test restores the variables it sets.
//
//===----------------------------------------------------------------------===//

#include "interp/EngineConfig.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using ember::interp::EngineConfig;
using ember::interp::TraceConfig;

namespace
{
class EngineConfigEnvTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        clearEnvironment();
    }

    void TearDown() override
    {
        clearEnvironment();
    }

    static void clearEnvironment()
    {
        for (const char *name :
             {"EMBER_TRACE", "EMBER_DETECTOR_PERIOD", "EMBER_DETECTOR_WARMUP", "EMBER_MAX_SNAPSHOTS"})
            unsetenv(name);
    }
};
} // namespace

TEST(EngineConfigTest, DefaultsAreValid)
{
    const EngineConfig cfg;
    EXPECT_EQ(cfg.detectorPeriod, 256u);
    EXPECT_EQ(cfg.detectorWarmupSteps, 1'000'000u);
    EXPECT_EQ(cfg.maxSnapshots, 0u);
    EXPECT_EQ(cfg.pointerSize, 8);
    EXPECT_EQ(cfg.trace.mode, TraceConfig::Off);
    EXPECT_TRUE(cfg.validate().hasValue());
}

TEST(EngineConfigTest, ValidationRejectsBadSettings)
{
    EngineConfig period;
    period.detectorPeriod = 100;
    auto r = period.validate();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().message, "detector period 100 is not a power of two");

    EngineConfig pointer;
    pointer.pointerSize = 16;
    EXPECT_FALSE(pointer.validate().hasValue());

    EngineConfig frames;
    frames.maxFrames = 0;
    EXPECT_FALSE(frames.validate().hasValue());
}

TEST_F(EngineConfigEnvTest, EmptyEnvironmentYieldsDefaults)
{
    const EngineConfig defaults;
    const EngineConfig cfg = EngineConfig::fromEnvironment();
    EXPECT_EQ(cfg.detectorPeriod, defaults.detectorPeriod);
    EXPECT_EQ(cfg.detectorWarmupSteps, defaults.detectorWarmupSteps);
    EXPECT_EQ(cfg.maxSnapshots, defaults.maxSnapshots);
    EXPECT_EQ(cfg.pointerSize, defaults.pointerSize);
    EXPECT_EQ(cfg.maxFrames, defaults.maxFrames);
    EXPECT_EQ(cfg.trace.mode, TraceConfig::Off);
}

TEST_F(EngineConfigEnvTest, OverridesApplyOnTopOfBase)
{
    setenv("EMBER_TRACE", "IR", 1);
    setenv("EMBER_DETECTOR_PERIOD", "64", 1);
    setenv("EMBER_DETECTOR_WARMUP", "10", 1);
    setenv("EMBER_MAX_SNAPSHOTS", "3", 1);

    EngineConfig base;
    base.maxFrames = 12;
    const EngineConfig cfg = EngineConfig::fromEnvironment(base);
    EXPECT_EQ(cfg.trace.mode, TraceConfig::IR);
    EXPECT_EQ(cfg.detectorPeriod, 64u);
    EXPECT_EQ(cfg.detectorWarmupSteps, 10u);
    EXPECT_EQ(cfg.maxSnapshots, 3u);
    EXPECT_EQ(cfg.maxFrames, 12u);
}

TEST_F(EngineConfigEnvTest, TraceModesAreCaseInsensitive)
{
    setenv("EMBER_TRACE", "Src", 1);
    EXPECT_EQ(EngineConfig::fromEnvironment().trace.mode, TraceConfig::SRC);

    EngineConfig base;
    base.trace.mode = TraceConfig::IR;
    setenv("EMBER_TRACE", "0", 1);
    EXPECT_EQ(EngineConfig::fromEnvironment(base).trace.mode, TraceConfig::Off);

    setenv("EMBER_TRACE", "verbose", 1);
    EXPECT_EQ(EngineConfig::fromEnvironment(base).trace.mode, TraceConfig::IR);
}

TEST_F(EngineConfigEnvTest, MalformedNumbersAreIgnored)
{
    setenv("EMBER_DETECTOR_PERIOD", "12abc", 1);
    setenv("EMBER_DETECTOR_WARMUP", "", 1);
    const EngineConfig cfg = EngineConfig::fromEnvironment();
    EXPECT_EQ(cfg.detectorPeriod, 256u);
    EXPECT_EQ(cfg.detectorWarmupSteps, 1'000'000u);
}
