/**
 * @file TestConfig.cpp
 * @brief Unit tests for engine::Config::Builder.
 */

#include <catch2/catch_test_macros.hpp>

#include <orb/engine/Config.hpp>

using namespace orb;
using namespace std::chrono_literals;

TEST_CASE("Config defaults", "[engine][config]")
{
    const engine::Config cfg = engine::Config::Builder{}.build();

    REQUIRE(cfg.sampleRate() == 48'000u);
    REQUIRE(cfg.blockSize() == 128u);
    REQUIRE_FALSE(cfg.spatialEnabledByDefault());
    REQUIRE(cfg.spatialToggleEnabled());
    REQUIRE(cfg.requireUserGesture());
    REQUIRE(cfg.repositionDebounce() == 50ms);
    REQUIRE(cfg.volumeRamp() == 10ms);
    REQUIRE(cfg.volumeRampFrames() == 480u);
    REQUIRE(cfg.pannerScale() == 1.0f);
    REQUIRE(cfg.panner().panningModel == graph::PanningModel::kHrtf);
    REQUIRE(cfg.panner().distanceModel == graph::DistanceModel::kInverse);
    REQUIRE(cfg.panner().refDistance == 1.0f);
    REQUIRE(cfg.panner().maxDistance == 10'000.0f);
    REQUIRE(cfg.panner().rolloffFactor == 1.0f);
    REQUIRE(cfg.panner().coneInnerAngle == 360.0f);
    REQUIRE(cfg.panner().coneOuterAngle == 0.0f);
    REQUIRE(cfg.panner().coneOuterGain == 0.0f);
    REQUIRE(cfg.logLevel() == core::LogLevel::kInfo);
}

TEST_CASE("Config builder overrides", "[engine][config]")
{
    const engine::Config cfg = engine::Config::Builder{}
                                   .sampleRate(44'100)
                                   .blockSize(256)
                                   .spatialEnabledByDefault(true)
                                   .spatialToggleEnabled(false)
                                   .requireUserGesture(false)
                                   .repositionDebounce(0ms)
                                   .volumeRamp(20ms)
                                   .pannerScale(3.0f)
                                   .panningModel(graph::PanningModel::kEqualPower)
                                   .distanceModel(graph::DistanceModel::kLinear)
                                   .refDistance(2.0f)
                                   .maxDistance(50.0f)
                                   .rolloffFactor(0.5f)
                                   .coneInnerAngle(90.0f)
                                   .coneOuterAngle(180.0f)
                                   .coneOuterGain(0.25f)
                                   .logLevel(core::LogLevel::kWarn)
                                   .build();

    REQUIRE(cfg.sampleRate() == 44'100u);
    REQUIRE(cfg.blockSize() == 256u);
    REQUIRE(cfg.spatialEnabledByDefault());
    REQUIRE_FALSE(cfg.spatialToggleEnabled());
    REQUIRE_FALSE(cfg.requireUserGesture());
    REQUIRE(cfg.repositionDebounce() == 0ms);
    REQUIRE(cfg.volumeRampFrames() == 882u);
    REQUIRE(cfg.pannerScale() == 3.0f);
    REQUIRE(cfg.panner().panningModel == graph::PanningModel::kEqualPower);
    REQUIRE(cfg.panner().distanceModel == graph::DistanceModel::kLinear);
    REQUIRE(cfg.panner().refDistance == 2.0f);
    REQUIRE(cfg.panner().maxDistance == 50.0f);
    REQUIRE(cfg.panner().rolloffFactor == 0.5f);
    REQUIRE(cfg.panner().coneInnerAngle == 90.0f);
    REQUIRE(cfg.panner().coneOuterAngle == 180.0f);
    REQUIRE(cfg.panner().coneOuterGain == 0.25f);
    REQUIRE(cfg.logLevel() == core::LogLevel::kWarn);
}

TEST_CASE("Negative durations clamp to zero", "[engine][config]")
{
    const engine::Config cfg = engine::Config::Builder{}.repositionDebounce(-5ms).volumeRamp(-1ms).build();

    REQUIRE(cfg.repositionDebounce() == 0ms);
    REQUIRE(cfg.volumeRampFrames() == 0u);
}
