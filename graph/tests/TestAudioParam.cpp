/**
 * @file TestAudioParam.cpp
 * @brief Unit tests for orb::graph::AudioParam.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <orb/graph/AudioParam.hpp>

#include <array>

using namespace orb;
using Catch::Matchers::WithinAbs;

TEST_CASE("AudioParam clamps its default and set values", "[graph][param]")
{
    graph::AudioParam param{2.0f, 0.0f, 1.0f};
    REQUIRE(param.value() == 1.0f);

    param.setValue(-3.0f);
    REQUIRE(param.value() == 0.0f);
    REQUIRE(param.targetValue() == 0.0f);
    REQUIRE_FALSE(param.isRamping());
}

TEST_CASE("AudioParam linear ramp reaches its target on the last frame", "[graph][param]")
{
    graph::AudioParam param{0.0f, 0.0f, 1.0f};
    param.linearRampTo(1.0f, 4);
    REQUIRE(param.isRamping());
    REQUIRE(param.targetValue() == 1.0f);
    REQUIRE(param.value() == 0.0f);

    std::array<float, 6> values{};
    param.process(values);

    REQUIRE_THAT(values[0], WithinAbs(0.25, 1e-6));
    REQUIRE_THAT(values[1], WithinAbs(0.50, 1e-6));
    REQUIRE_THAT(values[2], WithinAbs(0.75, 1e-6));
    REQUIRE(values[3] == 1.0f);
    REQUIRE(values[4] == 1.0f);
    REQUIRE(values[5] == 1.0f);
    REQUIRE_FALSE(param.isRamping());
}

TEST_CASE("AudioParam zero-length ramp applies immediately", "[graph][param]")
{
    graph::AudioParam param{1.0f, 0.0f, 1.0f};
    param.linearRampTo(0.3f, 0);

    REQUIRE_FALSE(param.isRamping());
    REQUIRE_THAT(param.value(), WithinAbs(0.3, 1e-6));
}

TEST_CASE("AudioParam cancelScheduledValues freezes the ramp", "[graph][param]")
{
    graph::AudioParam param{0.0f, 0.0f, 1.0f};
    param.linearRampTo(1.0f, 8);

    std::array<float, 2> head{};
    param.process(head);
    REQUIRE_THAT(param.value(), WithinAbs(0.25, 1e-6));

    param.cancelScheduledValues();
    REQUIRE_FALSE(param.isRamping());
    REQUIRE_THAT(param.targetValue(), WithinAbs(0.25, 1e-6));

    std::array<float, 4> tail{};
    param.process(tail);
    for (float v : tail)
        REQUIRE_THAT(v, WithinAbs(0.25, 1e-6));
}

TEST_CASE("AudioParam retargeting starts from the reached value", "[graph][param]")
{
    graph::AudioParam param{0.0f, 0.0f, 1.0f};
    param.linearRampTo(1.0f, 4);

    std::array<float, 2> head{};
    param.process(head);

    param.linearRampTo(0.0f, 2);
    std::array<float, 2> tail{};
    param.process(tail);

    REQUIRE_THAT(tail[0], WithinAbs(0.25, 1e-6));
    REQUIRE(tail[1] == 0.0f);
}
