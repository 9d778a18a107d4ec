/**
 * @file TestSpatialPositionIndex.cpp
 * @brief Unit tests for participant placement and the registry.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "AudioTestUtils.hpp"

#include <cmath>
#include <numbers>
#include <string>
#include <vector>

using namespace orb;
using namespace orb::audio;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

void requireAzimuth(const Azimuth &actual, const Azimuth &expected)
{
    REQUIRE_THAT(actual.x, WithinAbs(expected.x, 1e-6));
    REQUIRE_THAT(actual.y, WithinAbs(expected.y, 1e-6));
}

} // anonymous namespace

// -------------------------------------------------------------------------- //
//  computeAzimuth                                                            //
// -------------------------------------------------------------------------- //

TEST_CASE("A single participant is placed straight ahead", "[audio][index][azimuth]")
{
    requireAzimuth(SpatialPositionIndex::computeAzimuth(1, 1), {0.0f, 1.0f});
}

TEST_CASE("Three participants: center and mirrored sides", "[audio][index][azimuth]")
{
    const float side = static_cast<float>(std::sin(std::numbers::pi / 4.0));

    requireAzimuth(SpatialPositionIndex::computeAzimuth(2, 3), {0.0f, 1.0f});
    requireAzimuth(SpatialPositionIndex::computeAzimuth(1, 3), {-side, side});
    requireAzimuth(SpatialPositionIndex::computeAzimuth(3, 3), {side, side});
}

TEST_CASE("Placement is symmetric about the center", "[audio][index][azimuth]")
{
    for (core::usize count = 2; count <= 5; ++count)
    {
        for (core::usize place = 1; place <= count; ++place)
        {
            const Azimuth a = SpatialPositionIndex::computeAzimuth(place, count);
            const Azimuth b = SpatialPositionIndex::computeAzimuth(count + 1 - place, count);
            REQUIRE_THAT(a.x, WithinAbs(-b.x, 1e-6));
            REQUIRE_THAT(a.y, WithinAbs(b.y, 1e-6));
            REQUIRE_THAT(a.x * a.x + a.y * a.y, WithinAbs(1.0, 1e-5));
            REQUIRE(a.y > 0.0f);
        }
    }
}

TEST_CASE("Placement is a pure function of place and count", "[audio][index][azimuth]")
{
    for (core::usize count = 1; count <= 8; ++count)
    {
        for (core::usize place = 1; place <= count; ++place)
            REQUIRE(SpatialPositionIndex::computeAzimuth(place, count)
                    == SpatialPositionIndex::computeAzimuth(place, count));
    }
}

TEST_CASE("Neighbours get closer as the conference grows", "[audio][index][azimuth]")
{
    float previous = 2.0f;
    for (core::usize count = 2; count <= 8; ++count)
    {
        const float gap = SpatialPositionIndex::computeAzimuth(2, count).x
                        - SpatialPositionIndex::computeAzimuth(1, count).x;
        REQUIRE(gap > 0.0f);
        REQUIRE(gap < previous);
        previous = gap;
    }
}

TEST_CASE("Placing nobody is a no-op", "[audio][index][azimuth]")
{
    requireAzimuth(SpatialPositionIndex::computeAzimuth(0, 0), {0.0f, 1.0f});

    test::Conference conf;
    conf.index.flush();
    REQUIRE(conf.index.size() == 0);
    REQUIRE_FALSE(conf.index.isDirty());
}

// -------------------------------------------------------------------------- //
//  Registry                                                                  //
// -------------------------------------------------------------------------- //

TEST_CASE("Registry keeps join order and answers lookups", "[audio][index]")
{
    test::Conference conf;
    conf.attach("a");
    conf.attach("b");
    conf.attach("c");

    REQUIRE(conf.index.size() == 3);
    REQUIRE(conf.index.ids() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(conf.index.indexOf("b") == 1u);
    REQUIRE_FALSE(conf.index.indexOf("z").has_value());
    REQUIRE(conf.index.find("c") != nullptr);
    REQUIRE(conf.index.find("z") == nullptr);
    REQUIRE_FALSE(conf.index.positionOf("z").has_value());

    std::vector<std::string> visited;
    conf.index.forEach([&visited](const ParticipantAudioGraph &graph) {
        visited.push_back(graph.participantId());
    });
    REQUIRE(visited == conf.index.ids());
}

TEST_CASE("Churn re-indexes contiguously with the new count", "[audio][index]")
{
    test::Conference conf;
    conf.attach("A");
    conf.attach("B");
    conf.attach("C");

    REQUIRE(conf.index.detach("B"));

    REQUIRE(conf.index.indexOf("A") == 0u);
    REQUIRE(conf.index.indexOf("C") == 1u);
    requireAzimuth(*conf.index.positionOf("A"), SpatialPositionIndex::computeAzimuth(1, 2));
    requireAzimuth(*conf.index.positionOf("C"), SpatialPositionIndex::computeAzimuth(2, 2));
}

TEST_CASE("Detaching an unknown participant does nothing", "[audio][index]")
{
    test::Conference conf;
    conf.attach("a");
    const auto before = conf.index.recomputeCount();

    REQUIRE_FALSE(conf.index.detach("ghost"));
    REQUIRE(conf.index.size() == 1);
    REQUIRE(conf.index.recomputeCount() == before);

    REQUIRE(conf.index.detach("a"));
    REQUIRE_FALSE(conf.index.detach("a"));
}

TEST_CASE("Attaching an id twice replaces its graph in place", "[audio][index]")
{
    test::Conference conf;
    conf.attach("a");
    ParticipantAudioGraph &first = conf.attach("b");
    conf.attach("c");
    first.setVolume(0.3f);

    graph::AudioContext *context = conf.contexts.getContext();
    REQUIRE(context->liveNodeCount() == 1 + 3 * 3);

    ParticipantAudioGraph &second = conf.attach("b");
    REQUIRE(&second != &first);
    REQUIRE(conf.index.size() == 3);
    REQUIRE(conf.index.indexOf("b") == 1u);
    REQUIRE(conf.index.find("b") == &second);
    REQUIRE(context->liveNodeCount() == 1 + 3 * 3);
    requireAzimuth(second.position(), SpatialPositionIndex::computeAzimuth(2, 3));
}

TEST_CASE("A new participant is placed immediately", "[audio][index]")
{
    test::Conference conf{{.debounce = 50ms}};

    ParticipantAudioGraph &a = conf.attach("a");
    requireAzimuth(a.position(), SpatialPositionIndex::computeAzimuth(1, 1));

    ParticipantAudioGraph &b = conf.attach("b");
    requireAzimuth(b.position(), SpatialPositionIndex::computeAzimuth(2, 2));
    // the others move at the next recomputation
    requireAzimuth(a.position(), SpatialPositionIndex::computeAzimuth(1, 1));
    REQUIRE(conf.index.isDirty());
}

TEST_CASE("Recomputation is debounced under churn", "[audio][index]")
{
    test::Conference conf{{.debounce = 50ms}};
    const Clock::time_point t0 = conf.now;

    conf.attach("a");
    conf.now = t0 + 10ms;
    conf.attach("b");
    conf.now = t0 + 20ms;
    conf.attach("c");
    REQUIRE(conf.index.recomputeCount() == 0);

    REQUIRE_FALSE(conf.index.pump(t0 + 30ms));
    REQUIRE_FALSE(conf.index.pump(t0 + 69ms));
    REQUIRE(conf.index.pump(t0 + 70ms));
    REQUIRE_FALSE(conf.index.isDirty());
    REQUIRE(conf.index.recomputeCount() == 1);
    REQUIRE_FALSE(conf.index.pump(t0 + 200ms));

    requireAzimuth(*conf.index.positionOf("a"), SpatialPositionIndex::computeAzimuth(1, 3));
    requireAzimuth(*conf.index.positionOf("b"), SpatialPositionIndex::computeAzimuth(2, 3));
    requireAzimuth(*conf.index.positionOf("c"), SpatialPositionIndex::computeAzimuth(3, 3));
}

TEST_CASE("Continuous churn is placed after a bounded delay", "[audio][index]")
{
    test::Conference conf{{.debounce = 50ms}};
    const Clock::time_point t0 = conf.now;

    for (int step = 0; step <= 4; ++step)
    {
        conf.now = t0 + step * 40ms;
        conf.attach("p" + std::to_string(step));
    }

    REQUIRE_FALSE(conf.index.pump(t0 + 190ms));
    REQUIRE(conf.index.pump(t0 + 200ms));
    REQUIRE(conf.index.recomputeCount() == 1);
}

TEST_CASE("Zero debounce recomputes on every change", "[audio][index]")
{
    test::Conference conf;
    conf.attach("a");
    conf.attach("b");
    REQUIRE(conf.index.recomputeCount() == 2);
    REQUIRE_FALSE(conf.index.isDirty());
}

TEST_CASE("move and reorder change places", "[audio][index]")
{
    test::Conference conf;
    conf.attach("a");
    conf.attach("b");
    conf.attach("c");
    conf.attach("d");

    REQUIRE(conf.index.move("a", 2).has_value());
    REQUIRE(conf.index.ids() == std::vector<std::string>{"b", "c", "a", "d"});
    requireAzimuth(*conf.index.positionOf("a"), SpatialPositionIndex::computeAzimuth(3, 4));

    REQUIRE(conf.index.move("d", 0).has_value());
    REQUIRE(conf.index.ids() == std::vector<std::string>{"d", "b", "c", "a"});
    REQUIRE(conf.index.indexOf("a") == 3u);

    auto unknown = conf.index.move("z", 0);
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code() == core::ErrorCode::kNotFound);

    auto outOfRange = conf.index.move("a", 4);
    REQUIRE_FALSE(outOfRange.has_value());
    REQUIRE(outOfRange.error().code() == core::ErrorCode::kOutOfRange);

    const std::vector<std::string> order{"c", "ghost", "a", "c"};
    conf.index.reorder(order);
    REQUIRE(conf.index.ids() == std::vector<std::string>{"c", "a", "d", "b"});
    REQUIRE(conf.index.indexOf("b") == 3u);
    requireAzimuth(*conf.index.positionOf("c"), SpatialPositionIndex::computeAzimuth(1, 4));
}

TEST_CASE("Unchanged order does not recompute", "[audio][index]")
{
    test::Conference conf;
    conf.attach("a");
    conf.attach("b");
    const auto before = conf.index.recomputeCount();

    const std::vector<std::string> order{"a", "b"};
    conf.index.reorder(order);
    REQUIRE(conf.index.move("a", 0).has_value());
    REQUIRE(conf.index.recomputeCount() == before);
}

TEST_CASE("Index works in pass-through mode", "[audio][index]")
{
    test::Conference conf{{.supported = false}};
    conf.attach("a");
    conf.attach("b");

    REQUIRE(conf.index.find("a")->isPassthrough());
    requireAzimuth(*conf.index.positionOf("b"), SpatialPositionIndex::computeAzimuth(2, 2));
    REQUIRE(conf.index.detach("a"));
    requireAzimuth(*conf.index.positionOf("b"), SpatialPositionIndex::computeAzimuth(1, 1));
}
