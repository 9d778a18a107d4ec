/**
 * @file TestSpatializationModeController.cpp
 * @brief Unit tests for the conference-wide spatial/mono switch.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "AudioTestUtils.hpp"

#include <cmath>
#include <thread>
#include <vector>

using namespace orb;
using namespace orb::audio;
using Catch::Matchers::WithinAbs;

namespace {

bool allWiredAs(test::Conference &conf, bool spatial)
{
    bool ok = true;
    conf.index.forEach([&ok, spatial](const ParticipantAudioGraph &graph) {
        ok = ok && graph.isSpatialPath() == spatial && test::wiredAs(graph, spatial);
    });
    return ok;
}

} // anonymous namespace

TEST_CASE("Toggle rewires every live graph", "[audio][mode]")
{
    test::Conference conf;
    conf.attach("a");
    conf.attach("b");
    conf.attach("c");
    REQUIRE(allWiredAs(conf, false));

    auto on = conf.mode.toggle();
    REQUIRE(on.has_value());
    REQUIRE(*on);
    REQUIRE(conf.mode.enabled());
    REQUIRE(allWiredAs(conf, true));

    auto off = conf.mode.toggle();
    REQUIRE(off.has_value());
    REQUIRE_FALSE(*off);
    REQUIRE(allWiredAs(conf, false));
}

TEST_CASE("Toggle round trip keeps volume and mute", "[audio][mode]")
{
    test::Conference conf;
    ParticipantAudioGraph &a = conf.attach("a");
    ParticipantAudioGraph &b = conf.attach("b");
    a.setVolume(0.25f);
    b.setMuted(true);

    REQUIRE(conf.mode.toggle().has_value());
    REQUIRE(conf.mode.toggle().has_value());

    REQUIRE(allWiredAs(conf, false));
    REQUIRE_THAT(a.volume(), WithinAbs(0.25, 1e-6));
    REQUIRE_THAT(a.gainValue(), WithinAbs(0.25, 1e-6));
    REQUIRE_FALSE(a.muted());
    REQUIRE(b.muted());
    REQUIRE(b.volume() == 1.0f);
    REQUIRE(b.gainValue() == 0.0f);
}

TEST_CASE("Enabling applies the cached positions", "[audio][mode]")
{
    test::Conference conf;
    ParticipantAudioGraph &a = conf.attach("a");
    ParticipantAudioGraph &b = conf.attach("b");

    REQUIRE(a.pannerNode()->position() == math::Vec3f{0.0f, 0.0f, 0.0f});

    conf.mode.setEnabled(true);
    const Azimuth expected = SpatialPositionIndex::computeAzimuth(2, 2);
    const core::f32 scale = b.options().pannerScale;
    REQUIRE(b.pannerNode()->position() == math::Vec3f{expected.x * scale, expected.y * scale, 0.0f});
}

TEST_CASE("New graphs follow the current mode", "[audio][mode]")
{
    test::Conference conf;
    conf.mode.setEnabled(true);

    ParticipantAudioGraph &late = conf.attach("late");
    REQUIRE(late.isSpatialPath());
    REQUIRE(test::wiredAs(late, true));
}

TEST_CASE("State changes are signalled to subscribers", "[audio][mode]")
{
    test::Conference conf;
    std::vector<bool> seen;
    const SubscriptionId id = conf.mode.onStateChanged([&seen](bool enabled) { seen.push_back(enabled); });

    REQUIRE(conf.mode.toggle().has_value());
    conf.mode.setEnabled(true);
    conf.mode.setEnabled(false);
    REQUIRE(seen == std::vector<bool>{true, false});

    REQUIRE(conf.mode.unsubscribe(id));
    REQUIRE_FALSE(conf.mode.unsubscribe(id));
    REQUIRE(conf.mode.toggle().has_value());
    REQUIRE(seen.size() == 2);
}

TEST_CASE("Disabled toggle feature rejects toggles", "[audio][mode]")
{
    test::Conference conf{{.toggleEnabled = false}};
    conf.attach("a");

    auto result = conf.mode.toggle();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kNotSupported);
    REQUIRE_FALSE(conf.mode.enabled());
    REQUIRE(allWiredAs(conf, false));
    REQUIRE_FALSE(conf.mode.toggleEnabled());
}

TEST_CASE("Toggle skips graphs already detached", "[audio][mode]")
{
    test::Conference conf;
    ParticipantAudioGraph &gone = conf.attach("gone");
    ParticipantAudioGraph &kept = conf.attach("kept");
    gone.detach();

    REQUIRE(conf.mode.toggle().has_value());
    REQUIRE_FALSE(gone.isAttached());
    REQUIRE_FALSE(gone.isSpatialPath());
    REQUIRE(test::wiredAs(kept, true));
}

TEST_CASE("Toggle has no wiring effect in pass-through mode", "[audio][mode]")
{
    test::Conference conf{{.supported = false}};
    ParticipantAudioGraph &a = conf.attach("a");

    REQUIRE(conf.mode.toggle().has_value());
    REQUIRE(conf.mode.enabled());
    REQUIRE(a.isPassthrough());
    REQUIRE_FALSE(a.isSpatialPath());
}

TEST_CASE("Concurrent toggles never leave a graph mid-rewire", "[audio][mode]")
{
    test::Conference conf;
    for (int i = 0; i < 6; ++i)
        conf.attach("p" + std::to_string(i));

    constexpr int kTogglesPerThread = 25;
    std::vector<std::thread> threads;
    for (int t = 0; t < 2; ++t)
    {
        threads.emplace_back([&conf]() {
            for (int i = 0; i < kTogglesPerThread; ++i)
                (void) conf.mode.toggle();
        });
    }
    for (auto &thread : threads)
        thread.join();

    REQUIRE_FALSE(conf.mode.enabled());
    REQUIRE(allWiredAs(conf, false));
}

TEST_CASE("Rendering keeps running across a toggle", "[audio][mode][render]")
{
    test::Conference conf;
    REQUIRE(conf.contexts.getContext() != nullptr);
    REQUIRE(conf.contexts.ensureRunning(true).get());

    auto stream = test::makeStream("a");
    std::vector<float> pcm(512, 0.5f);
    REQUIRE(stream->write(pcm) == pcm.size());
    REQUIRE(conf.index.attach("a", stream).has_value());

    auto mono = conf.sink->pull(128);
    REQUIRE_THAT(mono[0], WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(mono[1], WithinAbs(0.5, 1e-6));

    REQUIRE(conf.mode.toggle().has_value());
    auto spatial = conf.sink->pull(128);
    REQUIRE(std::abs(spatial[254]) > 0.0f);
    REQUIRE(std::abs(spatial[255]) > 0.0f);
}
