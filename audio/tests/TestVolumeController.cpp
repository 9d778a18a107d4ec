/**
 * @file TestVolumeController.cpp
 * @brief Unit tests for per-participant volume and mute.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "AudioTestUtils.hpp"

#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace orb;
using namespace orb::audio;
using Catch::Matchers::WithinAbs;

namespace {

class FakeElement final : public IVolumeSource {
public:
    FakeElement(std::optional<core::f32> volume, bool muted) : _volume{volume}, _muted{muted} {}

    std::optional<core::f32> initialVolume() const override { return _volume; }
    bool initiallyMuted() const override { return _muted; }

private:
    std::optional<core::f32> _volume;
    bool                     _muted;
};

} // anonymous namespace

TEST_CASE("Unknown participants are rejected", "[audio][volume]")
{
    test::Conference conf;
    conf.attach("a");

    REQUIRE_FALSE(conf.volumes.setVolume("ghost", 0.5f));
    REQUIRE_FALSE(conf.volumes.setMuted("ghost", true));
    REQUIRE_FALSE(conf.volumes.volume("ghost").has_value());
    REQUIRE_FALSE(conf.volumes.muted("ghost").has_value());
    REQUIRE_FALSE(conf.volumes.applyInitialVolume("ghost", FakeElement{0.3f, false}));
}

TEST_CASE("Volume changes are isolated per participant", "[audio][volume]")
{
    test::Conference conf;
    ParticipantAudioGraph &a = conf.attach("a");
    ParticipantAudioGraph &b = conf.attach("b");

    REQUIRE(conf.volumes.setVolume("a", 0.4f));
    REQUIRE(conf.volumes.setMuted("b", true));

    REQUIRE_THAT(a.gainValue(), WithinAbs(0.4, 1e-6));
    REQUIRE_FALSE(a.muted());
    REQUIRE(b.gainValue() == 0.0f);
    REQUIRE(b.volume() == 1.0f);
}

TEST_CASE("Volume is clamped and NaN is refused", "[audio][volume]")
{
    test::Conference conf;
    conf.attach("a");

    REQUIRE(conf.volumes.setVolume("a", 3.0f));
    REQUIRE(conf.volumes.volume("a") == 1.0f);

    REQUIRE(conf.volumes.setVolume("a", -0.5f));
    REQUIRE(conf.volumes.volume("a") == 0.0f);

    REQUIRE(conf.volumes.setVolume("a", 0.6f));
    REQUIRE_FALSE(conf.volumes.setVolume("a", std::numeric_limits<core::f32>::quiet_NaN()));
    REQUIRE_THAT(*conf.volumes.volume("a"), WithinAbs(0.6, 1e-6));
}

TEST_CASE("Mute keeps the volume for unmute", "[audio][volume]")
{
    test::Conference conf;
    ParticipantAudioGraph &a = conf.attach("a");

    REQUIRE(conf.volumes.setVolume("a", 0.7f));
    REQUIRE(conf.volumes.setMuted("a", true));
    REQUIRE(conf.volumes.muted("a") == true);
    REQUIRE(a.gainValue() == 0.0f);

    REQUIRE(conf.volumes.setMuted("a", false));
    REQUIRE_THAT(a.gainValue(), WithinAbs(0.7, 1e-6));
}

TEST_CASE("Initial volume comes from the playback element", "[audio][volume]")
{
    test::Conference conf;
    ParticipantAudioGraph &a = conf.attach("a");
    ParticipantAudioGraph &b = conf.attach("b");

    REQUIRE(conf.volumes.applyInitialVolume("a", FakeElement{0.3f, false}));
    REQUIRE_THAT(a.gainValue(), WithinAbs(0.3, 1e-6));

    REQUIRE(conf.volumes.applyInitialVolume("b", FakeElement{std::nullopt, true}));
    REQUIRE(b.volume() == 1.0f);
    REQUIRE(b.muted());
}

TEST_CASE("Initial volume is reported once per attachment", "[audio][volume]")
{
    test::Conference conf;
    std::vector<std::pair<std::string, core::f32>> reports;
    conf.volumes.onInitialVolumeSet([&reports](std::string_view id, core::f32 gain) {
        reports.emplace_back(std::string{id}, gain);
    });

    conf.attach("a");
    conf.volumes.notifyAttached("a");
    conf.volumes.notifyAttached("a");
    conf.volumes.notifyAttached("ghost");
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].first == "a");
    REQUIRE(reports[0].second == 1.0f);

    REQUIRE(conf.index.detach("a"));
    conf.volumes.forget("a");
    conf.attach("a");
    REQUIRE(conf.volumes.setMuted("a", true));
    conf.volumes.notifyAttached("a");
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[1].second == 0.0f);
}

TEST_CASE("Volume behaves the same in both modes", "[audio][volume][mode]")
{
    test::Conference conf;
    ParticipantAudioGraph &a = conf.attach("a");

    REQUIRE(conf.volumes.setVolume("a", 0.5f));
    REQUIRE(conf.mode.toggle().has_value());
    REQUIRE_THAT(a.gainValue(), WithinAbs(0.5, 1e-6));

    REQUIRE(conf.volumes.setVolume("a", 0.2f));
    REQUIRE(conf.mode.toggle().has_value());
    REQUIRE_THAT(a.gainValue(), WithinAbs(0.2, 1e-6));
}

TEST_CASE("Pass-through graphs keep volume state", "[audio][volume]")
{
    test::Conference conf{{.supported = false}};
    ParticipantAudioGraph &a = conf.attach("a");

    REQUIRE(conf.volumes.setVolume("a", 0.25f));
    REQUIRE(conf.volumes.setMuted("a", true));
    REQUIRE(a.isPassthrough());
    REQUIRE(a.volume() == 0.25f);
    REQUIRE(a.gainValue() == 0.0f);
}
