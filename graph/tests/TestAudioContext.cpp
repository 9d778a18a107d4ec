/**
 * @file TestAudioContext.cpp
 * @brief Unit tests for AudioContext state handling and block rendering.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "GraphTestUtils.hpp"

using namespace orb;
using namespace orb::graph;
using Catch::Matchers::WithinAbs;

namespace {

/// Device whose stream never starts, as when the OS refuses playback.
class RefusingSink final : public IAudioSink {
public:
    core::ExpectedVoid open(const SinkFormat &, RenderCallback) override
    {
        _open = true;
        return {};
    }
    core::ExpectedVoid start() override
    {
        return core::makeError(core::ErrorCode::kDeviceStartFailed, "RefusingSink: start refused");
    }
    core::ExpectedVoid stop() override { return {}; }
    void close() override { _open = false; }

    bool             isOpen()    const override { return _open; }
    bool             isStarted() const override { return false; }
    std::string_view name()      const override { return "refusing"; }

private:
    bool _open{false};
};

class UnopenableSink final : public IAudioSink {
public:
    core::ExpectedVoid open(const SinkFormat &, RenderCallback) override
    {
        return core::makeError(core::ErrorCode::kDeviceNotFound, "UnopenableSink: no device");
    }
    core::ExpectedVoid start() override { return {}; }
    core::ExpectedVoid stop()  override { return {}; }
    void close() override {}

    bool             isOpen()    const override { return false; }
    bool             isStarted() const override { return false; }
    std::string_view name()      const override { return "unopenable"; }
};

} // anonymous namespace

TEST_CASE("AudioContext::create validates its inputs", "[graph][context]")
{
    auto noSink = AudioContext::create({}, nullptr);
    REQUIRE_FALSE(noSink.has_value());
    REQUIRE(noSink.error().code() == core::ErrorCode::kInvalidArgument);

    auto emptyFormat = AudioContext::create({0, 128}, std::make_unique<OfflineSink>());
    REQUIRE_FALSE(emptyFormat.has_value());
    REQUIRE(emptyFormat.error().code() == core::ErrorCode::kInvalidArgument);

    auto unopenable = AudioContext::create({}, std::make_unique<UnopenableSink>());
    REQUIRE_FALSE(unopenable.has_value());
    REQUIRE(unopenable.error().code() == core::ErrorCode::kDeviceNotFound);
}

TEST_CASE("AudioContext starts suspended and renders silence", "[graph][context]")
{
    auto offline = test::makeOfflineContext();
    auto &ctx = *offline.context;

    REQUIRE(ctx.state() == ContextState::kSuspended);
    REQUIRE(offline.sink->isOpen());
    REQUIRE(offline.sink->format().sampleRate == core::kDefaultSampleRate);
    REQUIRE(offline.sink->format().channels == 2);

    auto source = ctx.createMediaStreamSource(test::makeConstantStream("a", 1.0f, 128));
    REQUIRE(source->connect(ctx.destination()).has_value());

    auto out = offline.sink->pull(128);
    for (float sample : out)
        REQUIRE(sample == 0.0f);
    REQUIRE(ctx.currentFrame() == 0);

    source->disconnect();
}

TEST_CASE("AudioContext resume, suspend and close transitions", "[graph][context]")
{
    auto offline = test::makeOfflineContext();
    auto &ctx = *offline.context;

    REQUIRE(ctx.resume().has_value());
    REQUIRE(ctx.state() == ContextState::kRunning);
    REQUIRE(offline.sink->isStarted());
    REQUIRE(ctx.resume().has_value());

    REQUIRE(ctx.suspend().has_value());
    REQUIRE(ctx.state() == ContextState::kSuspended);
    REQUIRE_FALSE(offline.sink->isStarted());

    ctx.close();
    REQUIRE(ctx.state() == ContextState::kClosed);
    REQUIRE_FALSE(offline.sink->isOpen());
    ctx.close();

    auto resumed = ctx.resume();
    REQUIRE_FALSE(resumed.has_value());
    REQUIRE(resumed.error().code() == core::ErrorCode::kContextClosed);
}

TEST_CASE("AudioContext stays suspended when the device refuses to start", "[graph][context]")
{
    auto created = AudioContext::create({}, std::make_unique<RefusingSink>());
    REQUIRE(created.has_value());
    auto &ctx = **created;

    auto resumed = ctx.resume();
    REQUIRE_FALSE(resumed.has_value());
    REQUIRE(resumed.error().code() == core::ErrorCode::kDeviceStartFailed);
    REQUIRE(ctx.state() == ContextState::kSuspended);
}

TEST_CASE("AudioContext renders arbitrary buffer sizes in quanta", "[graph][context]")
{
    auto offline = test::makeOfflineContext({48'000, 64});
    auto &ctx = *offline.context;

    auto source = ctx.createMediaStreamSource(test::makeConstantStream("a", 0.5f, 1'000));
    REQUIRE(source->connect(ctx.destination()).has_value());
    REQUIRE(ctx.resume().has_value());

    auto out = offline.sink->pull(200);
    REQUIRE(out.size() == 400);
    REQUIRE(ctx.currentFrame() == 200);
    for (float sample : out)
        REQUIRE_THAT(sample, WithinAbs(0.5, 1e-6));

    (void) offline.sink->pull(56);
    REQUIRE(ctx.currentFrame() == 256);

    source->disconnect();
}

TEST_CASE("AudioContext listener pose is shared by panners", "[graph][context]")
{
    auto offline = test::makeOfflineContext();
    auto &ctx = *offline.context;

    ctx.listener().setPosition({0.0f, 0.0f, 1.0f});
    ctx.listener().setOrientation({0.0f, 0.0f, -1.0f}, {0.0f, 1.0f, 0.0f});

    const ListenerPose pose = ctx.listener().pose();
    REQUIRE(pose.position == math::Vec3f{0.0f, 0.0f, 1.0f});
    REQUIRE(pose.forward == math::Vec3f{0.0f, 0.0f, -1.0f});
}
