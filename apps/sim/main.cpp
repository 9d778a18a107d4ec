/**
 * @file main.cpp
 * @brief Orbit conference simulator.
 *
 * Feeds N synthetic voices through the engine, renders offline and prints
 * each participant's azimuth plus the left/right energy of the mix.
 *
 * Usage: orbit_sim [--participants N] [--spatial] [--seconds S]
 *                  [--churn] [--equal-power] [--debounce MS] [--verbose]
 *                  [--device]
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/engine/Engine.hpp>
#include <orb/engine/Config.hpp>
#include <orb/graph/IMediaStream.hpp>
#include <orb/graph/OfflineSink.hpp>
#include <orb/core/Constants.hpp>
#include <orb/core/Log.hpp>
#include <orb/core/Types.hpp>

#ifdef ORB_HAS_PORTAUDIO
    #include <orb/device/PortAudioSink.hpp>
#endif

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

using namespace orb;

namespace {

/** @brief Endless sine tone standing in for a decoded remote voice. */
class SineStream final : public graph::IMediaStream {
public:
    SineStream(std::string id, core::f32 frequency, core::u32 sampleRate)
        : _id{std::move(id)}
        , _step{static_cast<core::f32>(2.0 * core::kPi) * frequency / static_cast<core::f32>(sampleRate)}
    {
    }

    std::string_view id() const override { return _id; }
    bool active() const override { return true; }

    core::usize read(std::span<float> out) override
    {
        for (float &sample : out)
        {
            sample = 0.2f * std::sin(_phase);
            _phase = std::fmod(_phase + _step, static_cast<core::f32>(2.0 * core::kPi));
        }
        return out.size();
    }

private:
    std::string _id;
    core::f32   _step;
    core::f32   _phase{0.0f};
};

struct Options {
    core::u32 participants{3};
    bool      spatial{false};
    core::f64 seconds{2.0};
    bool      churn{false};
    bool      equalPower{false};
    core::u32 debounceMs{core::kRepositionDebounceMs};
    bool      verbose{false};
    bool      device{false};
};

void usage(const char *program)
{
    std::printf("usage: %s [--participants N] [--spatial] [--seconds S] [--churn]"
                " [--equal-power] [--debounce MS] [--verbose]"
#ifdef ORB_HAS_PORTAUDIO
                " [--device]"
#endif
                "\n", program);
}

bool parse(int argc, char *argv[], Options &options)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        const bool hasValue = i + 1 < argc;

        if (arg == "--participants" && hasValue)
            options.participants = static_cast<core::u32>(std::strtoul(argv[++i], nullptr, 10));
        else if (arg == "--seconds" && hasValue)
            options.seconds = std::strtod(argv[++i], nullptr);
        else if (arg == "--debounce" && hasValue)
            options.debounceMs = static_cast<core::u32>(std::strtoul(argv[++i], nullptr, 10));
        else if (arg == "--spatial")
            options.spatial = true;
        else if (arg == "--churn")
            options.churn = true;
        else if (arg == "--equal-power")
            options.equalPower = true;
        else if (arg == "--verbose")
            options.verbose = true;
#ifdef ORB_HAS_PORTAUDIO
        else if (arg == "--device")
            options.device = true;
#endif
        else
            return false;
    }
    return options.seconds > 0.0;
}

std::shared_ptr<graph::IMediaStream> voice(const std::string &id, core::u32 index, core::u32 sampleRate)
{
    return std::make_shared<SineStream>(id, 220.0f + 55.0f * static_cast<core::f32>(index), sampleRate);
}

void printPositions(const engine::Engine &eng)
{
    for (const std::string &id : eng.participants())
    {
        const auto position = eng.position(id);
        if (position)
            std::printf("  %-6s x=% .3f y=% .3f\n", id.c_str(), position->x, position->y);
    }
}

} // anonymous namespace

#ifdef ORB_HAS_PORTAUDIO
/** @brief Plays the conference on the default output device in real time. */
int playOnDevice(const Options &options, const engine::Config &config)
{
    engine::Engine eng{config, []() { return device::PortAudioSink::create(); }};

    for (core::u32 i = 0; i < options.participants; ++i)
    {
        const std::string id = "p" + std::to_string(i);
        if (auto attached = eng.onTrackAttached(id, voice(id, i, config.sampleRate())); !attached)
        {
            core::Log::error("sim", attached.error().message());
            return 1;
        }
    }

    if (!eng.onUserGesture().get())
    {
        core::Log::error("sim", "output device did not start");
        return 1;
    }

    const auto end = audio::Clock::now() + std::chrono::duration_cast<audio::Clock::duration>(
        std::chrono::duration<core::f64>{options.seconds});
    while (audio::Clock::now() < end)
    {
        eng.pump();
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }

    printPositions(eng);
    return 0;
}
#endif

int main(int argc, char *argv[])
{
    Options options;
    if (!parse(argc, argv, options))
    {
        usage(argv[0]);
        return 2;
    }

    const engine::Config config = engine::Config::Builder{}
        .spatialEnabledByDefault(options.spatial)
        .repositionDebounce(std::chrono::milliseconds{options.debounceMs})
        .panningModel(options.equalPower ? graph::PanningModel::kEqualPower : graph::PanningModel::kHrtf)
        .logLevel(options.verbose ? core::LogLevel::kDebug : core::LogLevel::kInfo)
        .build();

#ifdef ORB_HAS_PORTAUDIO
    if (options.device)
        return playOnDevice(options, config);
#endif

    // simulated wall clock, advanced by the rendered frames
    audio::Clock::time_point now{};
    graph::OfflineSink *sink = nullptr;
    auto factory = [&sink]() -> core::Expected<std::unique_ptr<graph::IAudioSink>> {
        auto created = std::make_unique<graph::OfflineSink>();
        sink = created.get();
        return std::unique_ptr<graph::IAudioSink>{std::move(created)};
    };

    engine::Engine eng{config, factory, [&now]() { return now; }};
    core::Log::info("sim", "=== Orbit Simulator ===");

    core::u32 nextId = 0;
    for (; nextId < options.participants; ++nextId)
    {
        const std::string id = "p" + std::to_string(nextId);
        if (auto attached = eng.onTrackAttached(id, voice(id, nextId, config.sampleRate())); !attached)
        {
            core::Log::error("sim", attached.error().message());
            return 1;
        }
    }

    if (!eng.onUserGesture().get())
        core::Log::warn("sim", "audio context did not start, rendering silence");

    const core::u32 block       = config.blockSize();
    const auto      totalFrames = static_cast<core::u64>(options.seconds * config.sampleRate());
    const auto      blockTime   = std::chrono::duration_cast<audio::Clock::duration>(
        std::chrono::duration<core::f64>{static_cast<core::f64>(block) / config.sampleRate()});

    core::f64 energyLeft  = 0.0;
    core::f64 energyRight = 0.0;
    core::u64 lastChurn   = 0;

    for (core::u64 frame = 0; sink && frame < totalFrames; frame += block)
    {
        if (options.churn && frame - lastChurn >= config.sampleRate() && !eng.participants().empty())
        {
            lastChurn = frame;
            const std::string leaving = eng.participants().front();
            const std::string joining = "p" + std::to_string(nextId);
            (void) eng.onTrackDetached(leaving);
            if (auto attached = eng.onTrackAttached(joining, voice(joining, nextId, config.sampleRate())); !attached)
                core::Log::warn("sim", attached.error().message());
            ++nextId;
            core::Log::info("sim", leaving + " left, " + joining + " joined");
        }

        const auto out = sink->pull(block);
        for (core::usize i = 0; i + 1 < out.size(); i += 2)
        {
            energyLeft  += static_cast<core::f64>(out[i]) * out[i];
            energyRight += static_cast<core::f64>(out[i + 1]) * out[i + 1];
        }

        now += blockTime;
        eng.pump(now);
    }

    std::printf("\nspatial audio: %s, participants: %zu\n", eng.isSpatialEnabled() ? "on" : "off",
                eng.participants().size());
    printPositions(eng);

    const core::f64 frames = options.seconds * config.sampleRate();
    std::printf("rms left=%.4f right=%.4f\n", std::sqrt(energyLeft / frames), std::sqrt(energyRight / frames));
    return 0;
}
