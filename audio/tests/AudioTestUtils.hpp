/**
 * @file AudioTestUtils.hpp
 * @brief Conference harness shared by the audio tests.
 */
#pragma once

#include <catch2/catch_test_macros.hpp>

#include <orb/audio/AudioContextManager.hpp>
#include <orb/audio/SpatialPositionIndex.hpp>
#include <orb/audio/SpatializationModeController.hpp>
#include <orb/audio/VolumeController.hpp>
#include <orb/graph/OfflineSink.hpp>
#include <orb/graph/PcmMediaStream.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace orb::audio::test {

using namespace std::chrono_literals;

inline SinkFactory offlineFactory(graph::OfflineSink **created, int *calls = nullptr)
{
    return [created, calls]() -> core::Expected<std::unique_ptr<graph::IAudioSink>> {
        if (calls)
            ++*calls;
        auto sink = std::make_unique<graph::OfflineSink>();
        if (created)
            *created = sink.get();
        return std::unique_ptr<graph::IAudioSink>{std::move(sink)};
    };
}

inline SinkFactory unsupportedFactory(int *calls = nullptr)
{
    return [calls]() -> core::Expected<std::unique_ptr<graph::IAudioSink>> {
        if (calls)
            ++*calls;
        return core::makeError(core::ErrorCode::kContextUnsupported, "no audio backend");
    };
}

inline std::shared_ptr<graph::PcmMediaStream> makeStream(const std::string &id)
{
    return std::make_shared<graph::PcmMediaStream>(id);
}

struct ConferenceOptions {
    bool                      spatial{false};
    bool                      supported{true};
    bool                      requireUserGesture{false};
    bool                      toggleEnabled{true};
    std::chrono::milliseconds debounce{0};
    GraphOptions              graph{};
};

/** @brief The five components wired the way the engine wires them. */
struct Conference {
    explicit Conference(const ConferenceOptions &options = {})
        : contexts{ContextManagerOptions{{}, options.requireUserGesture},
                   options.supported ? offlineFactory(&sink) : unsupportedFactory()}
        , state{options.spatial}
        , index{contexts, state, IndexOptions{options.graph, options.debounce, [this]() { return now; }}}
        , mode{state, index, ModeOptions{options.toggleEnabled}}
        , volumes{index}
    {
    }

    ParticipantAudioGraph &attach(const std::string &id)
    {
        auto graph = index.attach(id, makeStream(id));
        REQUIRE(graph.has_value());
        return **graph;
    }

    graph::OfflineSink          *sink{nullptr};
    Clock::time_point            now{};
    AudioContextManager          contexts;
    SpatializationState          state;
    SpatialPositionIndex         index;
    SpatializationModeController mode;
    VolumeController             volumes;
};

/// True when exactly the edges of the requested path exist.
inline bool wiredAs(const ParticipantAudioGraph &graph, bool spatial)
{
    const auto *source = graph.sourceNode();
    const auto *panner = graph.pannerNode();
    const auto *gain   = graph.gainNode();
    if (!source || !panner || !gain)
        return false;

    const bool spatialEdges = source->isConnectedTo(*panner) && panner->isConnectedTo(*gain);
    const bool monoEdges    = source->isConnectedTo(*gain);
    const bool toOutput     = gain->isConnectedTo(gain->context().destination());

    if (spatial)
        return spatialEdges && !monoEdges && toOutput && source->outputCount() == 1;
    return monoEdges && !panner->isConnectedTo(*gain) && panner->inputCount() == 0
        && toOutput && source->outputCount() == 1;
}

} // namespace orb::audio::test
