/**
 * @file ParticipantAudioGraph.cpp
 * @brief ParticipantAudioGraph implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/audio/ParticipantAudioGraph.hpp>
#include <orb/audio/AudioContextManager.hpp>
#include <orb/core/Log.hpp>

#include <algorithm>
#include <cmath>

namespace orb::audio {

core::Expected<std::unique_ptr<ParticipantAudioGraph>>
ParticipantAudioGraph::attach(std::string participantId, std::shared_ptr<graph::IMediaStream> stream,
                              AudioContextManager &contexts, const SpatializationState &state,
                              const GraphOptions &options)
{
    if (participantId.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "ParticipantAudioGraph: empty participant id");
    if (!stream)
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "ParticipantAudioGraph: null stream for " + participantId);

    graph::AudioContext *context = contexts.getContext();
    std::unique_ptr<ParticipantAudioGraph> result{
        new ParticipantAudioGraph{std::move(participantId), std::move(stream), context, state, options}};

    if (!context)
        return result;

    result->_source = context->createMediaStreamSource(result->_stream);
    result->_panner = context->createPanner(options.panner);
    result->_gain   = context->createGain();

    if (auto wired = result->wire(state.enabled()); !wired)
    {
        result->detach();
        return std::unexpected(std::move(wired.error()));
    }
    return result;
}

ParticipantAudioGraph::ParticipantAudioGraph(std::string participantId,
                                             std::shared_ptr<graph::IMediaStream> stream,
                                             graph::AudioContext *context,
                                             const SpatializationState &state,
                                             const GraphOptions &options)
    : _participantId{std::move(participantId)}
    , _stream{std::move(stream)}
    , _context{context}
    , _state{state}
    , _options{options}
{
}

ParticipantAudioGraph::~ParticipantAudioGraph()
{
    detach();
}

// -------------------------------------------------------------------------- //
//  Wiring                                                                    //
// -------------------------------------------------------------------------- //

core::ExpectedVoid ParticipantAudioGraph::wire(bool spatial)
{
    {
        auto lock = _context->lockGraph();
        if (spatial)
        {
            ORB_TRY_VOID(_source->connect(*_panner));
            ORB_TRY_VOID(_panner->connect(*_gain));
        }
        else
        {
            ORB_TRY_VOID(_source->connect(*_gain));
        }
        ORB_TRY_VOID(_gain->connect(_context->destination()));
        _spatialPath = spatial;
    }

    if (spatial)
        applyPosition();
    return {};
}

core::ExpectedVoid ParticipantAudioGraph::rewire(bool spatial)
{
    if (!_attached || isPassthrough() || spatial == _spatialPath)
        return {};

    {
        auto lock = _context->lockGraph();
        _source->disconnect();
        if (spatial)
        {
            _panner->reset();
            ORB_TRY_VOID(_panner->connect(*_gain));
            ORB_TRY_VOID(_source->connect(*_panner));
        }
        else
        {
            _panner->disconnect();
            ORB_TRY_VOID(_source->connect(*_gain));
        }
        _spatialPath = spatial;

        // the two paths differ in level; bring the new one in from silence
        const core::u32 frames = _options.volumeRampFrames;
        if (frames > 0 && _context->state() == graph::ContextState::kRunning)
        {
            _gain->gain().setValue(0.0f);
            _gain->gain().linearRampTo(effectiveGain(), frames);
        }
    }

    if (spatial)
        applyPosition();
    return {};
}

void ParticipantAudioGraph::detach()
{
    if (!_attached)
        return;
    _attached = false;

    if (_context)
    {
        auto lock = _context->lockGraph();
        if (_gain)
        {
            _gain->gain().cancelScheduledValues();
            _gain->disconnect();
        }
        if (_panner)
            _panner->disconnect();
        if (_source)
            _source->disconnect();
    }

    _gain.reset();
    _panner.reset();
    _source.reset();
    _spatialPath = false;

    if (core::Log::enabled(core::LogLevel::kDebug))
        core::Log::debug("graph", "detached " + _participantId);
}

// -------------------------------------------------------------------------- //
//  Parameters                                                                //
// -------------------------------------------------------------------------- //

void ParticipantAudioGraph::setVolume(core::f32 volume)
{
    if (!_attached || std::isnan(volume))
        return;
    _volume = std::clamp(volume, 0.0f, 1.0f);
    applyGain();
}

void ParticipantAudioGraph::setMuted(bool muted)
{
    if (!_attached)
        return;
    _muted = muted;
    applyGain();
}

void ParticipantAudioGraph::setPosition(const Azimuth &position)
{
    if (!_attached)
        return;
    _position = position;
    if (_spatialPath && _state.enabled())
        applyPosition();
}

core::f32 ParticipantAudioGraph::gainValue() const
{
    return _gain ? _gain->gain().targetValue() : effectiveGain();
}

void ParticipantAudioGraph::applyGain()
{
    if (!_gain)
        return;

    // A suspended context does not advance ramps; land on the value directly.
    const bool      running = _context->state() == graph::ContextState::kRunning;
    const core::u32 frames  = running ? _options.volumeRampFrames : 0;
    _gain->gain().linearRampTo(effectiveGain(), frames);
}

void ParticipantAudioGraph::applyPosition()
{
    if (!_panner)
        return;

    const core::f32 scale = _options.pannerScale;
    _panner->setPosition({_position.x * scale, _position.y * scale, 0.0f});
}

} // namespace orb::audio
