/**
 * @file SpatialPositionIndex.cpp
 * @brief SpatialPositionIndex implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/audio/SpatialPositionIndex.hpp>
#include <orb/audio/AudioContextManager.hpp>
#include <orb/core/Constants.hpp>
#include <orb/core/Log.hpp>

#include <algorithm>
#include <cmath>

namespace orb::audio {

namespace {

/// Upper bound on how long a continuous burst can hold back placement.
constexpr int kMaxDebounceWindows = 4;

} // anonymous namespace

SpatialPositionIndex::SpatialPositionIndex(AudioContextManager &contexts, const SpatializationState &state,
                                           IndexOptions options)
    : _contexts{contexts}
    , _state{state}
    , _options{std::move(options)}
{
}

SpatialPositionIndex::~SpatialPositionIndex()
{
    for (auto &entry : _entries)
        entry.graph->detach();
}

// -------------------------------------------------------------------------- //
//  Placement                                                                 //
// -------------------------------------------------------------------------- //

Azimuth SpatialPositionIndex::computeAzimuth(core::usize place, core::usize count) noexcept
{
    if (count == 0)
        return {};

    const core::f64 angle = 2.0 / static_cast<core::f64>(count + 1);
    const core::f64 pos   = static_cast<core::f64>(place) * angle - 1.0;
    return {static_cast<core::f32>(std::sin(core::kPi * pos / 2.0)),
            static_cast<core::f32>(std::cos(core::kPi * pos / 2.0))};
}

void SpatialPositionIndex::flush()
{
    const core::usize count = _entries.size();
    for (core::usize i = 0; i < count; ++i)
        _entries[i].graph->setPosition(computeAzimuth(i + 1, count));

    _dirty = false;
    ++_recomputeCount;
    if (core::Log::enabled(core::LogLevel::kDebug))
        core::Log::debug("index", "placed " + std::to_string(count) + " participant(s)");
}

bool SpatialPositionIndex::pump(Clock::time_point now)
{
    if (!_dirty)
        return false;

    const auto window = _options.debounce;
    if (now - _lastChange < window && now - _firstChange < window * kMaxDebounceWindows)
        return false;

    flush();
    return true;
}

void SpatialPositionIndex::markDirty()
{
    const Clock::time_point t = now();
    if (!_dirty)
        _firstChange = t;
    _lastChange = t;
    _dirty      = true;

    if (_options.debounce.count() <= 0)
        flush();
}

Clock::time_point SpatialPositionIndex::now() const
{
    return _options.clock ? _options.clock() : Clock::now();
}

// -------------------------------------------------------------------------- //
//  Membership                                                                //
// -------------------------------------------------------------------------- //

core::Expected<ParticipantAudioGraph *>
SpatialPositionIndex::attach(std::string_view id, std::shared_ptr<graph::IMediaStream> stream)
{
    ORB_TRY_ASSIGN(std::unique_ptr<ParticipantAudioGraph> graph,
                   ParticipantAudioGraph::attach(std::string{id}, std::move(stream), _contexts, _state,
                                                 _options.graph));
    ParticipantAudioGraph *handle = graph.get();

    if (auto it = _slots.find(id); it != _slots.end())
    {
        Entry &entry = _entries[it->second];
        entry.graph->detach();
        entry.graph = std::move(graph);
        handle->setPosition(computeAzimuth(it->second + 1, _entries.size()));
        core::Log::debug("index", "replaced graph of " + entry.id);
        return handle;
    }

    const core::usize index = _entries.size();
    _entries.push_back(Entry{std::string{id}, std::move(graph)});
    _slots.emplace(std::string{id}, index);

    // placed right away with the new count; the rest follow on recompute
    handle->setPosition(computeAzimuth(index + 1, _entries.size()));
    markDirty();
    return handle;
}

bool SpatialPositionIndex::detach(std::string_view id)
{
    auto it = _slots.find(id);
    if (it == _slots.end())
        return false;

    const core::usize index = it->second;
    _entries[index].graph->detach();
    _entries.erase(_entries.begin() + static_cast<std::ptrdiff_t>(index));
    _slots.erase(it);
    reindexFrom(index);

    markDirty();
    return true;
}

core::ExpectedVoid SpatialPositionIndex::move(std::string_view id, core::usize newIndex)
{
    auto it = _slots.find(id);
    if (it == _slots.end())
        return core::makeError(core::ErrorCode::kNotFound, "SpatialPositionIndex: unknown participant");
    if (newIndex >= _entries.size())
        return core::makeError(core::ErrorCode::kOutOfRange, "SpatialPositionIndex: index out of range");

    const core::usize from = it->second;
    if (from == newIndex)
        return {};

    auto first = _entries.begin();
    if (from < newIndex)
        std::rotate(first + static_cast<std::ptrdiff_t>(from), first + static_cast<std::ptrdiff_t>(from) + 1,
                    first + static_cast<std::ptrdiff_t>(newIndex) + 1);
    else
        std::rotate(first + static_cast<std::ptrdiff_t>(newIndex), first + static_cast<std::ptrdiff_t>(from),
                    first + static_cast<std::ptrdiff_t>(from) + 1);

    reindexFrom(std::min(from, newIndex));
    markDirty();
    return {};
}

void SpatialPositionIndex::reorder(std::span<const std::string> order)
{
    std::vector<Entry> reordered;
    reordered.reserve(_entries.size());

    for (const auto &id : order)
    {
        auto it = _slots.find(id);
        if (it == _slots.end() || !_entries[it->second].graph)
            continue;
        reordered.push_back(std::move(_entries[it->second]));
    }
    for (auto &entry : _entries)
    {
        if (entry.graph)
            reordered.push_back(std::move(entry));
    }

    bool changed = false;
    for (core::usize i = 0; i < reordered.size(); ++i)
        changed = changed || _slots[reordered[i].id] != i;

    _entries = std::move(reordered);
    reindexFrom(0);
    if (changed)
        markDirty();
}

void SpatialPositionIndex::reindexFrom(core::usize first)
{
    for (core::usize i = first; i < _entries.size(); ++i)
        _slots[_entries[i].id] = i;
}

// -------------------------------------------------------------------------- //
//  Queries                                                                   //
// -------------------------------------------------------------------------- //

ParticipantAudioGraph *SpatialPositionIndex::find(std::string_view id)
{
    auto it = _slots.find(id);
    return it == _slots.end() ? nullptr : _entries[it->second].graph.get();
}

const ParticipantAudioGraph *SpatialPositionIndex::find(std::string_view id) const
{
    auto it = _slots.find(id);
    return it == _slots.end() ? nullptr : _entries[it->second].graph.get();
}

std::optional<core::usize> SpatialPositionIndex::indexOf(std::string_view id) const
{
    auto it = _slots.find(id);
    if (it == _slots.end())
        return std::nullopt;
    return it->second;
}

std::optional<Azimuth> SpatialPositionIndex::positionOf(std::string_view id) const
{
    const ParticipantAudioGraph *graph = find(id);
    if (!graph)
        return std::nullopt;
    return graph->position();
}

std::vector<std::string> SpatialPositionIndex::ids() const
{
    std::vector<std::string> result;
    result.reserve(_entries.size());
    for (const auto &entry : _entries)
        result.push_back(entry.id);
    return result;
}

} // namespace orb::audio
