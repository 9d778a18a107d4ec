/**
 * @file SpatialPositionIndex.hpp
 * @brief Ordered registry of live participant graphs and their azimuths.
 *
 * The registry order is the join/render order of the audio tracks and is
 * the only input to placement.  For N participants and a 1-based place:
 *
 *     angle = 2 / (N + 1)
 *     pos   = place * angle - 1          (open interval (-1, 1))
 *     x     = sin(pi * pos / 2)
 *     y     = cos(pi * pos / 2)
 *
 * which spreads the voices symmetrically over the semicircle in front of
 * the listener.  Every membership change moves every participant, so the
 * recomputation is debounced and applied to all graphs at once.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_AUDIO_SPATIAL_POSITION_INDEX_HPP
    #define ORB_AUDIO_SPATIAL_POSITION_INDEX_HPP

    #include <orb/audio/ParticipantAudioGraph.hpp>
    #include <orb/core/Expected.hpp>
    #include <orb/core/NonCopyable.hpp>

    #include <chrono>
    #include <functional>
    #include <memory>
    #include <optional>
    #include <span>
    #include <string>
    #include <string_view>
    #include <unordered_map>
    #include <vector>

namespace orb::audio {

class AudioContextManager;

using Clock = std::chrono::steady_clock;

struct IndexOptions {
    GraphOptions              graph{};

    /// Quiet period after the last membership change; 0 recomputes at once.
    std::chrono::milliseconds debounce{core::kRepositionDebounceMs};

    /// Time source for membership changes; steady_clock when empty.
    std::function<Clock::time_point()> clock{};
};

class SpatialPositionIndex final : public core::NonCopyable<SpatialPositionIndex> {
public:
    SpatialPositionIndex(AudioContextManager &contexts, const SpatializationState &state,
                         IndexOptions options = {});

    /** @brief Detaches every remaining graph. */
    ~SpatialPositionIndex();

    /**
     * @brief Builds the graph of @p id and appends it to the registry.
     *
     * An id that already has a graph gets a fresh one in the same place.
     * The new graph is placed immediately; the others follow at the next
     * recomputation.
     */
    [[nodiscard]] core::Expected<ParticipantAudioGraph *>
    attach(std::string_view id, std::shared_ptr<graph::IMediaStream> stream);

    /**
     * @brief Detaches and forgets the graph of @p id.
     * @return @c false (and does nothing) for an unknown id.
     */
    bool detach(std::string_view id);

    /**
     * @brief Moves @p id to @p newIndex, shifting the participants between.
     * @return kNotFound for an unknown id, kOutOfRange for a bad index.
     */
    [[nodiscard]] core::ExpectedVoid move(std::string_view id, core::usize newIndex);

    /**
     * @brief Applies a track order coming from the UI.
     *
     * Known ids take the given order; unknown ones are ignored and
     * participants missing from @p order keep their relative order after
     * the listed ones.
     */
    void reorder(std::span<const std::string> order);

    [[nodiscard]] ParticipantAudioGraph       *find(std::string_view id);
    [[nodiscard]] const ParticipantAudioGraph *find(std::string_view id) const;

    [[nodiscard]] std::optional<core::usize> indexOf(std::string_view id)    const;
    [[nodiscard]] std::optional<Azimuth>     positionOf(std::string_view id) const;

    [[nodiscard]] core::usize              size() const noexcept { return _entries.size(); }
    [[nodiscard]] std::vector<std::string> ids()  const;

    /** @brief Visits the graphs in registry order. */
    template <typename F>
    void forEach(F &&visitor)
    {
        for (auto &entry : _entries)
            visitor(*entry.graph);
    }

    template <typename F>
    void forEach(F &&visitor) const
    {
        for (const auto &entry : _entries)
            visitor(static_cast<const ParticipantAudioGraph &>(*entry.graph));
    }

    /**
     * @brief Recomputes if dirty and the debounce window has elapsed.
     *
     * A burst of changes is held back at most four windows after its first
     * change.
     *
     * @return @c true if a recomputation ran.
     */
    bool pump(Clock::time_point now);

    /** @brief Recomputes every position now. */
    void flush();

    [[nodiscard]] bool      isDirty()        const noexcept { return _dirty; }
    [[nodiscard]] core::u64 recomputeCount() const noexcept { return _recomputeCount; }

    /** @brief Azimuth of the 1-based @p place among @p count participants. */
    [[nodiscard]] static Azimuth computeAzimuth(core::usize place, core::usize count) noexcept;

private:
    struct Entry {
        std::string                            id;
        std::unique_ptr<ParticipantAudioGraph> graph;
    };

    struct StringHash {
        using is_transparent = void;
        [[nodiscard]] core::usize operator()(std::string_view s) const noexcept
        {
            return std::hash<std::string_view>{}(s);
        }
    };

    void markDirty();
    void reindexFrom(core::usize first);
    [[nodiscard]] Clock::time_point now() const;

    AudioContextManager       &_contexts;
    const SpatializationState &_state;
    IndexOptions               _options;

    std::vector<Entry>                                                  _entries;
    std::unordered_map<std::string, core::usize, StringHash, std::equal_to<>> _slots;

    bool              _dirty{false};
    Clock::time_point _firstChange{};
    Clock::time_point _lastChange{};
    core::u64         _recomputeCount{0};
};

} // namespace orb::audio

#endif // ORB_AUDIO_SPATIAL_POSITION_INDEX_HPP
