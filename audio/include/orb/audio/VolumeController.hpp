/**
 * @file VolumeController.hpp
 * @brief Maps UI volume and mute commands onto participant gain stages.
 *
 * Volume semantics are identical in spatial and mono mode since the gain
 * node is the last stage of both paths.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_AUDIO_VOLUME_CONTROLLER_HPP
    #define ORB_AUDIO_VOLUME_CONTROLLER_HPP

    #include <orb/audio/SpatialPositionIndex.hpp>
    #include <orb/core/NonCopyable.hpp>
    #include <orb/core/Types.hpp>

    #include <functional>
    #include <optional>
    #include <string>
    #include <string_view>
    #include <unordered_set>

namespace orb::audio {

/** @brief Playback element whose volume the graph inherits on attach. */
class IVolumeSource {
public:
    virtual ~IVolumeSource() = default;

    /** @brief Element volume in [0, 1], or nothing if it is not known yet. */
    [[nodiscard]] virtual std::optional<core::f32> initialVolume() const = 0;

    [[nodiscard]] virtual bool initiallyMuted() const { return false; }
};

using InitialVolumeCallback = std::function<void(std::string_view participantId, core::f32 gain)>;

class VolumeController final : public core::NonCopyable<VolumeController> {
public:
    explicit VolumeController(SpatialPositionIndex &index);

    /**
     * @brief Reads @p source once and applies it to the graph of @p id.
     * @return @c false for an unknown id.
     */
    bool applyInitialVolume(std::string_view id, const IVolumeSource &source);

    /// @return @c false for an unknown id or a NaN volume.
    bool setVolume(std::string_view id, core::f32 volume);

    /// @return @c false for an unknown id.
    bool setMuted(std::string_view id, bool muted);

    [[nodiscard]] std::optional<core::f32> volume(std::string_view id) const;
    [[nodiscard]] std::optional<bool>      muted(std::string_view id)  const;

    /** @brief Reports each participant's gain once, when its graph appears. */
    void onInitialVolumeSet(InitialVolumeCallback callback);

    /** @brief Called after @p id got a graph; fires the initial report once. */
    void notifyAttached(std::string_view id);

    /** @brief Called after @p id lost its graph; a later attach reports again. */
    void forget(std::string_view id);

private:
    SpatialPositionIndex           &_index;
    InitialVolumeCallback           _initialVolumeCallback;
    std::unordered_set<std::string> _reported;
};

} // namespace orb::audio

#endif // ORB_AUDIO_VOLUME_CONTROLLER_HPP
