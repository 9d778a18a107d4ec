/**
 * @file PannerNode.cpp
 * @brief Equal-power and spherical-head HRTF panning.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/PannerNode.hpp>
#include <orb/graph/AudioContext.hpp>

#include <algorithm>
#include <cmath>

namespace orb::graph {

namespace {

constexpr core::f32 kRadToDeg = static_cast<core::f32>(180.0 / core::kPi);
constexpr core::f32 kDegToRad = static_cast<core::f32>(core::kPi / 180.0);
constexpr core::f32 kHalfPi   = static_cast<core::f32>(core::kPi / 2.0);

// Brown-Duda head shadow: minimum HF gain and the angle where it is reached.
constexpr core::f32 kShadowAlphaMin = 0.1f;
constexpr core::f32 kShadowThetaMin = 150.0f;

core::f32 safeAcosDeg(core::f32 cosine)
{
    return std::acos(std::clamp(cosine, -1.0f, 1.0f)) * kRadToDeg;
}

/// Unsigned angle in degrees between two azimuths, in [0, 180].
core::f32 azimuthDistance(core::f32 a, core::f32 b)
{
    core::f32 d = std::fmod(std::fabs(a - b), 360.0f);
    return d > 180.0f ? 360.0f - d : d;
}

/// Folds a back-hemisphere azimuth onto the front one, result in [-90, 90].
core::f32 foldAzimuth(core::f32 azimuth)
{
    azimuth = std::clamp(azimuth, -180.0f, 180.0f);
    if (azimuth < -90.0f)
        return -180.0f - azimuth;
    if (azimuth > 90.0f)
        return 180.0f - azimuth;
    return azimuth;
}

core::f32 shadowAlpha(core::f32 incidenceDeg)
{
    return (1.0f + kShadowAlphaMin / 2.0f)
         + (1.0f - kShadowAlphaMin / 2.0f)
         * std::cos(incidenceDeg / kShadowThetaMin * static_cast<core::f32>(core::kPi));
}

} // anonymous namespace

PannerNode::PannerNode(AudioContext &context, const PannerOptions &options)
    : AudioNode{context, "panner"}
    , _options{options}
    , _sampleRate{static_cast<core::f32>(context.sampleRate())}
    , _orientation{options.orientation}
    , _history(kHistorySize, 0.0f)
{
}

void PannerNode::setPosition(const math::Vec3f &position)
{
    concurrency::SpinLockGuard guard{_lock};
    _position = position;
}

void PannerNode::setOrientation(const math::Vec3f &orientation)
{
    concurrency::SpinLockGuard guard{_lock};
    _orientation = orientation;
}

math::Vec3f PannerNode::position() const
{
    concurrency::SpinLockGuard guard{_lock};
    return _position;
}

math::Vec3f PannerNode::orientation() const
{
    concurrency::SpinLockGuard guard{_lock};
    return _orientation;
}

void PannerNode::reset()
{
    std::fill(_history.begin(), _history.end(), 0.0f);
    _ears     = {};
    _writePos = 0;
    _primed   = false;
}

// -------------------------------------------------------------------------- //
//  Geometry                                                                  //
// -------------------------------------------------------------------------- //

SourceAngles PannerNode::computeAngles(const ListenerPose &listener, const math::Vec3f &source)
{
    const math::Vec3f relative = source - listener.position;
    if (relative.lengthSquared() <= 0.0f)
        return {};

    const math::Vec3f direction = relative.normalize();
    const math::Vec3f forward   = listener.forward.normalize();
    const math::Vec3f right     = forward.cross(listener.up).normalize();
    if (right.lengthSquared() <= 0.0f)
        return {};
    const math::Vec3f up = right.cross(forward);

    const core::f32   upProjection = direction.dot(up);
    const math::Vec3f projected    = (direction - up * upProjection).normalize();

    SourceAngles angles;
    if (projected.lengthSquared() > 0.0f)
    {
        core::f32 azimuth = safeAcosDeg(projected.dot(right));
        if (projected.dot(forward) < 0.0f)
            azimuth = 360.0f - azimuth;

        // measured from the right axis so far; make it relative to forward
        angles.azimuth = (azimuth <= 270.0f) ? 90.0f - azimuth : 450.0f - azimuth;
    }

    core::f32 elevation = 90.0f - safeAcosDeg(direction.dot(up));
    if (elevation > 90.0f)
        elevation = 180.0f - elevation;
    else if (elevation < -90.0f)
        elevation = -180.0f - elevation;
    angles.elevation = elevation;

    return angles;
}

core::f32 PannerNode::distanceGain(const PannerOptions &options, core::f32 distance)
{
    const core::f32 ref = options.refDistance;

    switch (options.distanceModel)
    {
        case DistanceModel::kLinear:
        {
            if (options.maxDistance <= ref)
                return 1.0f;
            const core::f32 d       = std::clamp(distance, ref, options.maxDistance);
            const core::f32 rolloff = std::clamp(options.rolloffFactor, 0.0f, 1.0f);
            return 1.0f - rolloff * (d - ref) / (options.maxDistance - ref);
        }
        case DistanceModel::kInverse:
        {
            const core::f32 d     = std::max(distance, ref);
            const core::f32 denom = ref + options.rolloffFactor * (d - ref);
            return denom > 0.0f ? ref / denom : 1.0f;
        }
        case DistanceModel::kExponential:
        {
            if (ref <= 0.0f)
                return 1.0f;
            const core::f32 d = std::max(distance, ref);
            return std::pow(d / ref, -options.rolloffFactor);
        }
    }
    return 1.0f;
}

core::f32 PannerNode::coneGain(const PannerOptions &options, const ListenerPose &listener,
                               const math::Vec3f &source, const math::Vec3f &orientation)
{
    if (orientation.lengthSquared() <= 0.0f
        || (options.coneInnerAngle == 360.0f && options.coneOuterAngle == 360.0f))
        return 1.0f;

    const math::Vec3f toListener = (listener.position - source).normalize();
    if (toListener.lengthSquared() <= 0.0f)
        return 1.0f;

    const core::f32 angle    = safeAcosDeg(toListener.dot(orientation.normalize()));
    const core::f32 absInner = std::fabs(options.coneInnerAngle) / 2.0f;
    const core::f32 absOuter = std::fabs(options.coneOuterAngle) / 2.0f;

    if (angle <= absInner)
        return 1.0f;
    if (angle >= absOuter)
        return options.coneOuterGain;

    const core::f32 x = (angle - absInner) / (absOuter - absInner);
    return (1.0f - x) + options.coneOuterGain * x;
}

std::array<core::f32, 2> PannerNode::equalPowerGains(core::f32 azimuth)
{
    const core::f32 x = (foldAzimuth(azimuth) + 90.0f) / 180.0f;
    return {std::cos(x * kHalfPi), std::sin(x * kHalfPi)};
}

// -------------------------------------------------------------------------- //
//  Rendering                                                                 //
// -------------------------------------------------------------------------- //

void PannerNode::process(const AudioBus &in, AudioBus &out)
{
    const ListenerPose pose = context().listener().pose();

    math::Vec3f position;
    math::Vec3f orientation;
    {
        concurrency::SpinLockGuard guard{_lock};
        position    = _position;
        orientation = _orientation;
    }

    const SourceAngles angles = computeAngles(pose, position);
    const core::f32 gain = distanceGain(_options, (position - pose.position).length())
                         * coneGain(_options, pose, position, orientation);

    if (_options.panningModel == PanningModel::kEqualPower)
        processEqualPower(in.channel(0), out, angles, gain);
    else
        processHrtf(in.channel(0), out, angles, gain);

    _primed = true;
}

void PannerNode::processEqualPower(std::span<const float> in, AudioBus &out,
                                   const SourceAngles &angles, core::f32 gain)
{
    const auto target = equalPowerGains(angles.azimuth);
    const core::u32 frames = out.frames();

    for (core::usize e = 0; e < _ears.size(); ++e)
    {
        Ear &ear = _ears[e];
        const core::f32 to = target[e] * gain;
        const core::f32 from = _primed ? ear.gain : to;
        const core::f32 step = frames > 0 ? (to - from) / static_cast<core::f32>(frames) : 0.0f;

        auto dst = out.channel(static_cast<core::u32>(e));
        for (core::u32 i = 0; i < frames; ++i)
            dst[i] = in[i] * (from + step * static_cast<core::f32>(i + 1));
        ear.gain = to;
    }
}

void PannerNode::processHrtf(std::span<const float> in, AudioBus &out,
                             const SourceAngles &angles, core::f32 gain)
{
    const core::f32 lateral = foldAzimuth(angles.azimuth);
    const core::f32 theta   = std::fabs(lateral) * kDegToRad;
    const core::f32 itd     = (core::kHeadRadiusMeters / core::kSpeedOfSound)
                            * (theta + std::sin(theta)) * _sampleRate;
    const core::f32 maxDelay = static_cast<core::f32>(kHistorySize - 2);

    // index 0 = left ear, 1 = right ear; the far ear hears the delayed signal
    const std::array<core::f32, 2> targetDelay{
        std::min(lateral > 0.0f ? itd : 0.0f, maxDelay),
        std::min(lateral < 0.0f ? itd : 0.0f, maxDelay),
    };
    const std::array<core::f32, 2> incidence{
        azimuthDistance(angles.azimuth, -90.0f),
        azimuthDistance(angles.azimuth, 90.0f),
    };

    const core::f32 k = _sampleRate * core::kHeadRadiusMeters / core::kSpeedOfSound;
    const core::u32 frames = out.frames();

    for (core::usize e = 0; e < _ears.size(); ++e)
    {
        Ear &ear = _ears[e];
        const core::f32 alpha = shadowAlpha(incidence[e]);
        ear.b0 = (1.0f + alpha * k) / (1.0f + k);
        ear.b1 = (1.0f - alpha * k) / (1.0f + k);
        ear.a1 = (1.0f - k) / (1.0f + k);
        if (!_primed)
        {
            ear.delay = targetDelay[e];
            ear.gain  = gain;
        }
    }

    std::array<core::f32, 2> delayStep{};
    std::array<core::f32, 2> gainStep{};
    for (core::usize e = 0; e < _ears.size(); ++e)
    {
        delayStep[e] = frames > 0 ? (targetDelay[e] - _ears[e].delay) / static_cast<core::f32>(frames) : 0.0f;
        gainStep[e]  = frames > 0 ? (gain - _ears[e].gain) / static_cast<core::f32>(frames) : 0.0f;
    }

    auto left  = out.channel(0);
    auto right = out.channel(1);

    for (core::u32 i = 0; i < frames; ++i)
    {
        _history[_writePos & kHistoryMask] = in[i];

        for (core::usize e = 0; e < _ears.size(); ++e)
        {
            Ear &ear = _ears[e];
            ear.delay += delayStep[e];
            ear.gain  += gainStep[e];

            const core::f32 whole  = std::floor(ear.delay);
            const core::f32 frac   = ear.delay - whole;
            const core::u64 offset = static_cast<core::u64>(whole);
            const core::f32 newer  = _history[(_writePos - offset) & kHistoryMask];
            const core::f32 older  = _history[(_writePos - offset - 1) & kHistoryMask];
            const core::f32 s      = newer + (older - newer) * frac;

            const core::f32 y = ear.b0 * s + ear.b1 * ear.x1 - ear.a1 * ear.y1;
            ear.x1 = s;
            ear.y1 = y;

            (e == 0 ? left : right)[i] = y * ear.gain;
        }
        ++_writePos;
    }

    for (core::usize e = 0; e < _ears.size(); ++e)
    {
        _ears[e].delay = targetDelay[e];
        _ears[e].gain  = gain;
    }
}

} // namespace orb::graph
