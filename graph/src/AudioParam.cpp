/**
 * @file AudioParam.cpp
 * @brief AudioParam implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <orb/graph/AudioParam.hpp>

#include <algorithm>

namespace orb::graph {

AudioParam::AudioParam(core::f32 defaultValue, core::f32 minValue, core::f32 maxValue)
    : _min{minValue}
    , _max{maxValue}
    , _value{std::clamp(defaultValue, minValue, maxValue)}
    , _target{_value}
{
}

core::f32 AudioParam::clamp(core::f32 v) const noexcept
{
    return std::clamp(v, _min, _max);
}

void AudioParam::setValue(core::f32 value)
{
    concurrency::SpinLockGuard guard{_lock};
    _value     = clamp(value);
    _target    = _value;
    _step      = 0.0f;
    _remaining = 0;
}

void AudioParam::linearRampTo(core::f32 target, core::u32 frames)
{
    if (frames == 0)
    {
        setValue(target);
        return;
    }

    concurrency::SpinLockGuard guard{_lock};
    _target    = clamp(target);
    _remaining = frames;
    _step      = (_target - _value) / static_cast<core::f32>(frames);
}

void AudioParam::cancelScheduledValues()
{
    concurrency::SpinLockGuard guard{_lock};
    _target    = _value;
    _step      = 0.0f;
    _remaining = 0;
}

core::f32 AudioParam::value() const
{
    concurrency::SpinLockGuard guard{_lock};
    return _value;
}

core::f32 AudioParam::targetValue() const
{
    concurrency::SpinLockGuard guard{_lock};
    return _target;
}

bool AudioParam::isRamping() const
{
    concurrency::SpinLockGuard guard{_lock};
    return _remaining > 0;
}

void AudioParam::process(std::span<float> out)
{
    concurrency::SpinLockGuard guard{_lock};

    core::usize i = 0;
    for (; i < out.size() && _remaining > 0; ++i)
    {
        _value += _step;
        if (--_remaining == 0)
            _value = _target;
        out[i] = _value;
    }
    std::fill(out.begin() + static_cast<core::isize>(i), out.end(), _value);
}

} // namespace orb::graph
