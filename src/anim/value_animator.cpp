#include "value_animator.hpp"

#include <algorithm>
#include <cmath>
#include <combopanel/logger.hpp>

namespace combopanel
{

double ValueAnimator::smooth_toward(double current, double target, double speed, double dt)
{
    if (dt <= 0.0)
        return current;
    double diff = target - current;
    if (std::abs(diff) < SNAP_THRESHOLD)
        return target;
    return current + diff * std::min(1.0, speed * dt);
}

bool ValueAnimator::set_target(const std::string& key, double target, bool animate)
{
    auto& v = values_[key];

    if (!v.initialized || !animate)
    {
        bool changed  = !v.initialized || v.current != target;
        v.current     = target;
        v.target      = target;
        v.initialized = true;
        return changed;
    }

    if (std::abs(target - v.target) <= TARGET_EPSILON)
        return false;

    v.target = target;
    return true;
}

bool ValueAnimator::step(float elapsed, float speed)
{
    bool moving = false;
    for (auto& [key, v] : values_)
    {
        if (v.current == v.target)
            continue;
        v.current = smooth_toward(v.current, v.target, speed, elapsed);
        if (v.current != v.target)
            moving = true;
    }
    return moving;
}

double ValueAnimator::value(std::string_view key, double fallback) const
{
    auto it = values_.find(key);
    return it != values_.end() ? it->second.current : fallback;
}

bool ValueAnimator::contains(std::string_view key) const
{
    return values_.find(key) != values_.end();
}

bool ValueAnimator::is_animating() const
{
    return std::any_of(values_.begin(),
                       values_.end(),
                       [](const auto& entry) { return entry.second.current != entry.second.target; });
}

void ValueAnimator::retain(std::span<const std::string> keys)
{
    size_t removed = 0;
    for (auto it = values_.begin(); it != values_.end();)
    {
        if (std::find(keys.begin(), keys.end(), it->first) == keys.end())
        {
            it = values_.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    if (removed > 0)
        COMBOPANEL_LOG_DEBUG("panel", "Dropped {} stale animated values", removed);
}

}   // namespace combopanel
