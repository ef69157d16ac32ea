#pragma once

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace combopanel
{

// Per-slot smoothing of displayed values toward their latest targets
class ValueAnimator
{
   public:
    // Target changes smaller than this are ignored
    static constexpr double TARGET_EPSILON = 0.005;
    // Values this close to their target snap to it
    static constexpr double SNAP_THRESHOLD = 0.001;

    struct AnimatedValue
    {
        double current     = 0.0;
        double target      = 0.0;
        bool   initialized = false;
    };

    // First update of a key, or animate == false, snaps to the target.
    // Returns true if the displayed value will change.
    bool set_target(const std::string& key, double target, bool animate);

    // Moves every value toward its target. Returns true while any value is
    // still in motion after the step.
    bool step(float elapsed, float speed);

    double value(std::string_view key, double fallback = 0.0) const;
    bool   contains(std::string_view key) const;
    bool   is_animating() const;

    // Drops entries whose key is not in `keys`
    void   retain(std::span<const std::string> keys);
    void   clear() { values_.clear(); }
    size_t size() const { return values_.size(); }

    static double smooth_toward(double current, double target, double speed, double dt);

   private:
    std::map<std::string, AnimatedValue, std::less<>> values_;
};

}   // namespace combopanel
