#pragma once

#include <chrono>
#include <cstdint>
#include <stagehand/frame.hpp>

namespace stagehand
{

// Clock source for Scene::update(). Each tick() reports the time since the
// previous tick, never less than one frame at the target rate and never
// more than max_tick().
class FrameClock
{
   public:
    enum class Mode
    {
        Paced,     // Sleep + spin-wait until a full frame interval has passed
        Unpaced,   // Never wait; short ticks are still reported as one interval
    };

    explicit FrameClock(float fps = 60.0f, Mode mode = Mode::Paced);

    // Non-positive rates are ignored.
    void  set_framerate(float fps);
    float framerate() const { return fps_; }
    float target_interval() const { return 1.0f / fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // Upper bound on a single tick, so a stall does not jump the scene
    // far ahead.
    void  set_max_tick(float seconds);
    float max_tick() const { return max_tick_; }

    // Fixed timestep for deterministic replay: every tick reports `dt`.
    void set_fixed_timestep(float dt);
    void clear_fixed_timestep();
    bool has_fixed_timestep() const { return use_fixed_timestep_; }

    // Advance one frame and return its length in seconds.
    float tick();

    // Forget the previous tick (e.g. after the caller paused).
    void reset();

    const Frame& current_frame() const { return frame_; }
    uint64_t     frame_number() const { return frame_.number; }

    // Ticks that took more than twice the target interval.
    uint64_t hitch_count() const { return hitches_; }

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::duration<double>;

    void wait_until(TimePoint deadline) const;

    float fps_      = 60.0f;
    Mode  mode_     = Mode::Paced;
    float max_tick_ = 0.25f;

    bool  use_fixed_timestep_ = false;
    float fixed_dt_           = 1.0f / 60.0f;

    TimePoint last_tick_;
    Frame     frame_;
    uint64_t  hitches_ = 0;
};

}  // namespace stagehand
