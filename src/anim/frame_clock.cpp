#include <algorithm>
#include <cmath>
#include <stagehand/frame_clock.hpp>
#include <stagehand/logger.hpp>
#include <thread>

namespace stagehand
{

FrameClock::FrameClock(float fps, Mode mode) : mode_(mode)
{
    set_framerate(fps);
    reset();
}

void FrameClock::set_framerate(float fps)
{
    if (!(fps > 0.0f) || !std::isfinite(fps))
    {
        STAGEHAND_LOG_WARN("clock", "ignoring framerate {}, keeping {}", fps, fps_);
        return;
    }
    fps_ = fps;
}

void FrameClock::set_max_tick(float seconds)
{
    if (seconds > 0.0f)
    {
        max_tick_ = seconds;
    }
}

void FrameClock::set_fixed_timestep(float dt)
{
    if (!(dt > 0.0f) || !std::isfinite(dt))
    {
        STAGEHAND_LOG_WARN("clock", "ignoring fixed timestep {}", dt);
        return;
    }
    use_fixed_timestep_ = true;
    fixed_dt_           = dt;
}

void FrameClock::clear_fixed_timestep()
{
    use_fixed_timestep_ = false;
}

void FrameClock::reset()
{
    last_tick_ = Clock::now();
    frame_     = Frame{};
    hitches_   = 0;
}

void FrameClock::wait_until(TimePoint deadline) const
{
    // Sleep for most of the remaining time (leave 1ms for spin-wait)
    auto sleep_time = (deadline - Clock::now()) - Duration{0.001};
    if (sleep_time > Duration::zero())
    {
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(sleep_time));
    }

    while (Clock::now() < deadline)
    {
        // Busy wait
    }
}

float FrameClock::tick()
{
    Duration interval{1.0 / static_cast<double>(fps_)};

    if (mode_ == Mode::Paced && !use_fixed_timestep_)
    {
        wait_until(last_tick_ + std::chrono::duration_cast<Clock::duration>(interval));
    }

    TimePoint now      = Clock::now();
    float     measured = static_cast<float>(Duration(now - last_tick_).count());
    last_tick_         = now;

    if (measured > 2.0f * target_interval())
    {
        ++hitches_;
        STAGEHAND_LOG_DEBUG("clock",
                            "frame {} hitch: {}ms (target {}ms)",
                            frame_.number + 1,
                            measured * 1000.0f,
                            target_interval() * 1000.0f);
    }

    float dt;
    if (use_fixed_timestep_)
    {
        dt = fixed_dt_;
    }
    else
    {
        // Clamp dt to avoid spiral of death
        dt = std::max(std::min(measured, max_tick_), target_interval());
    }

    frame_.dt = dt;
    frame_.elapsed_sec += dt;
    frame_.number++;

    STAGEHAND_LOG_TRACE("clock", "tick {} dt={}", frame_.number, dt);
    return dt;
}

}  // namespace stagehand
