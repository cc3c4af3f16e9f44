#pragma once

#include <optional>
#include <stagehand/frame_clock.hpp>
#include <stagehand/logger.hpp>
#include <string_view>

namespace stagehand
{

struct SceneConfig
{
    int              width          = 640;
    int              height         = 480;
    float            framerate      = 60.0f;
    FrameClock::Mode clock_mode     = FrameClock::Mode::Paced;
    float            fixed_timestep = 0.0f;   // > 0 → deterministic ticks of this length
    float            max_tick       = 0.25f;
    LogLevel         log_level      = LogLevel::Info;   // applied to Logger::instance() by Scene

    // Copy of `base` with overrides from STAGEHAND_FPS, STAGEHAND_FIXED_DT
    // and STAGEHAND_LOG_LEVEL. Malformed values are skipped with a warning.
    static SceneConfig from_env(SceneConfig base);
    static SceneConfig from_env();
};

// "trace", "debug", "info", "warn"/"warning", "error", "critical"
// (case-insensitive).
std::optional<LogLevel> parse_log_level(std::string_view text);

}  // namespace stagehand
