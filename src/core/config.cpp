#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stagehand/config.hpp>
#include <string>

namespace stagehand
{

namespace
{

std::optional<float> parse_positive_float(const char* text)
{
    if (!text || *text == '\0')
        return std::nullopt;

    char* end   = nullptr;
    float value = std::strtof(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(value) || value <= 0.0f)
        return std::nullopt;
    return value;
}

}  // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "critical")
        return LogLevel::Critical;
    return std::nullopt;
}

SceneConfig SceneConfig::from_env(SceneConfig base)
{
    if (const char* env = std::getenv("STAGEHAND_FPS"))
    {
        if (auto fps = parse_positive_float(env))
            base.framerate = *fps;
        else
            STAGEHAND_LOG_WARN("config", "ignoring STAGEHAND_FPS='{}'", env);
    }

    if (const char* env = std::getenv("STAGEHAND_FIXED_DT"))
    {
        if (auto dt = parse_positive_float(env))
            base.fixed_timestep = *dt;
        else
            STAGEHAND_LOG_WARN("config", "ignoring STAGEHAND_FIXED_DT='{}'", env);
    }

    if (const char* env = std::getenv("STAGEHAND_LOG_LEVEL"))
    {
        if (auto level = parse_log_level(env))
            base.log_level = *level;
        else
            STAGEHAND_LOG_WARN("config", "ignoring STAGEHAND_LOG_LEVEL='{}'", env);
    }

    return base;
}

SceneConfig SceneConfig::from_env()
{
    return from_env(SceneConfig{});
}

}  // namespace stagehand
