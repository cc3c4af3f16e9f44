#pragma once

#include <map>
#include <stagehand/color.hpp>
#include <stagehand/error.hpp>
#include <string>
#include <utility>
#include <variant>

namespace stagehand
{

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    friend constexpr bool operator==(const Vec2&, const Vec2&) = default;
};

// Value stored under a caller-defined snapshot key.
using AnimValue = std::variant<float, Vec2, Color>;

// Snapshot of an actor's interpolatable state at one instant.
// The three built-in keys are plain fields; anything a custom action
// computes goes into `custom`.
struct State
{
    Vec2  position{};
    Color color{};
    float angle = 0.0f;

    std::map<std::string, AnimValue> custom;

    bool has(const std::string& key) const { return custom.find(key) != custom.end(); }

    // Throws UnknownKeyError if `key` is absent or holds another type.
    template <typename T>
    const T& get(const std::string& key) const
    {
        auto it = custom.find(key);
        if (it == custom.end() || !std::holds_alternative<T>(it->second))
        {
            throw UnknownKeyError(key);
        }
        return std::get<T>(it->second);
    }

    // Copy of this snapshot with one custom key set.
    State with(const std::string& key, AnimValue value) const
    {
        State out = *this;
        out.custom[key] = std::move(value);
        return out;
    }

    friend bool operator==(const State&, const State&) = default;
};

inline float lerp(float a, float b, float f)
{
    return a + (b - a) * f;
}

inline Vec2 lerp(const Vec2& a, const Vec2& b, float f)
{
    return Vec2{lerp(a.x, b.x, f), lerp(a.y, b.y, f)};
}

inline Color lerp(const Color& a, const Color& b, float f)
{
    return Color{lerp(a.r, b.r, f), lerp(a.g, b.g, f), lerp(a.b, b.b, f)};
}

}  // namespace stagehand
