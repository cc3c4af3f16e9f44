#pragma once

namespace stagehand
{

// RGB color with channels on the 0..255 scale. Channels are floats so that
// interpolated values are kept exactly (no rounding to integers).
struct Color
{
    float r = 255.0f;
    float g = 255.0f;
    float b = 255.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b) : r(r), g(g), b(b) {}

    friend constexpr bool operator==(const Color&, const Color&) = default;
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{255.0f, 255.0f, 255.0f};
inline constexpr Color red{255.0f, 0.0f, 0.0f};
inline constexpr Color green{0.0f, 255.0f, 0.0f};
inline constexpr Color blue{0.0f, 0.0f, 255.0f};
inline constexpr Color cyan{0.0f, 255.0f, 255.0f};
inline constexpr Color magenta{255.0f, 0.0f, 255.0f};
inline constexpr Color yellow{255.0f, 255.0f, 0.0f};
inline constexpr Color gray{127.5f, 127.5f, 127.5f};
}  // namespace colors

}  // namespace stagehand
