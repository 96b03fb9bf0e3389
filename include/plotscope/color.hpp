#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace plotscope
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // 0xRRGGBB
    static constexpr Color from_hex(uint32_t hex)
    {
        return Color(static_cast<float>((hex >> 16) & 0xFF) / 255.0f,
                     static_cast<float>((hex >> 8) & 0xFF) / 255.0f,
                     static_cast<float>(hex & 0xFF) / 255.0f,
                     1.0f);
    }

    constexpr bool operator==(const Color&) const = default;
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color green{0.0f, 1.0f, 0.0f};
inline constexpr Color blue{0.0f, 0.0f, 1.0f};
inline constexpr Color cyan{0.0f, 1.0f, 1.0f};
inline constexpr Color magenta{1.0f, 0.0f, 1.0f};
inline constexpr Color yellow{1.0f, 1.0f, 0.0f};
inline constexpr Color dark_gray{0.15f, 0.15f, 0.15f};
}  // namespace colors

// Color cycles applied per subplot to series without an explicit color.
namespace palette
{
// Colorblind-safe qualitative set, prints well in grayscale. Default cycle.
inline constexpr Color colorbrewer_q10[] = {
    Color::from_hex(0x1f78b4),
    Color::from_hex(0x33a02c),
    Color::from_hex(0xe31a1c),
    Color::from_hex(0xff7f00),
    Color::from_hex(0x6a3d9a),
    Color::from_hex(0xa6cee3),
    Color::from_hex(0xb2df8a),
    Color::from_hex(0xfb9a99),
    Color::from_hex(0xfdbf6f),
    Color::from_hex(0xcab2d6),
};

inline constexpr Color colorbrewer_q9[] = {
    Color::from_hex(0xe41a1c),
    Color::from_hex(0x377eb8),
    Color::from_hex(0x4daf4a),
    Color::from_hex(0x984ea3),
    Color::from_hex(0xff7f00),
    Color::from_hex(0xffff33),
    Color::from_hex(0xa65628),
    Color::from_hex(0xf781bf),
    Color::from_hex(0x999999),
};

inline constexpr Color tableau_10[] = {
    {0.122f, 0.467f, 0.706f},  // steel blue
    {1.000f, 0.498f, 0.055f},  // orange
    {0.173f, 0.627f, 0.173f},  // green
    {0.839f, 0.153f, 0.157f},  // red
    {0.580f, 0.404f, 0.741f},  // purple
    {0.549f, 0.337f, 0.294f},  // brown
    {0.890f, 0.467f, 0.761f},  // pink
    {0.498f, 0.498f, 0.498f},  // gray
    {0.737f, 0.741f, 0.133f},  // olive
    {0.090f, 0.745f, 0.812f},  // cyan
};

inline constexpr std::span<const Color> default_cycle{colorbrewer_q10};
}  // namespace palette

}  // namespace plotscope
