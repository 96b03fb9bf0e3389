#pragma once

#include <cstdint>
#include <optional>
#include <plotscope/color.hpp>
#include <string>
#include <string_view>

namespace plotscope
{

// ─── Line Styles ─────────────────────────────────────────────────────────────

enum class LineStyle : uint8_t
{
    None,     // markers only
    Solid,    // '-'
    Dashed,   // '--'
    Dotted,   // ':'
    DashDot,  // '-.'
};

// ─── Marker Styles ───────────────────────────────────────────────────────────

enum class MarkerStyle : uint8_t
{
    None,
    Point,         // '.'
    Circle,        // 'o'
    Plus,          // '+'
    Cross,         // 'x'
    Star,          // '*'
    Square,        // 's'
    Diamond,       // 'd'
    TriangleUp,    // '^'
    TriangleDown,  // 'v'
};

// ─── Plot Style ──────────────────────────────────────────────────────────────
// Unset optionals are filled from the active Theme and palette at replay.

struct PlotStyle
{
    LineStyle            line_style   = LineStyle::Solid;
    MarkerStyle          marker_style = MarkerStyle::None;
    std::optional<Color> color;
    std::optional<float> line_width;
    std::optional<float> marker_size;
    float                opacity = 1.0f;

    bool has_line() const { return line_style != LineStyle::None; }
    bool has_marker() const { return marker_style != MarkerStyle::None; }
};

// A PlotStyle with every optional resolved; what backends receive.
struct ResolvedStyle
{
    LineStyle   line_style   = LineStyle::Solid;
    MarkerStyle marker_style = MarkerStyle::None;
    Color       color        = colors::black;
    float       line_width   = 1.75f;
    float       marker_size  = 7.0f;
    float       opacity      = 1.0f;
};

constexpr const char* line_style_symbol(LineStyle s)
{
    switch (s)
    {
        case LineStyle::None:
            return "";
        case LineStyle::Solid:
            return "-";
        case LineStyle::Dashed:
            return "--";
        case LineStyle::Dotted:
            return ":";
        case LineStyle::DashDot:
            return "-.";
    }
    return "";
}

constexpr char marker_style_symbol(MarkerStyle s)
{
    switch (s)
    {
        case MarkerStyle::None:
            return '\0';
        case MarkerStyle::Point:
            return '.';
        case MarkerStyle::Circle:
            return 'o';
        case MarkerStyle::Plus:
            return '+';
        case MarkerStyle::Cross:
            return 'x';
        case MarkerStyle::Star:
            return '*';
        case MarkerStyle::Square:
            return 's';
        case MarkerStyle::Diamond:
            return 'd';
        case MarkerStyle::TriangleUp:
            return '^';
        case MarkerStyle::TriangleDown:
            return 'v';
    }
    return '\0';
}

// ─── Dash Pattern ────────────────────────────────────────────────────────────
// Alternating on/off lengths in pixels, scaled by line width.

struct DashPattern
{
    float segments[4]{};
    int   count = 0;
};

DashPattern dash_pattern(LineStyle style, float line_width);

// ─── MATLAB Format Strings ───────────────────────────────────────────────────
// [color][line_style][marker] in any order, e.g. "r--o", "b:", "k*", "--gs".
//   Colors:  r g b c m y k w
//   Lines:   - -- : -.
//   Markers: . o + x * s d ^ v
// A color alone means a solid line; a marker alone means no line.
// Throws InvalidParameterError on an unrecognized character.

PlotStyle parse_format_string(std::string_view fmt);

std::string to_format_string(const PlotStyle& style);

}  // namespace plotscope
