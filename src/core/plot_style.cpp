#include <plotscope/errors.hpp>
#include <plotscope/plot_style.hpp>

namespace plotscope
{

namespace
{

struct ColorCode
{
    char  code;
    Color color;
};

constexpr ColorCode COLOR_CODES[] = {
    {'r', colors::red},
    {'g', colors::green},
    {'b', colors::blue},
    {'c', colors::cyan},
    {'m', colors::magenta},
    {'y', colors::yellow},
    {'k', colors::black},
    {'w', colors::white},
};

constexpr MarkerStyle ALL_MARKERS[] = {
    MarkerStyle::Point,
    MarkerStyle::Circle,
    MarkerStyle::Plus,
    MarkerStyle::Cross,
    MarkerStyle::Star,
    MarkerStyle::Square,
    MarkerStyle::Diamond,
    MarkerStyle::TriangleUp,
    MarkerStyle::TriangleDown,
};

}   // anonymous namespace

DashPattern dash_pattern(LineStyle style, float line_width)
{
    DashPattern p;
    const float w = line_width;
    switch (style)
    {
        case LineStyle::Solid:
        case LineStyle::None:
            break;
        case LineStyle::Dashed:
            p.segments[0] = 8.0f * w;
            p.segments[1] = 4.0f * w;
            p.count       = 2;
            break;
        case LineStyle::Dotted:
            p.segments[0] = 2.0f * w;
            p.segments[1] = 4.0f * w;
            p.count       = 2;
            break;
        case LineStyle::DashDot:
            p.segments[0] = 8.0f * w;
            p.segments[1] = 3.5f * w;
            p.segments[2] = 2.0f * w;
            p.segments[3] = 3.5f * w;
            p.count       = 4;
            break;
    }
    return p;
}

PlotStyle parse_format_string(std::string_view fmt)
{
    PlotStyle style;
    style.line_style     = LineStyle::None;
    bool has_line_spec   = false;
    bool has_marker_spec = false;

    size_t i = 0;
    while (i < fmt.size())
    {
        const char c = fmt[i];

        // Line styles first: '-' prefixes the multi-char specifiers
        if (c == '-')
        {
            has_line_spec = true;
            if (i + 1 < fmt.size() && fmt[i + 1] == '-')
            {
                style.line_style = LineStyle::Dashed;
                i += 2;
            }
            else if (i + 1 < fmt.size() && fmt[i + 1] == '.')
            {
                style.line_style = LineStyle::DashDot;
                i += 2;
            }
            else
            {
                style.line_style = LineStyle::Solid;
                i += 1;
            }
            continue;
        }
        if (c == ':')
        {
            has_line_spec    = true;
            style.line_style = LineStyle::Dotted;
            ++i;
            continue;
        }

        bool matched = false;
        for (const auto& cc : COLOR_CODES)
        {
            if (cc.code == c)
            {
                style.color = cc.color;
                matched     = true;
                break;
            }
        }
        if (!matched)
        {
            for (MarkerStyle m : ALL_MARKERS)
            {
                if (marker_style_symbol(m) == c)
                {
                    style.marker_style = m;
                    has_marker_spec    = true;
                    matched            = true;
                    break;
                }
            }
        }
        if (!matched)
        {
            throw InvalidParameterError("unrecognized character '" + std::string(1, c)
                                        + "' in format string \"" + std::string(fmt) + "\"");
        }
        ++i;
    }

    if (!has_line_spec && !has_marker_spec)
        style.line_style = LineStyle::Solid;

    return style;
}

std::string to_format_string(const PlotStyle& style)
{
    std::string result;

    if (style.color.has_value())
    {
        for (const auto& cc : COLOR_CODES)
        {
            if (cc.color == *style.color)
            {
                result += cc.code;
                break;
            }
        }
    }

    result += line_style_symbol(style.line_style);

    const char ms = marker_style_symbol(style.marker_style);
    if (ms != '\0')
        result += ms;

    return result;
}

}   // namespace plotscope
