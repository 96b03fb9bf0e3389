#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <plotscope/errors.hpp>
#include <plotscope/logger.hpp>
#include <plotscope/svg_backend.hpp>
#include <sstream>

#include "core/layout.hpp"
#include "core/ticks.hpp"

namespace plotscope
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

// Convert a Color to an SVG rgb() string
std::string svg_color(const Color& c)
{
    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "rgb(%d,%d,%d)",
                  static_cast<int>(std::lround(c.r * 255.0f)),
                  static_cast<int>(std::lround(c.g * 255.0f)),
                  static_cast<int>(std::lround(c.b * 255.0f)));
    return buf;
}

// Compact number, no trailing zeros
std::string fmt(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", v);
    return buf;
}

// XML-escape a string for safe embedding in SVG attributes/text content
std::string xml_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Font stack for all text; LaTeX themes put Computer Modern first
std::string font_stack(const Theme& theme)
{
    if (theme.use_latex)
        return xml_escape("CMU Serif, Latin Modern Roman, " + theme.font_family);
    return xml_escape(theme.font_family);
}

// Escaped text content. In LaTeX mode each $...$ span becomes an italic math
// tspan; text with an unpaired '$' is kept literally.
std::string text_markup(const std::string& text, const Theme& theme)
{
    const auto dollars = std::count(text.begin(), text.end(), '$');
    if (!theme.use_latex || dollars == 0 || dollars % 2 != 0)
        return xml_escape(text);

    std::string out;
    std::string run;
    bool        math = false;
    auto        flush = [&]()
    {
        if (run.empty())
            return;
        if (math)
            out += "<tspan class=\"math\" font-style=\"italic\">" + xml_escape(run) + "</tspan>";
        else
            out += xml_escape(run);
        run.clear();
    };
    for (char c : text)
    {
        if (c == '$')
        {
            flush();
            math = !math;
            continue;
        }
        run += c;
    }
    flush();
    return out;
}

struct DataRange
{
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();

    void include(double v)
    {
        min = std::min(min, v);
        max = std::max(max, v);
    }
    bool valid() const { return min <= max; }
};

bool usable(double v, bool log_axis)
{
    return std::isfinite(v) && (!log_axis || v > 0.0);
}

// Pad an autoscaled range by 5% per side, in log space for log axes.
AxisRange autoscale(const DataRange& r, bool log_axis)
{
    if (!r.valid())
        return log_axis ? AxisRange{1.0, 10.0} : AxisRange{0.0, 1.0};

    double lo = log_axis ? std::log10(r.min) : r.min;
    double hi = log_axis ? std::log10(r.max) : r.max;
    if (lo == hi)
    {
        const double half = lo != 0.0 ? std::abs(lo) * 0.1 : 0.5;
        lo -= half;
        hi += half;
    }
    else
    {
        const double pad = (hi - lo) * 0.05;
        lo -= pad;
        hi += pad;
    }
    if (log_axis)
        return {std::pow(10.0, lo), std::pow(10.0, hi)};
    return {lo, hi};
}

// Map data coordinates to SVG pixel coordinates within a viewport.
// SVG has Y-down, data has Y-up, so we flip Y.
struct DataToSvg
{
    Rect   vp;
    double x_min, x_max, y_min, y_max;
    bool   x_log = false;
    bool   y_log = false;

    static double axis_t(double v, double lo, double hi, bool log_axis)
    {
        if (log_axis)
        {
            v  = std::log10(v);
            lo = std::log10(lo);
            hi = std::log10(hi);
        }
        double range = hi - lo;
        if (range == 0.0)
            range = 1.0;
        return (v - lo) / range;
    }

    double map_x(double data_x) const { return vp.x + axis_t(data_x, x_min, x_max, x_log) * vp.w; }
    double map_y(double data_y) const { return vp.y + (1.0 - axis_t(data_y, y_min, y_max, y_log)) * vp.h; }

    bool maps(const Point& p) const { return usable(p.x, x_log) && usable(p.y, y_log); }
};

// Widen one axis so a data unit covers the same number of pixels on both.
void apply_equal_aspect(DataToSvg& m)
{
    if (m.x_log || m.y_log || m.vp.w <= 0.0f || m.vp.h <= 0.0f)
        return;
    const double ux = (m.x_max - m.x_min) / m.vp.w;
    const double uy = (m.y_max - m.y_min) / m.vp.h;
    if (ux > uy)
    {
        const double c    = 0.5 * (m.y_min + m.y_max);
        const double half = 0.5 * ux * m.vp.h;
        m.y_min           = c - half;
        m.y_max           = c + half;
    }
    else
    {
        const double c    = 0.5 * (m.x_min + m.x_max);
        const double half = 0.5 * uy * m.vp.w;
        m.x_min           = c - half;
        m.x_max           = c + half;
    }
}

TickResult ticks_for(double lo, double hi, bool log_axis)
{
    return log_axis ? generate_log_ticks(lo, hi) : generate_ticks(lo, hi);
}

void emit_background(std::ostringstream& svg, const DataToSvg& m, const Theme& theme)
{
    svg << "    <rect x=\"" << fmt(m.vp.x) << "\" y=\"" << fmt(m.vp.y) << "\" width=\"" << fmt(m.vp.w)
        << "\" height=\"" << fmt(m.vp.h) << "\" fill=\"" << svg_color(theme.axes_face) << "\"/>\n";
}

void emit_grid(std::ostringstream& svg, const TickResult& xt, const TickResult& yt, const DataToSvg& m, const Theme& theme)
{
    svg << "    <g class=\"grid\" stroke=\"" << svg_color(theme.grid_color) << "\" stroke-width=\"1\">\n";

    for (double tx : xt.positions)
    {
        double sx = m.map_x(tx);
        svg << "      <line x1=\"" << fmt(sx) << "\" y1=\"" << fmt(m.vp.y) << "\" x2=\"" << fmt(sx)
            << "\" y2=\"" << fmt(m.vp.y + m.vp.h) << "\"/>\n";
    }
    for (double ty : yt.positions)
    {
        double sy = m.map_y(ty);
        svg << "      <line x1=\"" << fmt(m.vp.x) << "\" y1=\"" << fmt(sy) << "\" x2=\""
            << fmt(m.vp.x + m.vp.w) << "\" y2=\"" << fmt(sy) << "\"/>\n";
    }

    svg << "    </g>\n";
}

void emit_tick_labels(std::ostringstream& svg,
                      const TickResult&   xt,
                      const TickResult&   yt,
                      const DataToSvg&    m,
                      const Theme&        theme)
{
    constexpr float label_offset = 16.0f;
    constexpr float pad          = 7.0f;

    svg << "    <g class=\"tick-labels\" font-family=\"" << font_stack(theme)
        << "\" font-size=\"" << fmt(theme.tick_font_size) << "\" fill=\"" << svg_color(theme.text_color)
        << "\">\n";

    const double bottom = m.vp.y + m.vp.h;
    for (size_t i = 0; i < xt.positions.size(); ++i)
    {
        svg << "      <text x=\"" << fmt(m.map_x(xt.positions[i])) << "\" y=\"" << fmt(bottom + label_offset)
            << "\" text-anchor=\"middle\">" << xml_escape(xt.labels[i]) << "</text>\n";
    }
    for (size_t i = 0; i < yt.positions.size(); ++i)
    {
        svg << "      <text x=\"" << fmt(m.vp.x - pad) << "\" y=\"" << fmt(m.map_y(yt.positions[i]) + 3.5)
            << "\" text-anchor=\"end\">" << xml_escape(yt.labels[i]) << "</text>\n";
    }

    svg << "    </g>\n";
}

void emit_labels(std::ostringstream& svg, const AxisSettings& s, const DataToSvg& m, const Theme& theme)
{
    const std::string font  = font_stack(theme);
    const std::string color = svg_color(theme.text_color);

    if (s.title && !s.title->empty())
    {
        double cx = m.vp.x + m.vp.w * 0.5;
        double ty = m.vp.y - 10.0;
        svg << "    <text class=\"title\" x=\"" << fmt(cx) << "\" y=\"" << fmt(ty)
            << "\" text-anchor=\"middle\" font-family=\"" << font << "\" font-size=\""
            << fmt(theme.title_font_size) << "\" fill=\"" << color << "\">" << text_markup(*s.title, theme)
            << "</text>\n";
    }

    if (s.xlabel && !s.xlabel->empty())
    {
        double cx = m.vp.x + m.vp.w * 0.5;
        double ly = m.vp.y + m.vp.h + 38.0;
        svg << "    <text class=\"xlabel\" x=\"" << fmt(cx) << "\" y=\"" << fmt(ly)
            << "\" text-anchor=\"middle\" font-family=\"" << font << "\" font-size=\""
            << fmt(theme.label_font_size) << "\" fill=\"" << color << "\">" << text_markup(*s.xlabel, theme)
            << "</text>\n";
    }

    if (s.ylabel && !s.ylabel->empty())
    {
        double cy = m.vp.y + m.vp.h * 0.5;
        double lx = m.vp.x - 52.0;
        svg << "    <text class=\"ylabel\" x=\"" << fmt(lx) << "\" y=\"" << fmt(cy)
            << "\" text-anchor=\"middle\" font-family=\"" << font << "\" font-size=\""
            << fmt(theme.label_font_size) << "\" fill=\"" << color << "\" transform=\"rotate(-90,"
            << fmt(lx) << "," << fmt(cy) << ")\">" << text_markup(*s.ylabel, theme) << "</text>\n";
    }
}

std::string dash_attribute(const ResolvedStyle& style)
{
    DashPattern dash = dash_pattern(style.line_style, style.line_width);
    if (dash.count == 0)
        return {};
    std::string out = " stroke-dasharray=\"";
    for (int i = 0; i < dash.count; ++i)
    {
        if (i > 0)
            out += ",";
        out += fmt(dash.segments[i]);
    }
    return out + "\"";
}

// Polylines, split wherever a point cannot be mapped (NaN, or <= 0 on a log
// axis).
void emit_line(std::ostringstream& svg, std::span<const Point> points, const ResolvedStyle& style, const DataToSvg& m)
{
    const std::string head = "    <polyline fill=\"none\" stroke=\"" + svg_color(style.color)
                             + "\" stroke-width=\"" + fmt(style.line_width) + "\" stroke-opacity=\""
                             + fmt(style.opacity * style.color.a) + "\"" + dash_attribute(style)
                             + " stroke-linejoin=\"round\" stroke-linecap=\"round\" points=\"";

    size_t i = 0;
    while (i < points.size())
    {
        while (i < points.size() && !m.maps(points[i]))
            ++i;
        size_t end = i;
        while (end < points.size() && m.maps(points[end]))
            ++end;
        if (end - i >= 2)
        {
            svg << head;
            for (size_t k = i; k < end; ++k)
            {
                if (k > i)
                    svg << " ";
                svg << fmt(m.map_x(points[k].x)) << "," << fmt(m.map_y(points[k].y));
            }
            svg << "\"/>\n";
        }
        i = end;
    }
}

void emit_marker(std::ostringstream& svg, MarkerStyle marker, double cx, double cy, double size)
{
    const double r = size * 0.5;
    switch (marker)
    {
        case MarkerStyle::None:
            break;
        case MarkerStyle::Point:
            svg << "      <circle cx=\"" << fmt(cx) << "\" cy=\"" << fmt(cy) << "\" r=\"" << fmt(r * 0.5)
                << "\"/>\n";
            break;
        case MarkerStyle::Circle:
            svg << "      <circle cx=\"" << fmt(cx) << "\" cy=\"" << fmt(cy) << "\" r=\"" << fmt(r)
                << "\"/>\n";
            break;
        case MarkerStyle::Square:
            svg << "      <rect x=\"" << fmt(cx - r) << "\" y=\"" << fmt(cy - r) << "\" width=\""
                << fmt(size) << "\" height=\"" << fmt(size) << "\"/>\n";
            break;
        case MarkerStyle::Diamond:
            svg << "      <polygon points=\"" << fmt(cx) << "," << fmt(cy - r) << " " << fmt(cx + r) << ","
                << fmt(cy) << " " << fmt(cx) << "," << fmt(cy + r) << " " << fmt(cx - r) << "," << fmt(cy)
                << "\"/>\n";
            break;
        case MarkerStyle::TriangleUp:
            svg << "      <polygon points=\"" << fmt(cx) << "," << fmt(cy - r) << " " << fmt(cx + r) << ","
                << fmt(cy + r) << " " << fmt(cx - r) << "," << fmt(cy + r) << "\"/>\n";
            break;
        case MarkerStyle::TriangleDown:
            svg << "      <polygon points=\"" << fmt(cx) << "," << fmt(cy + r) << " " << fmt(cx + r) << ","
                << fmt(cy - r) << " " << fmt(cx - r) << "," << fmt(cy - r) << "\"/>\n";
            break;
        case MarkerStyle::Plus:
            svg << "      <path d=\"M" << fmt(cx - r) << "," << fmt(cy) << "H" << fmt(cx + r) << "M"
                << fmt(cx) << "," << fmt(cy - r) << "V" << fmt(cy + r) << "\" fill=\"none\"/>\n";
            break;
        case MarkerStyle::Cross:
            svg << "      <path d=\"M" << fmt(cx - r) << "," << fmt(cy - r) << "L" << fmt(cx + r) << ","
                << fmt(cy + r) << "M" << fmt(cx - r) << "," << fmt(cy + r) << "L" << fmt(cx + r) << ","
                << fmt(cy - r) << "\" fill=\"none\"/>\n";
            break;
        case MarkerStyle::Star:
            svg << "      <path d=\"M" << fmt(cx - r) << "," << fmt(cy) << "H" << fmt(cx + r) << "M"
                << fmt(cx) << "," << fmt(cy - r) << "V" << fmt(cy + r) << "M" << fmt(cx - r * 0.7) << ","
                << fmt(cy - r * 0.7) << "L" << fmt(cx + r * 0.7) << "," << fmt(cy + r * 0.7) << "M"
                << fmt(cx - r * 0.7) << "," << fmt(cy + r * 0.7) << "L" << fmt(cx + r * 0.7) << ","
                << fmt(cy - r * 0.7) << "\" fill=\"none\"/>\n";
            break;
    }
}

void emit_markers(std::ostringstream&    svg,
                  std::span<const Point> points,
                  MarkerStyle            marker,
                  const ResolvedStyle&   style,
                  const DataToSvg&       m)
{
    const std::string color = svg_color(style.color);
    svg << "    <g class=\"markers\" fill=\"" << color << "\" stroke=\"" << color << "\" stroke-width=\""
        << fmt(std::max(1.0f, style.line_width * 0.75f)) << "\" opacity=\""
        << fmt(style.opacity * style.color.a) << "\">\n";
    for (const auto& p : points)
    {
        if (m.maps(p))
            emit_marker(svg, marker, m.map_x(p.x), m.map_y(p.y), style.marker_size);
    }
    svg << "    </g>\n";
}

void emit_legend(std::ostringstream&             svg,
                 const std::vector<LegendEntry>& entries,
                 const std::string&              location,
                 const DataToSvg&                m,
                 const Theme&                    theme)
{
    if (entries.empty())
        return;

    constexpr float entry_h  = 18.0f;
    constexpr float padding  = 8.0f;
    constexpr float swatch_w = 20.0f;
    constexpr float gap      = 6.0f;
    constexpr float inset    = 10.0f;

    size_t longest = 0;
    for (const auto& e : entries)
        longest = std::max(longest, e.label.size());

    // Label width estimated at 0.6em per character
    const double legend_h = padding * 2.0 + static_cast<double>(entries.size()) * entry_h;
    const double legend_w = padding * 2.0 + swatch_w + gap
                            + static_cast<double>(longest) * theme.legend_font_size * 0.6;

    // "best" has no data-aware placement here; it uses the upper right corner
    double lx = m.vp.x + m.vp.w - legend_w - inset;
    double ly = m.vp.y + inset;
    if (location.find("left") != std::string::npos)
        lx = m.vp.x + inset;
    else if (location == "center" || location == "upper center" || location == "lower center")
        lx = m.vp.x + (m.vp.w - legend_w) * 0.5;
    if (location.find("lower") != std::string::npos)
        ly = m.vp.y + m.vp.h - legend_h - inset;
    else if (location == "center" || location == "right" || location == "center left"
             || location == "center right")
        ly = m.vp.y + (m.vp.h - legend_h) * 0.5;

    svg << "    <g class=\"legend\" font-family=\"" << font_stack(theme) << "\" font-size=\""
        << fmt(theme.legend_font_size) << "\" fill=\"" << svg_color(theme.text_color) << "\">\n";

    for (size_t i = 0; i < entries.size(); ++i)
    {
        const auto& e  = entries[i];
        double      ey = ly + padding + static_cast<double>(i) * entry_h + entry_h * 0.5;
        double      ex = lx + padding;

        if (e.is_line)
        {
            svg << "      <line x1=\"" << fmt(ex) << "\" y1=\"" << fmt(ey) << "\" x2=\"" << fmt(ex + swatch_w)
                << "\" y2=\"" << fmt(ey) << "\" stroke=\"" << svg_color(e.style.color) << "\" stroke-width=\""
                << fmt(e.style.line_width) << "\"" << dash_attribute(e.style) << "/>\n";
        }
        if (e.style.marker_style != MarkerStyle::None || !e.is_line)
        {
            const MarkerStyle marker =
                e.style.marker_style != MarkerStyle::None ? e.style.marker_style : MarkerStyle::Circle;
            const std::string color = svg_color(e.style.color);
            svg << "      <g fill=\"" << color << "\" stroke=\"" << color << "\">\n";
            emit_marker(svg, marker, ex + swatch_w * 0.5, ey, std::min(e.style.marker_size, 10.0f));
            svg << "      </g>\n";
        }

        svg << "      <text x=\"" << fmt(ex + swatch_w + gap) << "\" y=\"" << fmt(ey + 3.5) << "\">"
            << text_markup(e.label, theme) << "</text>\n";
    }

    svg << "    </g>\n";
}

}   // anonymous namespace

// ─── SvgBackend ─────────────────────────────────────────────────────────────

SvgBackend::SvgBackend(SvgConfig config, Theme theme) : config_(config), theme_(std::move(theme))
{
    if (config_.width == 0 || config_.height == 0)
        throw InvalidParameterError("SVG canvas size must be non-zero");
}

SvgBackend::CanvasData& SvgBackend::canvas_data(CanvasHandle canvas, const char* operation)
{
    auto it = canvases_.find(canvas.id);
    if (it == canvases_.end())
        throw BackendError(operation, "unknown canvas " + std::to_string(canvas.id));
    return it->second;
}

SvgBackend::AxesData& SvgBackend::axes_data(AxesHandle axes, const char* operation)
{
    auto it = axes_.find(axes.id);
    if (it == axes_.end())
        throw BackendError(operation, "unknown axes " + std::to_string(axes.id));
    return it->second;
}

CanvasHandle SvgBackend::create_canvas()
{
    const uint64_t id = next_id_++;
    canvases_.emplace(id, CanvasData{});
    return {id};
}

std::map<GridPos, AxesHandle> SvgBackend::create_axes_grid(CanvasHandle                 canvas,
                                                           int                          rows,
                                                           int                          cols,
                                                           const std::vector<PlotCell>& cells)
{
    CanvasData& c = canvas_data(canvas, "create_axes_grid");
    if (rows <= 0 || cols <= 0)
        throw BackendError("create_axes_grid", "grid dimensions must be positive");
    if (!c.axes.empty())
        throw BackendError("create_axes_grid", "canvas already has axes");

    c.rows = rows;
    c.cols = cols;

    std::map<GridPos, AxesHandle> out;
    for (const auto& cell : cells)
    {
        if (cell.row < 0 || cell.col < 0 || cell.row + cell.row_span > rows || cell.col + cell.col_span > cols)
            throw BackendError("create_axes_grid", std::string("cell '") + cell.glyph + "' lies outside the grid");

        const uint64_t id = next_id_++;
        axes_.emplace(id, AxesData{.canvas = canvas.id, .cell = cell});
        c.axes.push_back(id);
        out.emplace(cell.anchor(), AxesHandle{id});
    }
    return out;
}

void SvgBackend::draw_curve(AxesHandle axes, std::span<const Point> points, const ResolvedStyle& style)
{
    axes_data(axes, "draw_curve")
        .series.push_back({std::vector<Point>(points.begin(), points.end()), style, false});
}

void SvgBackend::draw_scatter(AxesHandle axes, std::span<const Point> points, const ResolvedStyle& style)
{
    axes_data(axes, "draw_scatter")
        .series.push_back({std::vector<Point>(points.begin(), points.end()), style, true});
}

void SvgBackend::configure_axes(AxesHandle axes, const AxisSettings& settings)
{
    axes_data(axes, "configure_axes").settings.merge(settings);
}

void SvgBackend::set_legend(AxesHandle axes, const std::vector<LegendEntry>& entries, std::string_view location)
{
    AxesData& a       = axes_data(axes, "set_legend");
    a.legend          = entries;
    a.legend_location = std::string(location);
}

std::string SvgBackend::to_string(CanvasHandle canvas) const
{
    auto cit = canvases_.find(canvas.id);
    if (cit == canvases_.end())
        throw BackendError("render", "unknown canvas " + std::to_string(canvas.id));
    const CanvasData& c = cit->second;

    const uint32_t w = config_.width;
    const uint32_t h = config_.height;

    Margins margins;
    margins.left   = config_.margin_left;
    margins.right  = config_.margin_right;
    margins.top    = config_.margin_top;
    margins.bottom = config_.margin_bottom;

    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << w << "\" height=\"" << h
        << "\" viewBox=\"0 0 " << w << " " << h << "\">\n";
    svg << "  <rect width=\"100%\" height=\"100%\" fill=\"" << svg_color(theme_.figure_face) << "\"/>\n";

    int clip_index = 0;
    for (uint64_t axes_id : c.axes)
    {
        const AxesData&     a = axes_.at(axes_id);
        const AxisSettings& s = a.settings;

        const bool x_log = s.xscale == ScaleMode::Log;
        const bool y_log = s.yscale == ScaleMode::Log;

        DataRange xr;
        DataRange yr;
        for (const auto& series : a.series)
        {
            for (const auto& p : series.points)
            {
                if (usable(p.x, x_log) && usable(p.y, y_log))
                {
                    xr.include(p.x);
                    yr.include(p.y);
                }
            }
        }

        // Non-positive limits cannot be shown on a log axis; autoscale instead
        auto fits = [](const std::optional<AxisRange>& lim, bool log_axis)
        { return lim && (!log_axis || (lim->min > 0.0 && lim->max > 0.0)); };
        const AxisRange xlim = fits(s.xlim, x_log) ? *s.xlim : autoscale(xr, x_log);
        const AxisRange ylim = fits(s.ylim, y_log) ? *s.ylim : autoscale(yr, y_log);

        DataToSvg m{.vp    = compute_cell_rect(static_cast<float>(w),
                                               static_cast<float>(h),
                                               c.rows,
                                               c.cols,
                                               a.cell,
                                               margins),
                    .x_min = xlim.min,
                    .x_max = xlim.max,
                    .y_min = ylim.min,
                    .y_max = ylim.max,
                    .x_log = x_log,
                    .y_log = y_log};
        if (s.equal_aspect.value_or(false))
            apply_equal_aspect(m);

        const TickResult xt = ticks_for(std::min(m.x_min, m.x_max), std::max(m.x_min, m.x_max), x_log);
        const TickResult yt = ticks_for(std::min(m.y_min, m.y_max), std::max(m.y_min, m.y_max), y_log);

        const std::string clip_id = "clip-" + std::to_string(clip_index++);

        svg << "  <g class=\"axes\" id=\"axes-" << xml_escape(std::string(1, a.cell.glyph)) << "\">\n";
        svg << "    <defs>\n";
        svg << "      <clipPath id=\"" << clip_id << "\">\n";
        svg << "        <rect x=\"" << fmt(m.vp.x) << "\" y=\"" << fmt(m.vp.y) << "\" width=\"" << fmt(m.vp.w)
            << "\" height=\"" << fmt(m.vp.h) << "\"/>\n";
        svg << "      </clipPath>\n";
        svg << "    </defs>\n";

        emit_background(svg, m, theme_);
        if (config_.show_grid)
            emit_grid(svg, xt, yt, m, theme_);

        svg << "    <g clip-path=\"url(#" << clip_id << ")\">\n";
        for (const auto& series : a.series)
        {
            if (series.scatter)
            {
                const MarkerStyle marker = series.style.marker_style != MarkerStyle::None
                                               ? series.style.marker_style
                                               : MarkerStyle::Circle;
                emit_markers(svg, series.points, marker, series.style, m);
                continue;
            }
            if (series.style.line_style != LineStyle::None)
                emit_line(svg, series.points, series.style, m);
            if (series.style.marker_style != MarkerStyle::None)
                emit_markers(svg, series.points, series.style.marker_style, series.style, m);
        }
        svg << "    </g>\n";

        emit_tick_labels(svg, xt, yt, m, theme_);
        emit_labels(svg, s, m, theme_);
        emit_legend(svg, a.legend, a.legend_location, m, theme_);

        svg << "  </g>\n";
    }

    svg << "</svg>\n";
    return svg.str();
}

void SvgBackend::render(CanvasHandle canvas)
{
    document_ = to_string(canvas);
    PLOTSCOPE_LOG_DEBUG("svg", "rendered canvas {} ({} bytes)", canvas.id, document_.size());
}

void SvgBackend::save(CanvasHandle canvas, const std::string& path)
{
    std::string content = to_string(canvas);

    std::ofstream file(path);
    if (!file.is_open())
        throw BackendError("save", "cannot open '" + path + "' for writing");

    file << content;
    if (!file.good())
        throw BackendError("save", "failed writing '" + path + "'");

    document_ = std::move(content);
    PLOTSCOPE_LOG_INFO("svg", "saved {} ({} bytes)", path, document_.size());
}

void SvgBackend::release(CanvasHandle canvas)
{
    CanvasData& c = canvas_data(canvas, "release");
    for (uint64_t id : c.axes)
        axes_.erase(id);
    canvases_.erase(canvas.id);
}

}   // namespace plotscope
