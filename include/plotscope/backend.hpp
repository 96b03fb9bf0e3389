#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <plotscope/grid.hpp>
#include <plotscope/plot_style.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace plotscope
{

struct CanvasHandle
{
    uint64_t id = 0;

    bool operator==(const CanvasHandle&) const = default;
};

struct AxesHandle
{
    uint64_t id = 0;

    bool operator==(const AxesHandle&) const = default;
};

struct Point
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point&) const = default;
};

enum class ScaleMode : uint8_t
{
    Linear,
    Log,
};

struct AxisRange
{
    double min = 0.0;
    double max = 1.0;

    bool operator==(const AxisRange&) const = default;
};

// Partial axis configuration. Unset fields leave the backend's defaults.
struct AxisSettings
{
    std::optional<std::string> title;
    std::optional<std::string> xlabel;
    std::optional<std::string> ylabel;
    std::optional<AxisRange>   xlim;
    std::optional<AxisRange>   ylim;
    std::optional<ScaleMode>   xscale;
    std::optional<ScaleMode>   yscale;
    std::optional<bool>        equal_aspect;

    // Fields set in `later` replace ours.
    void merge(const AxisSettings& later);
    bool empty() const;

    bool operator==(const AxisSettings&) const = default;
};

struct LegendEntry
{
    std::string   label;
    ResolvedStyle style;
    bool          is_line = true;
};

// External drawing collaborator. Failures are reported by throwing; the
// figure replay wraps anything thrown here in a BackendError.
class PlotBackend
{
   public:
    virtual ~PlotBackend() = default;

    virtual CanvasHandle create_canvas() = 0;

    // One AxesHandle per cell, keyed by the cell's top-left position.
    virtual std::map<GridPos, AxesHandle> create_axes_grid(CanvasHandle                 canvas,
                                                           int                          rows,
                                                           int                          cols,
                                                           const std::vector<PlotCell>& cells) = 0;

    virtual void draw_curve(AxesHandle axes, std::span<const Point> points, const ResolvedStyle& style) = 0;
    virtual void draw_scatter(AxesHandle axes, std::span<const Point> points, const ResolvedStyle& style) = 0;

    virtual void configure_axes(AxesHandle axes, const AxisSettings& settings) = 0;
    virtual void set_legend(AxesHandle                      axes,
                            const std::vector<LegendEntry>& entries,
                            std::string_view                location) = 0;

    virtual void render(CanvasHandle canvas)                          = 0;
    virtual void save(CanvasHandle canvas, const std::string& path) = 0;
    virtual void release(CanvasHandle canvas)                         = 0;
};

}   // namespace plotscope
