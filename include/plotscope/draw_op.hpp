#pragma once

#include <optional>
#include <plotscope/backend.hpp>
#include <plotscope/plot_style.hpp>
#include <string>
#include <variant>
#include <vector>

namespace plotscope
{

struct CurveOp
{
    std::vector<Point> points;
    PlotStyle          style;
    std::string        label;
    bool               inverted = false;
};

struct ScatterOp
{
    std::vector<Point> points;
    PlotStyle          style;
    std::string        label;
    bool               inverted = false;
};

struct LegendOverride
{
    std::optional<bool>        enabled;
    std::optional<std::string> location;   // canonical
};

struct AxisConfig
{
    AxisSettings settings;
};

using DrawCommand = std::variant<CurveOp, ScatterOp, LegendOverride, AxisConfig>;

// One queued operation. An empty target applies a configuration op to every
// cell; drawing ops always name their group.
struct DrawOp
{
    std::optional<char> target;
    DrawCommand         command;

    bool is_drawing() const
    {
        return std::holds_alternative<CurveOp>(command) || std::holds_alternative<ScatterOp>(command);
    }
};

}   // namespace plotscope
