#pragma once

// PlotBackend test double. Records every call in order and can be told to
// fail selected operations.
//
// Usage:
//   plotscope::test::RecordingBackend backend;
//   backend.fail_ops.insert("draw_curve");
//   {
//       plotscope::FigureContext fig(backend);
//       fig.plot(xs, ys, {.label = "a"});
//   }
//   EXPECT_EQ(backend.count("set_legend"), 1u);

#include <cstdint>
#include <functional>
#include <map>
#include <plotscope/backend.hpp>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace plotscope::test
{

class RecordingBackend : public PlotBackend
{
   public:
    struct Call
    {
        std::string              op;
        uint64_t                 handle = 0;
        std::vector<Point>       points;
        ResolvedStyle            style;
        AxisSettings             settings;
        std::vector<LegendEntry> legend;
        std::string              location;
        std::string              path;
    };

    std::vector<Call>      calls;
    std::set<std::string>  fail_ops;
    std::function<void()>  on_draw;   // runs inside draw_curve / draw_scatter
    bool                   omit_axes = false;

    int                    grid_rows = 0;
    int                    grid_cols = 0;
    std::vector<PlotCell>  grid_cells;
    std::map<uint64_t, char> axes_glyph;

    CanvasHandle create_canvas() override
    {
        record({.op = "create_canvas"});
        return {next_id_++};
    }

    std::map<GridPos, AxesHandle> create_axes_grid(CanvasHandle                 canvas,
                                                   int                          rows,
                                                   int                          cols,
                                                   const std::vector<PlotCell>& cells) override
    {
        record({.op = "create_axes_grid", .handle = canvas.id});
        grid_rows  = rows;
        grid_cols  = cols;
        grid_cells = cells;

        std::map<GridPos, AxesHandle> out;
        if (omit_axes)
            return out;
        for (const auto& cell : cells)
        {
            const uint64_t id = next_id_++;
            axes_glyph[id]    = cell.glyph;
            out.emplace(cell.anchor(), AxesHandle{id});
        }
        return out;
    }

    void draw_curve(AxesHandle axes, std::span<const Point> points, const ResolvedStyle& style) override
    {
        if (on_draw)
            on_draw();
        record({.op     = "draw_curve",
                .handle = axes.id,
                .points = std::vector<Point>(points.begin(), points.end()),
                .style  = style});
    }

    void draw_scatter(AxesHandle axes, std::span<const Point> points, const ResolvedStyle& style) override
    {
        if (on_draw)
            on_draw();
        record({.op     = "draw_scatter",
                .handle = axes.id,
                .points = std::vector<Point>(points.begin(), points.end()),
                .style  = style});
    }

    void configure_axes(AxesHandle axes, const AxisSettings& settings) override
    {
        record({.op = "configure_axes", .handle = axes.id, .settings = settings});
    }

    void set_legend(AxesHandle axes, const std::vector<LegendEntry>& entries, std::string_view location) override
    {
        record({.op       = "set_legend",
                .handle   = axes.id,
                .legend   = entries,
                .location = std::string(location)});
    }

    void render(CanvasHandle canvas) override { record({.op = "render", .handle = canvas.id}); }

    void save(CanvasHandle canvas, const std::string& path) override
    {
        record({.op = "save", .handle = canvas.id, .path = path});
    }

    void release(CanvasHandle canvas) override { record({.op = "release", .handle = canvas.id}); }

    size_t count(std::string_view op) const
    {
        size_t n = 0;
        for (const auto& c : calls)
        {
            if (c.op == op)
                ++n;
        }
        return n;
    }

    std::vector<const Call*> find(std::string_view op) const
    {
        std::vector<const Call*> out;
        for (const auto& c : calls)
        {
            if (c.op == op)
                out.push_back(&c);
        }
        return out;
    }

    std::vector<std::string> ops() const
    {
        std::vector<std::string> out;
        for (const auto& c : calls)
            out.push_back(c.op);
        return out;
    }

   private:
    // Calls are recorded even when they fail, so tests can see the attempt.
    void record(Call call)
    {
        const std::string op = call.op;
        calls.push_back(std::move(call));
        if (fail_ops.count(op))
            throw std::runtime_error(op + " failed");
    }

    uint64_t next_id_ = 1;
};

}   // namespace plotscope::test
