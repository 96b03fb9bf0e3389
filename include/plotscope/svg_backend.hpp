#pragma once

#include <cstdint>
#include <map>
#include <plotscope/backend.hpp>
#include <plotscope/style.hpp>
#include <string>
#include <vector>

namespace plotscope
{

struct SvgConfig
{
    uint32_t width  = 800;
    uint32_t height = 550;

    // Space kept free around each subplot's plot area, in pixels.
    float margin_left   = 70.0f;
    float margin_right  = 20.0f;
    float margin_top    = 40.0f;
    float margin_bottom = 55.0f;

    bool show_grid = true;
};

// PlotBackend that records every call and serializes the canvas to an SVG
// document on render() / save().
class SvgBackend : public PlotBackend
{
   public:
    // The default theme picks LaTeX text mode when a TeX toolchain is on PATH.
    explicit SvgBackend(SvgConfig config = {}, Theme theme = Theme::detect());

    CanvasHandle                  create_canvas() override;
    std::map<GridPos, AxesHandle> create_axes_grid(CanvasHandle                 canvas,
                                                   int                          rows,
                                                   int                          cols,
                                                   const std::vector<PlotCell>& cells) override;

    void draw_curve(AxesHandle axes, std::span<const Point> points, const ResolvedStyle& style) override;
    void draw_scatter(AxesHandle axes, std::span<const Point> points, const ResolvedStyle& style) override;

    void configure_axes(AxesHandle axes, const AxisSettings& settings) override;
    void set_legend(AxesHandle                      axes,
                    const std::vector<LegendEntry>& entries,
                    std::string_view                location) override;

    void render(CanvasHandle canvas) override;
    // Throws BackendError when the file cannot be written.
    void save(CanvasHandle canvas, const std::string& path) override;
    void release(CanvasHandle canvas) override;

    // Serializes a live canvas.
    std::string to_string(CanvasHandle canvas) const;

    // Document produced by the last render() or save().
    const std::string& document() const { return document_; }

    size_t live_canvases() const { return canvases_.size(); }

    const SvgConfig& config() const { return config_; }
    const Theme&     theme() const { return theme_; }

   private:
    struct SeriesData
    {
        std::vector<Point> points;
        ResolvedStyle      style;
        bool               scatter = false;
    };

    struct AxesData
    {
        uint64_t                 canvas = 0;
        PlotCell                 cell;
        AxisSettings             settings;
        std::vector<SeriesData>  series;
        std::vector<LegendEntry> legend;
        std::string              legend_location;
    };

    struct CanvasData
    {
        int                   rows = 1;
        int                   cols = 1;
        std::vector<uint64_t> axes;
    };

    CanvasData& canvas_data(CanvasHandle canvas, const char* operation);
    AxesData&   axes_data(AxesHandle axes, const char* operation);

    SvgConfig                      config_;
    Theme                          theme_;
    std::map<uint64_t, CanvasData> canvases_;
    std::map<uint64_t, AxesData>   axes_;
    uint64_t                       next_id_ = 1;
    std::string                    document_;
};

}   // namespace plotscope
