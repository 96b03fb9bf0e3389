#pragma once

#include <atomic>
#include <cstddef>
#include <limits>
#include <optional>
#include <plotscope/backend.hpp>
#include <plotscope/draw_op.hpp>
#include <plotscope/errors.hpp>
#include <plotscope/grid.hpp>
#include <plotscope/sample_buffer.hpp>
#include <plotscope/sampler.hpp>
#include <plotscope/style.hpp>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace plotscope
{

// Tolerances used when a function is plotted over an interval.
struct SamplingDefaults
{
    double tolerance = 1e-3;
    int    max_depth = 16;
    double min_step  = 1e-9;
    double max_step  = std::numeric_limits<double>::infinity();
};

struct FigureOptions
{
    // Applied to every cell; per-cell calls issued later take precedence.
    std::string              title;
    std::string              xlabel;
    std::string              ylabel;
    std::optional<AxisRange> xlim;
    std::optional<AxisRange> ylim;

    // Unset: a legend appears on every cell holding labeled plots.
    std::optional<bool> legend;
    std::string         legend_location = "best";

    // Save to this path on exit; render on the backend when empty.
    std::string save_path;

    Theme            theme;
    SamplingDefaults sampling;
    SamplerOptions   sampler;
};

struct PlotOptions
{
    std::string              label;
    std::optional<char>      group;              // one ASCII glyph; the default group is reserved
    std::string              format;             // MATLAB style, e.g. "r--o"
    std::optional<PlotStyle> style;              // wins over `format`
    bool                     line       = true;   // false: markers only, cross marker
    bool                     invert     = false;  // swap x and y
    double                   rotate_deg = 0.0;    // clockwise, about the origin
};

// Deferred-rendering scope. Plot and configuration calls are queued; the
// backend is only touched when the context is flushed, either explicitly or
// by the destructor.
//
//   {
//       plotscope::FigureContext fig(backend, {.save_path = "sin.svg"});
//       fig.plot([](double x) { return std::sin(x); }, {-10.0, 10.0}, {.label = "sin"});
//       fig.xlabel("x");
//   }   // replayed and saved here
//
// A context belongs to the thread that created it and holds its backend
// exclusively until it is closed.
class FigureContext
{
   public:
    enum class State
    {
        Open,
        Closed,
    };

    explicit FigureContext(PlotBackend& backend, FigureOptions options = {});
    ~FigureContext();

    FigureContext(const FigureContext&)            = delete;
    FigureContext& operator=(const FigureContext&) = delete;
    FigureContext(FigureContext&&)                 = delete;
    FigureContext& operator=(FigureContext&&)      = delete;

    // ── Plots ──

    void plot(const SampleBuffer& samples, const PlotOptions& opts = {});
    // Sampled immediately with the figure's sampling defaults.
    void plot(const ScalarFunction& f, Interval interval, const PlotOptions& opts = {});
    void plot(const SamplingTask& task, const PlotOptions& opts = {});
    void plot(const ScalarFunction& f, std::span<const double> xs, const PlotOptions& opts = {});
    void plot(std::span<const double> xs, std::span<const double> ys, const PlotOptions& opts = {});

    void scatter(const SampleBuffer& samples, const PlotOptions& opts = {});
    void scatter(std::span<const double> xs, std::span<const double> ys, const PlotOptions& opts = {});

    // ── Layout ──

    void set_grid(std::string_view grid_text);
    void set_grid(const std::vector<std::string>& rows);
    // Grid computed at flush time from the groups plotted so far: sorted,
    // default group last. Give at most one of rows / cols to fix the shape.
    void set_auto_grid(std::optional<int> rows = std::nullopt, std::optional<int> cols = std::nullopt);

    // ── Axis configuration (all cells when no group is given) ──

    void title(std::string_view text, std::optional<char> group = std::nullopt);
    void xlabel(std::string_view text, std::optional<char> group = std::nullopt);
    void ylabel(std::string_view text, std::optional<char> group = std::nullopt);
    void xlim(double lo, double hi, std::optional<char> group = std::nullopt);
    void ylim(double lo, double hi, std::optional<char> group = std::nullopt);
    // "xlim", "ylim" or an alias such as "xrange".
    void set_range(std::string_view axis, double lo, double hi, std::optional<char> group = std::nullopt);
    void xscale(ScaleMode mode, std::optional<char> group = std::nullopt);
    void yscale(ScaleMode mode, std::optional<char> group = std::nullopt);
    void equal_aspect(bool enabled = true, std::optional<char> group = std::nullopt);
    void legend(bool enabled, std::optional<char> group = std::nullopt);
    // A location such as "upper left", or "off" / "false" to disable.
    void legend(std::string_view location, std::optional<char> group = std::nullopt);
    // Literals would otherwise convert to bool.
    void legend(const char* location, std::optional<char> group = std::nullopt)
    {
        legend(std::string_view(location), group);
    }

    // ── Lifecycle ──

    // Replays the queue, then saves or renders. The context is Closed
    // afterwards even when this throws. Backend failures surface as one
    // AggregateReplayError.
    void flush();
    void exit() { flush(); }
    // flush() writing to `path` instead of the configured save path.
    void save(const std::string& path);

    State                      state() const { return state_; }
    bool                       is_open() const { return state_ == State::Open; }
    size_t                     pending_ops() const { return ops_.size(); }
    const std::vector<DrawOp>& ops() const { return ops_; }
    const GridLayout*          grid() const { return grid_ ? &*grid_ : nullptr; }
    const StyleResolver&       styles() const { return styles_; }
    const FigureOptions&       options() const { return options_; }

   private:
    class CallGuard;
    struct CellState;

    void push_drawing(bool scatter, std::vector<Point> points, const PlotOptions& opts);
    void push_config(std::optional<char> group, DrawCommand command);
    void check_grid_unset() const;

    GridLayout                build_layout() const;
    void                      flush_to(const std::string& save_path);
    std::vector<BackendError> replay(const std::string& save_path);
    void                      close();

    PlotBackend&              backend_;
    FigureOptions             options_;
    StyleResolver             styles_;
    AdaptiveSampler           sampler_;
    std::vector<DrawOp>       ops_;
    std::optional<GridLayout> grid_;
    bool                      auto_grid_ = false;
    std::optional<int>        auto_rows_;
    std::optional<int>        auto_cols_;
    State                     state_ = State::Open;
    std::thread::id           owner_;
    std::atomic<bool>         busy_{false};
    int                       uncaught_at_entry_ = 0;
};

}   // namespace plotscope
