#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <mutex>
#include <numbers>
#include <plotscope/errors.hpp>
#include <plotscope/figure.hpp>
#include <plotscope/logger.hpp>
#include <set>

namespace plotscope
{

namespace
{

// Backends currently bound to an open FigureContext.
std::mutex                   g_backends_mutex;
std::set<const PlotBackend*> g_open_backends;

void bind_backend(const PlotBackend* backend)
{
    std::lock_guard lock(g_backends_mutex);
    if (!g_open_backends.insert(backend).second)
        throw ConcurrentAccessError("backend is already bound to an open figure context");
}

void unbind_backend(const PlotBackend* backend)
{
    std::lock_guard lock(g_backends_mutex);
    g_open_backends.erase(backend);
}

void validate_group(std::optional<char> group, bool drawing)
{
    if (!group)
        return;
    const auto c = static_cast<unsigned char>(*group);
    if (c >= 0x80)
        throw InvalidParameterError("group must be a single ASCII character");
    if (std::isspace(c) || c == '\0')
        throw InvalidParameterError("group must be a visible character");
    if (drawing && *group == DEFAULT_GROUP)
        throw InvalidParameterError(std::string("'") + DEFAULT_GROUP + "' is a reserved group name");
}

AxisRange checked_range(const char* axis, double lo, double hi)
{
    if (!std::isfinite(lo) || !std::isfinite(hi) || lo == hi)
        throw InvalidParameterError(std::string(axis) + " needs two distinct finite bounds");
    return {lo, hi};
}

std::vector<Point> to_points(const SampleBuffer& samples)
{
    std::vector<Point> points;
    points.reserve(samples.size());
    for (const auto& s : samples.samples())
        points.push_back({s.x, s.y});
    return points;
}

std::vector<Point> to_points(std::span<const double> xs, std::span<const double> ys)
{
    if (xs.size() != ys.size())
    {
        throw InvalidParameterError("x and y data differ in length (" + std::to_string(xs.size())
                                    + " vs " + std::to_string(ys.size()) + ")");
    }
    std::vector<Point> points;
    points.reserve(xs.size());
    for (size_t i = 0; i < xs.size(); ++i)
        points.push_back({xs[i], ys[i]});
    return points;
}

}   // anonymous namespace

// ─── Call guard ─────────────────────────────────────────────────────────────
// Every public entry point runs under one of these: owner thread only, no
// re-entry (e.g. from a backend callback during replay), Open state only.

class FigureContext::CallGuard
{
   public:
    CallGuard(FigureContext& ctx, const char* operation) : ctx_(ctx)
    {
        if (std::this_thread::get_id() != ctx_.owner_)
        {
            throw ConcurrentAccessError(std::string(operation)
                                        + ": figure context used from a thread that does not own it");
        }
        if (ctx_.busy_.exchange(true))
            throw ConcurrentAccessError(std::string(operation) + ": figure context is already in use");
        if (ctx_.state_ == State::Closed)
        {
            ctx_.busy_.store(false);
            throw ClosedContextError(operation);
        }
    }

    ~CallGuard() { ctx_.busy_.store(false); }

    CallGuard(const CallGuard&)            = delete;
    CallGuard& operator=(const CallGuard&) = delete;

   private:
    FigureContext& ctx_;
};

struct FigureContext::CellState
{
    const PlotCell*           cell = nullptr;
    std::optional<AxesHandle> axes;
    AxisSettings              settings;
    std::optional<bool>       legend_enabled;
    std::string               legend_location;
    std::vector<LegendEntry>  entries;
    size_t                    series   = 0;
    bool                      inverted = false;
};

// ─── Lifecycle ──────────────────────────────────────────────────────────────

FigureContext::FigureContext(PlotBackend& backend, FigureOptions options)
    : backend_(backend),
      options_(std::move(options)),
      styles_(default_alias_table(), options_.theme),
      sampler_(options_.sampler),
      owner_(std::this_thread::get_id()),
      uncaught_at_entry_(std::uncaught_exceptions())
{
    options_.legend_location = styles_.legend_location(options_.legend_location);
    if (options_.xlim)
        checked_range("xlim", options_.xlim->min, options_.xlim->max);
    if (options_.ylim)
        checked_range("ylim", options_.ylim->min, options_.ylim->max);

    bind_backend(&backend_);
    PLOTSCOPE_LOG_TRACE("figure", "figure context opened");
}

FigureContext::~FigureContext()
{
    if (state_ == State::Closed)
        return;

    if (std::uncaught_exceptions() > uncaught_at_entry_)
    {
        PLOTSCOPE_LOG_WARN("figure",
                           "scope left by an exception, discarding {} queued operation(s)",
                           ops_.size());
        close();
        return;
    }

    try
    {
        flush();
    }
    catch (const std::exception& e)
    {
        PLOTSCOPE_LOG_ERROR("figure", "flush on scope exit failed: {}", e.what());
    }
    if (state_ == State::Open)
        close();
}

void FigureContext::close()
{
    state_ = State::Closed;
    unbind_backend(&backend_);
}

void FigureContext::flush()
{
    CallGuard guard(*this, "flush");
    flush_to(options_.save_path);
}

void FigureContext::save(const std::string& path)
{
    CallGuard guard(*this, "save");
    if (path.empty())
        throw InvalidParameterError("save path is empty");
    flush_to(path);
}

void FigureContext::flush_to(const std::string& save_path)
{
    std::vector<BackendError> failures;
    try
    {
        failures = replay(save_path);
    }
    catch (...)
    {
        close();
        throw;
    }
    close();

    if (!failures.empty())
    {
        PLOTSCOPE_LOG_ERROR("figure", "{} backend call(s) failed during replay", failures.size());
        throw AggregateReplayError(std::move(failures));
    }
}

// ─── Plots ──────────────────────────────────────────────────────────────────

void FigureContext::plot(const SampleBuffer& samples, const PlotOptions& opts)
{
    CallGuard guard(*this, "plot");
    push_drawing(false, to_points(samples), opts);
}

void FigureContext::plot(const ScalarFunction& f, Interval interval, const PlotOptions& opts)
{
    CallGuard          guard(*this, "plot");
    const auto&        d    = options_.sampling;
    const SamplingTask task = {.function  = f,
                               .interval  = interval,
                               .tolerance = d.tolerance,
                               .max_depth = d.max_depth,
                               .min_step  = d.min_step,
                               .max_step  = d.max_step};
    push_drawing(false, to_points(sampler_.sample(task)), opts);
}

void FigureContext::plot(const SamplingTask& task, const PlotOptions& opts)
{
    CallGuard guard(*this, "plot");
    push_drawing(false, to_points(sampler_.sample(task)), opts);
}

void FigureContext::plot(const ScalarFunction& f, std::span<const double> xs, const PlotOptions& opts)
{
    CallGuard guard(*this, "plot");
    push_drawing(false, to_points(evaluate_at(f, xs)), opts);
}

void FigureContext::plot(std::span<const double> xs, std::span<const double> ys, const PlotOptions& opts)
{
    CallGuard guard(*this, "plot");
    push_drawing(false, to_points(xs, ys), opts);
}

void FigureContext::scatter(const SampleBuffer& samples, const PlotOptions& opts)
{
    CallGuard guard(*this, "scatter");
    push_drawing(true, to_points(samples), opts);
}

void FigureContext::scatter(std::span<const double> xs, std::span<const double> ys, const PlotOptions& opts)
{
    CallGuard guard(*this, "scatter");
    push_drawing(true, to_points(xs, ys), opts);
}

void FigureContext::push_drawing(bool scatter, std::vector<Point> points, const PlotOptions& opts)
{
    validate_group(opts.group, true);
    if (!std::isfinite(opts.rotate_deg))
        throw InvalidParameterError("rotation angle must be finite");

    PlotStyle style;
    if (opts.style)
        style = *opts.style;
    else if (!opts.format.empty())
        style = parse_format_string(opts.format);
    else if (scatter)
        style = {.line_style = LineStyle::None, .marker_style = MarkerStyle::Circle};

    if (!opts.line)
    {
        style.line_style   = LineStyle::None;
        style.marker_style = MarkerStyle::Cross;
    }

    if (opts.invert)
    {
        for (auto& p : points)
            std::swap(p.x, p.y);
    }
    if (opts.rotate_deg != 0.0)
    {
        const double angle = opts.rotate_deg * std::numbers::pi / 180.0;
        const double c     = std::cos(angle);
        const double s     = std::sin(angle);
        for (auto& p : points)
            p = {c * p.x + s * p.y, -s * p.x + c * p.y};
    }

    const char group = opts.group.value_or(DEFAULT_GROUP);
    if (scatter)
        ops_.push_back({group, ScatterOp{std::move(points), style, opts.label, opts.invert}});
    else
        ops_.push_back({group, CurveOp{std::move(points), style, opts.label, opts.invert}});

    PLOTSCOPE_LOG_TRACE("figure", "queued {} for group '{}'", scatter ? "scatter" : "curve", group);
}

// ─── Layout ─────────────────────────────────────────────────────────────────

void FigureContext::check_grid_unset() const
{
    if (grid_ || auto_grid_)
        throw GridAlreadySetError();
}

void FigureContext::set_grid(std::string_view grid_text)
{
    CallGuard guard(*this, "set_grid");
    check_grid_unset();
    grid_ = GridLayoutResolver::resolve(grid_text);
}

void FigureContext::set_grid(const std::vector<std::string>& rows)
{
    CallGuard guard(*this, "set_grid");
    check_grid_unset();
    grid_ = GridLayoutResolver::resolve(rows);
}

void FigureContext::set_auto_grid(std::optional<int> rows, std::optional<int> cols)
{
    CallGuard guard(*this, "set_auto_grid");
    check_grid_unset();
    if ((rows && *rows <= 0) || (cols && *cols <= 0))
        throw InvalidParameterError("auto grid dimensions must be positive");
    auto_grid_ = true;
    auto_rows_ = rows;
    auto_cols_ = cols;
}

GridLayout FigureContext::build_layout() const
{
    if (grid_)
        return *grid_;
    if (!auto_grid_)
        return GridLayout::single_cell();

    std::vector<char> groups;
    bool              has_default = false;
    for (const auto& op : ops_)
    {
        if (!op.is_drawing())
            continue;
        if (*op.target == DEFAULT_GROUP)
            has_default = true;
        else if (std::find(groups.begin(), groups.end(), *op.target) == groups.end())
            groups.push_back(*op.target);
    }
    std::sort(groups.begin(), groups.end());
    if (has_default)
        groups.push_back(DEFAULT_GROUP);
    if (groups.empty())
        return GridLayout::single_cell();

    const int n = static_cast<int>(groups.size());
    int       cols;
    if (auto_cols_)
        cols = *auto_cols_;
    else if (auto_rows_)
        cols = (n + *auto_rows_ - 1) / *auto_rows_;
    else
        cols = optimal_grid_shape(n).second;

    return GridLayoutResolver::resolve(auto_grid_text(groups, cols));
}

// ─── Axis configuration ─────────────────────────────────────────────────────

void FigureContext::push_config(std::optional<char> group, DrawCommand command)
{
    validate_group(group, false);
    ops_.push_back({group, std::move(command)});
}

void FigureContext::title(std::string_view text, std::optional<char> group)
{
    CallGuard guard(*this, "title");
    push_config(group, AxisConfig{{.title = std::string(text)}});
}

void FigureContext::xlabel(std::string_view text, std::optional<char> group)
{
    CallGuard guard(*this, "xlabel");
    push_config(group, AxisConfig{{.xlabel = std::string(text)}});
}

void FigureContext::ylabel(std::string_view text, std::optional<char> group)
{
    CallGuard guard(*this, "ylabel");
    push_config(group, AxisConfig{{.ylabel = std::string(text)}});
}

void FigureContext::xlim(double lo, double hi, std::optional<char> group)
{
    CallGuard guard(*this, "xlim");
    push_config(group, AxisConfig{{.xlim = checked_range("xlim", lo, hi)}});
}

void FigureContext::ylim(double lo, double hi, std::optional<char> group)
{
    CallGuard guard(*this, "ylim");
    push_config(group, AxisConfig{{.ylim = checked_range("ylim", lo, hi)}});
}

void FigureContext::set_range(std::string_view axis, double lo, double hi, std::optional<char> group)
{
    CallGuard         guard(*this, "set_range");
    const std::string name = styles_.canonical(axis);
    if (name == "xlim")
        push_config(group, AxisConfig{{.xlim = checked_range("xlim", lo, hi)}});
    else if (name == "ylim")
        push_config(group, AxisConfig{{.ylim = checked_range("ylim", lo, hi)}});
    else
        throw InvalidParameterError("unknown axis range '" + std::string(axis) + "'");
}

void FigureContext::xscale(ScaleMode mode, std::optional<char> group)
{
    CallGuard guard(*this, "xscale");
    push_config(group, AxisConfig{{.xscale = mode}});
}

void FigureContext::yscale(ScaleMode mode, std::optional<char> group)
{
    CallGuard guard(*this, "yscale");
    push_config(group, AxisConfig{{.yscale = mode}});
}

void FigureContext::equal_aspect(bool enabled, std::optional<char> group)
{
    CallGuard guard(*this, "equal_aspect");
    push_config(group, AxisConfig{{.equal_aspect = enabled}});
}

void FigureContext::legend(bool enabled, std::optional<char> group)
{
    CallGuard guard(*this, "legend");
    push_config(group, LegendOverride{.enabled = enabled});
}

void FigureContext::legend(std::string_view location, std::optional<char> group)
{
    CallGuard guard(*this, "legend");
    if (styles_.canonical(location) == "false")
    {
        push_config(group, LegendOverride{.enabled = false});
        return;
    }
    push_config(group, LegendOverride{.enabled = true, .location = styles_.legend_location(location)});
}

// ─── Replay ─────────────────────────────────────────────────────────────────

std::vector<BackendError> FigureContext::replay(const std::string& save_path)
{
    const GridLayout          layout = build_layout();
    std::vector<BackendError> failures;

    auto attempt = [&failures](const char* operation, auto&& call) -> bool
    {
        try
        {
            call();
            return true;
        }
        catch (const BackendError& e)
        {
            failures.push_back(e);
        }
        catch (const std::exception& e)
        {
            failures.emplace_back(operation, e.what());
        }
        return false;
    };

    AxisSettings base;
    if (!options_.title.empty())
        base.title = options_.title;
    if (!options_.xlabel.empty())
        base.xlabel = options_.xlabel;
    if (!options_.ylabel.empty())
        base.ylabel = options_.ylabel;
    base.xlim = options_.xlim;
    base.ylim = options_.ylim;

    std::vector<CellState> cells(layout.cells().size());
    for (size_t i = 0; i < cells.size(); ++i)
    {
        cells[i].cell            = &layout.cells()[i];
        cells[i].settings        = base;
        cells[i].legend_enabled  = options_.legend;
        cells[i].legend_location = options_.legend_location;
    }

    // Ops for a group missing from the grid land in the default cell, if any
    auto cell_for = [&](char glyph) -> CellState*
    {
        for (auto& cs : cells)
        {
            if (cs.cell->glyph == glyph)
                return &cs;
        }
        for (auto& cs : cells)
        {
            if (cs.cell->glyph == DEFAULT_GROUP)
                return &cs;
        }
        return nullptr;
    };

    std::optional<CanvasHandle> canvas;
    if (!attempt("create_canvas", [&] { canvas = backend_.create_canvas(); }))
        return failures;

    std::map<GridPos, AxesHandle> axes;
    if (attempt("create_axes_grid",
                [&] { axes = backend_.create_axes_grid(*canvas, layout.rows(), layout.cols(), layout.cells()); }))
    {
        for (auto& cs : cells)
        {
            auto it = axes.find(cs.cell->anchor());
            if (it != axes.end())
                cs.axes = it->second;
            else
                failures.emplace_back("create_axes_grid",
                                      std::string("no axes returned for cell '") + cs.cell->glyph + "'");
        }
    }

    size_t drawn = 0;
    for (const auto& op : ops_)
    {
        CellState* target = op.target ? cell_for(*op.target) : nullptr;
        if (op.target && !target)
        {
            PLOTSCOPE_LOG_WARN("figure", "group '{}' has no cell in the grid, op skipped", *op.target);
            continue;
        }

        if (const auto* cfg = std::get_if<AxisConfig>(&op.command))
        {
            for (auto& cs : cells)
            {
                if (!target || &cs == target)
                    cs.settings.merge(cfg->settings);
            }
            continue;
        }
        if (const auto* lg = std::get_if<LegendOverride>(&op.command))
        {
            for (auto& cs : cells)
            {
                if (target && &cs != target)
                    continue;
                if (lg->enabled)
                    cs.legend_enabled = lg->enabled;
                if (lg->location)
                    cs.legend_location = *lg->location;
            }
            continue;
        }

        CellState* cs = target;

        const bool is_scatter = std::holds_alternative<ScatterOp>(op.command);
        const auto& style = is_scatter ? std::get<ScatterOp>(op.command).style
                                       : std::get<CurveOp>(op.command).style;
        const auto& points = is_scatter ? std::get<ScatterOp>(op.command).points
                                        : std::get<CurveOp>(op.command).points;
        const auto& label = is_scatter ? std::get<ScatterOp>(op.command).label
                                       : std::get<CurveOp>(op.command).label;
        const bool inverted = is_scatter ? std::get<ScatterOp>(op.command).inverted
                                         : std::get<CurveOp>(op.command).inverted;

        const ResolvedStyle resolved = styles_.resolve(style, cs->series++);
        if (!label.empty())
            cs->entries.push_back({label, resolved, !is_scatter && style.has_line()});
        cs->inverted = cs->inverted || inverted;

        if (!cs->axes)
            continue;
        if (is_scatter)
            attempt("draw_scatter", [&] { backend_.draw_scatter(*cs->axes, points, resolved); });
        else
            attempt("draw_curve", [&] { backend_.draw_curve(*cs->axes, points, resolved); });
        ++drawn;
    }

    for (auto& cs : cells)
    {
        if (!cs.axes)
            continue;

        AxisSettings settings = cs.settings;
        // Inverted plots put y data on the horizontal axis
        if (cs.inverted)
            std::swap(settings.xlabel, settings.ylabel);
        if (!settings.empty())
            attempt("configure_axes", [&] { backend_.configure_axes(*cs.axes, settings); });

        if (cs.legend_enabled.value_or(true) && !cs.entries.empty())
        {
            attempt("set_legend",
                    [&] { backend_.set_legend(*cs.axes, cs.entries, cs.legend_location); });
        }
    }

    if (!save_path.empty())
        attempt("save", [&] { backend_.save(*canvas, save_path); });
    else
        attempt("render", [&] { backend_.render(*canvas); });
    attempt("release", [&] { backend_.release(*canvas); });

    PLOTSCOPE_LOG_DEBUG("figure",
                        "replayed {} queued op(s), {} drawn on {} cell(s), {} failure(s)",
                        ops_.size(),
                        drawn,
                        cells.size(),
                        failures.size());
    return failures;
}

}   // namespace plotscope
