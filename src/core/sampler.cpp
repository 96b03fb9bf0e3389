#include <algorithm>
#include <cmath>
#include <future>
#include <plotscope/errors.hpp>
#include <plotscope/logger.hpp>
#include <plotscope/sampler.hpp>
#include <string>

namespace plotscope
{

namespace
{

// Deepest recursion a task may request. 2^64 sub-intervals is far past the
// resolution of a double, so deeper limits would only hide mistakes.
constexpr int MAX_SUPPORTED_DEPTH = 64;

struct Point
{
    double x;
    double y;

    bool finite() const { return std::isfinite(y); }
};

// Safe for bounds whose difference exceeds the double range.
double midpoint(double a, double b)
{
    return 0.5 * a + 0.5 * b;
}

double chord_error(const Point& lo, const Point& mid, const Point& hi)
{
    return std::abs(mid.y - 0.5 * (lo.y + hi.y));
}

void validate(const SamplingTask& task)
{
    if (!task.function)
        throw InvalidParameterError("sampling task has no function");
    if (!(task.tolerance > 0.0))
        throw InvalidParameterError("tolerance must be positive, got " + std::to_string(task.tolerance));
    if (task.max_depth < 0 || task.max_depth > MAX_SUPPORTED_DEPTH)
        throw InvalidParameterError("max_depth must be in [0, " + std::to_string(MAX_SUPPORTED_DEPTH)
                                    + "], got " + std::to_string(task.max_depth));
    if (!(task.min_step >= 0.0))
        throw InvalidParameterError("min_step must be non-negative");
    if (!(task.max_step > 0.0))
        throw InvalidParameterError("max_step must be positive");

    const double lo = task.interval.lo;
    const double hi = task.interval.hi;
    if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi))
        throw InvalidIntervalError(lo, hi);
}

class Bisection
{
   public:
    Bisection(const SamplingTask& task, int parallel_depth)
        : task_(task), parallel_depth_(parallel_depth)
    {
    }

    SampleBuffer run() const
    {
        const double lo = task_.interval.lo;
        const double hi = task_.interval.hi;

        SampleBuffer out;
        Point        p_lo  = evaluate(lo, 0, out);
        Point        p_hi  = evaluate(hi, 0, out);
        Point        p_mid = evaluate(midpoint(lo, hi), 0, out);
        out.merge(refine(p_lo, p_mid, p_hi, 0, false));
        return out;
    }

   private:
    Point evaluate(double x, int depth, SampleBuffer& sink) const
    {
        Point p{x, task_.function(x)};
        if (!p.finite())
            sink.record_event({.x = x, .y = p.y, .depth = depth});
        return p;
    }

    static SampleBuffer accept(const Point& lo, const Point& mid, const Point& hi, SampleBuffer out)
    {
        for (const Point* p : {&lo, &mid, &hi})
        {
            if (!p->finite())
                continue;
            if (!out.empty() && out.back().x == p->x)
                continue;
            out.insert({p->x, p->y});
        }
        return out;
    }

    SampleBuffer refine(Point lo, Point mid, Point hi, int depth, bool near_singularity) const
    {
        SampleBuffer out;
        const double width = hi.x - lo.x;   // +inf when the bounds span more than the double range

        if (depth >= task_.max_depth || width <= task_.min_step || !(lo.x < mid.x && mid.x < hi.x))
            return accept(lo, mid, hi, std::move(out));

        const bool endpoints_finite = lo.finite() && mid.finite() && hi.finite();
        if (!endpoints_finite && near_singularity)
            return accept(lo, mid, hi, std::move(out));

        Point q1 = evaluate(midpoint(lo.x, mid.x), depth + 1, out);
        Point q3 = evaluate(midpoint(mid.x, hi.x), depth + 1, out);

        if (!endpoints_finite || !q1.finite() || !q3.finite())
        {
            // One extra level to narrow down the discontinuity, no more
            if (near_singularity)
                return accept(lo, mid, hi, std::move(out));
            return split(lo, q1, mid, q3, hi, depth, true, std::move(out));
        }

        const double error =
            std::max({chord_error(lo, mid, hi), chord_error(lo, q1, mid), chord_error(mid, q3, hi)});
        const bool too_coarse = 0.5 * width > task_.max_step;

        if (error <= task_.tolerance && !too_coarse)
            return accept(lo, mid, hi, std::move(out));

        return split(lo, q1, mid, q3, hi, depth, false, std::move(out));
    }

    SampleBuffer split(const Point& lo,
                       const Point& q1,
                       const Point& mid,
                       const Point& q3,
                       const Point& hi,
                       int depth,
                       bool near_singularity,
                       SampleBuffer out) const
    {
        SampleBuffer left;
        SampleBuffer right;

        if (depth < parallel_depth_)
        {
            auto pending = std::async(std::launch::async,
                                      [&]() { return refine(lo, q1, mid, depth + 1, near_singularity); });
            right = refine(mid, q3, hi, depth + 1, near_singularity);
            left  = pending.get();
        }
        else
        {
            left  = refine(lo, q1, mid, depth + 1, near_singularity);
            right = refine(mid, q3, hi, depth + 1, near_singularity);
        }

        out.merge(std::move(left));
        out.merge(std::move(right));
        return out;
    }

    const SamplingTask& task_;
    int                 parallel_depth_;
};

}   // anonymous namespace

AdaptiveSampler::AdaptiveSampler(const SamplerOptions& options) : options_(options)
{
    if (options_.parallel_depth < 0)
        throw InvalidParameterError("parallel_depth must be non-negative");
}

SampleBuffer AdaptiveSampler::sample(const SamplingTask& task) const
{
    validate(task);

    SampleBuffer result = Bisection(task, options_.parallel_depth).run();

    PLOTSCOPE_LOG_DEBUG("sampler",
                        "sampled [{}, {}] into {} points",
                        task.interval.lo,
                        task.interval.hi,
                        result.size());
    if (result.has_discontinuities())
    {
        PLOTSCOPE_LOG_WARN("sampler",
                           "{} non-finite evaluation(s) in [{}, {}], first at x={}",
                           result.events().size(),
                           task.interval.lo,
                           task.interval.hi,
                           result.events().front().x);
    }
    return result;
}

SampleBuffer evaluate_at(const ScalarFunction& f, std::span<const double> xs)
{
    if (!f)
        throw InvalidParameterError("no function to evaluate");

    SampleBuffer out;
    for (double x : xs)
    {
        if (!std::isfinite(x))
            throw InvalidParameterError("evaluation points must be finite");
        const double y = f(x);
        if (std::isfinite(y))
            out.insert({x, y});
        else
            out.record_event({.x = x, .y = y, .depth = 0});
    }
    if (out.has_discontinuities())
    {
        PLOTSCOPE_LOG_WARN("sampler",
                           "{} of {} evaluation point(s) produced non-finite values",
                           out.events().size(),
                           xs.size());
    }
    return out;
}

}   // namespace plotscope
