#pragma once

#include <functional>
#include <limits>
#include <plotscope/sample_buffer.hpp>
#include <span>

namespace plotscope
{

using ScalarFunction = std::function<double(double)>;

struct Interval
{
    double lo = 0.0;
    double hi = 1.0;
};

struct SamplingTask
{
    ScalarFunction function;
    Interval       interval;
    double         tolerance = 1e-3;
    int            max_depth = 16;
    double         min_step  = 1e-9;
    // Upper bound on the gap between consecutive samples.
    double max_step = std::numeric_limits<double>::infinity();
};

struct SamplerOptions
{
    // Recursion levels below this depth sample their left half on a worker
    // thread. 0 keeps everything on the calling thread. The sampled function
    // must be safe to call concurrently when this is non-zero.
    int parallel_depth = 0;
};

// Recursive-bisection sampler. Each interval is accepted once the function
// deviates from the chord by at most `tolerance` at the midpoint and at both
// quarter points; accepted intervals contribute {lo, mid, hi} only.
class AdaptiveSampler
{
   public:
    explicit AdaptiveSampler(const SamplerOptions& options = {});

    // Throws InvalidParameterError / InvalidIntervalError before evaluating
    // the function.
    SampleBuffer sample(const SamplingTask& task) const;

    const SamplerOptions& options() const { return options_; }

   private:
    SamplerOptions options_;
};

// Evaluate `f` at explicit abscissae. Non-finite results become events.
// Throws DuplicateXError on repeated x values.
SampleBuffer evaluate_at(const ScalarFunction& f, std::span<const double> xs);

}   // namespace plotscope
