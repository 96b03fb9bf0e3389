#pragma once

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace plotscope
{

struct Sample
{
    double x = 0.0;
    double y = 0.0;
};

// Warning-level report of a function evaluation that produced NaN or
// infinity. The point is kept out of the series.
struct SamplingEvent
{
    double x     = 0.0;
    double y     = 0.0;
    int    depth = 0;
};

// Samples of one curve, strictly increasing in x.
class SampleBuffer
{
   public:
    SampleBuffer() = default;

    // Throws DuplicateXError if a sample with the same x is present.
    void insert(Sample s);

    // Stitches a buffer covering a disjoint or adjacent x range. A boundary
    // point present in both buffers is kept once (this buffer's copy).
    // Throws OverlapError if the ranges share more than that point.
    void merge(const SampleBuffer& other);
    void merge(SampleBuffer&& other);

    std::vector<std::pair<double, double>> to_series() const;

    std::span<const Sample> samples() const { return samples_; }
    size_t                  size() const { return samples_.size(); }
    bool                    empty() const { return samples_.empty(); }
    const Sample&           front() const { return samples_.front(); }
    const Sample&           back() const { return samples_.back(); }

    void record_event(const SamplingEvent& e) { events_.push_back(e); }
    const std::vector<SamplingEvent>& events() const { return events_; }
    bool has_discontinuities() const { return !events_.empty(); }

   private:
    std::vector<Sample>        samples_;
    std::vector<SamplingEvent> events_;
};

}   // namespace plotscope
