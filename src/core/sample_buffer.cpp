#include <algorithm>
#include <plotscope/errors.hpp>
#include <plotscope/sample_buffer.hpp>
#include <sstream>

namespace plotscope
{

void SampleBuffer::insert(Sample s)
{
    auto it = std::lower_bound(samples_.begin(),
                               samples_.end(),
                               s.x,
                               [](const Sample& a, double x) { return a.x < x; });
    if (it != samples_.end() && it->x == s.x)
    {
        throw DuplicateXError(s.x);
    }
    samples_.insert(it, s);
}

void SampleBuffer::merge(const SampleBuffer& other)
{
    SampleBuffer copy(other);
    merge(std::move(copy));
}

void SampleBuffer::merge(SampleBuffer&& other)
{
    auto take_events = [&]()
    { events_.insert(events_.end(), other.events_.begin(), other.events_.end()); };

    if (other.samples_.empty())
    {
        take_events();
        return;
    }
    if (samples_.empty())
    {
        samples_ = std::move(other.samples_);
        take_events();
        return;
    }

    const double lo       = samples_.front().x;
    const double hi       = samples_.back().x;
    const double other_lo = other.samples_.front().x;
    const double other_hi = other.samples_.back().x;

    if (other_lo >= hi)
    {
        // Other lies to the right; skip the shared boundary point if any
        auto first = other.samples_.begin();
        if (other_lo == hi)
            ++first;
        samples_.insert(samples_.end(), first, other.samples_.end());
        take_events();
        return;
    }
    if (other_hi <= lo)
    {
        auto last = other.samples_.end();
        if (other_hi == lo)
            --last;
        samples_.insert(samples_.begin(), other.samples_.begin(), last);
        take_events();
        return;
    }

    std::ostringstream ss;
    ss << "cannot merge sample ranges [" << lo << ", " << hi << "] and [" << other_lo << ", "
       << other_hi << "]: they overlap";
    throw OverlapError(ss.str());
}

std::vector<std::pair<double, double>> SampleBuffer::to_series() const
{
    std::vector<std::pair<double, double>> out;
    out.reserve(samples_.size());
    for (const auto& s : samples_)
        out.emplace_back(s.x, s.y);
    return out;
}

}   // namespace plotscope
