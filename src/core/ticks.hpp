#pragma once

#include <string>
#include <vector>

namespace plotscope
{

struct TickResult
{
    std::vector<double>      positions;
    std::vector<std::string> labels;
};

// Round `x` up to 1, 2, 5 or 10 times a power of ten. With `round_flag` the
// nearest of those is picked instead.
double nice_ceil(double x, bool round_flag);

// Enough decimals to tell neighbouring ticks `spacing` apart; scientific
// notation for very large or very small magnitudes.
std::string format_tick_value(double value, double spacing);

// Roughly `target_ticks` evenly spaced ticks on a 1-2-5 grid inside
// [dmin, dmax].
TickResult generate_ticks(double dmin, double dmax, int target_ticks = 7);

// Decade ticks for a log axis. Both bounds must be positive; narrow ranges
// (less than one decade) fall back to linear ticks.
TickResult generate_log_ticks(double dmin, double dmax);

}   // namespace plotscope
