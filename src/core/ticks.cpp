#include "ticks.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace plotscope
{

double nice_ceil(double x, bool round_flag)
{
    double exp_v = std::floor(std::log10(x));
    double frac  = x / std::pow(10.0, exp_v);
    double nice;
    if (round_flag)
    {
        if (frac < 1.5)
            nice = 1.0;
        else if (frac < 3.0)
            nice = 2.0;
        else if (frac < 7.0)
            nice = 5.0;
        else
            nice = 10.0;
    }
    else
    {
        if (frac <= 1.0)
            nice = 1.0;
        else if (frac <= 2.0)
            nice = 2.0;
        else if (frac <= 5.0)
            nice = 5.0;
        else
            nice = 10.0;
    }
    return nice * std::pow(10.0, exp_v);
}

std::string format_tick_value(double value, double spacing)
{
    char buf[64];

    if (std::abs(value) < spacing * 1e-6)
        return "0";

    const double abs_val     = std::abs(value);
    const double abs_spacing = std::abs(spacing);

    int decimals = 0;
    if (abs_spacing > 0 && std::isfinite(abs_spacing))
        decimals = std::max(0, static_cast<int>(std::ceil(-std::log10(abs_spacing))));

    if (decimals <= 9 && abs_val < 1e9 && abs_val >= 0.001)
    {
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
        std::string str(buf);
        if (str.find('.') != std::string::npos)
        {
            while (str.back() == '0')
                str.pop_back();
            if (str.back() == '.')
                str.pop_back();
        }
        return str;
    }

    int sig_digits = 6;
    if (abs_val > 0 && abs_spacing > 0)
        sig_digits = std::clamp(static_cast<int>(std::ceil(std::log10(abs_val / abs_spacing))) + 1, 1, 15);
    std::snprintf(buf, sizeof(buf), "%.*e", sig_digits - 1, value);
    return std::string(buf);
}

TickResult generate_ticks(double dmin, double dmax, int target_ticks)
{
    TickResult result;
    double     range = dmax - dmin;

    if (range <= 0.0)
    {
        if (range == 0.0 && dmin != 0.0)
        {
            double half = std::abs(dmin) * 0.1;
            return generate_ticks(dmin - half, dmin + half, target_ticks);
        }
        result.positions.push_back(dmin);
        result.labels.push_back(format_tick_value(dmin, 1.0));
        return result;
    }

    // Below this the values themselves are indistinguishable as doubles
    double abs_max   = std::max(std::abs(dmin), std::abs(dmax));
    double min_range = std::max(abs_max * std::numeric_limits<double>::epsilon() * 16.0, 1e-300);
    if (range < min_range)
    {
        double mid = (dmin + dmax) * 0.5;
        result.positions.push_back(mid);
        result.labels.push_back(format_tick_value(mid, range));
        return result;
    }

    double nice_range = nice_ceil(range, false);
    double spacing    = nice_ceil(nice_range / static_cast<double>(std::max(target_ticks - 1, 1)), true);
    if (spacing <= 0.0 || !std::isfinite(spacing))
    {
        result.positions.push_back(dmin);
        result.labels.push_back(format_tick_value(dmin, range));
        return result;
    }

    double nice_min = std::floor(dmin / spacing) * spacing;
    double nice_max = std::ceil(dmax / spacing) * spacing;

    int max_iters = target_ticks * 3;
    int iters     = 0;
    for (double v = nice_min; v <= nice_max + spacing * 0.5 && iters < max_iters;
         v += spacing, ++iters)
    {
        if (v >= dmin - spacing * 0.01 && v <= dmax + spacing * 0.01)
        {
            // Avoid "-0" labels
            if (std::abs(v) < spacing * 1e-6)
                v = 0.0;
            result.positions.push_back(v);
            result.labels.push_back(format_tick_value(v, spacing));
        }
    }
    return result;
}

TickResult generate_log_ticks(double dmin, double dmax)
{
    if (!(dmin > 0.0) || !(dmax > dmin))
        return generate_ticks(dmin, dmax);

    const int first = static_cast<int>(std::ceil(std::log10(dmin) - 1e-9));
    const int last  = static_cast<int>(std::floor(std::log10(dmax) + 1e-9));
    if (last - first < 1)
        return generate_ticks(dmin, dmax);

    // Keep the label count readable on very wide ranges
    const int step = std::max(1, (last - first + 1) / 8);

    TickResult result;
    char       buf[32];
    for (int k = first; k <= last; k += step)
    {
        result.positions.push_back(std::pow(10.0, k));
        std::snprintf(buf, sizeof(buf), "1e%d", k);
        result.labels.emplace_back(buf);
    }
    return result;
}

}   // namespace plotscope
