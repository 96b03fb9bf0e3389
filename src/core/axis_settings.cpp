#include <plotscope/backend.hpp>

namespace plotscope
{

void AxisSettings::merge(const AxisSettings& later)
{
    if (later.title)
        title = later.title;
    if (later.xlabel)
        xlabel = later.xlabel;
    if (later.ylabel)
        ylabel = later.ylabel;
    if (later.xlim)
        xlim = later.xlim;
    if (later.ylim)
        ylim = later.ylim;
    if (later.xscale)
        xscale = later.xscale;
    if (later.yscale)
        yscale = later.yscale;
    if (later.equal_aspect)
        equal_aspect = later.equal_aspect;
}

bool AxisSettings::empty() const
{
    return !title && !xlabel && !ylabel && !xlim && !ylim && !xscale && !yscale && !equal_aspect;
}

}   // namespace plotscope
