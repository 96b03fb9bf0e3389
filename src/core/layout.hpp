#pragma once

#include <plotscope/grid.hpp>
#include <vector>

namespace plotscope
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

// Margins in pixels around each subplot's plot area.
struct Margins
{
    float left   = 60.0f;
    float right  = 40.0f;
    float bottom = 50.0f;
    float top    = 40.0f;
};

// Plot area of one (possibly spanning) cell of a rows x cols grid laid over
// a figure_width x figure_height region starting at (origin_x, origin_y).
// Row 0 is the top row; y grows downward.
Rect compute_cell_rect(float           figure_width,
                       float           figure_height,
                       int             rows,
                       int             cols,
                       const PlotCell& cell,
                       const Margins&  margins  = {},
                       float           origin_x = 0.0f,
                       float           origin_y = 0.0f);

// One Rect per cell of `layout`, in the layout's cell order.
std::vector<Rect> compute_subplot_layout(float             figure_width,
                                         float             figure_height,
                                         const GridLayout& layout,
                                         const Margins&    margins  = {},
                                         float             origin_x = 0.0f,
                                         float             origin_y = 0.0f);

}   // namespace plotscope
