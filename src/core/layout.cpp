#include "layout.hpp"

#include <algorithm>

namespace plotscope
{

Rect compute_cell_rect(float           figure_width,
                       float           figure_height,
                       int             rows,
                       int             cols,
                       const PlotCell& cell,
                       const Margins&  margins,
                       float           origin_x,
                       float           origin_y)
{
    // Each grid slot gets an equal share; a spanning cell covers several
    // slots and the margins are applied once, inside the whole span.
    float slot_width  = figure_width / static_cast<float>(cols);
    float slot_height = figure_height / static_cast<float>(rows);

    float cell_x = static_cast<float>(cell.col) * slot_width;
    float cell_y = static_cast<float>(cell.row) * slot_height;
    float cell_w = static_cast<float>(cell.col_span) * slot_width;
    float cell_h = static_cast<float>(cell.row_span) * slot_height;

    Rect plot_area;
    plot_area.x = origin_x + cell_x + margins.left;
    plot_area.y = origin_y + cell_y + margins.top;
    plot_area.w = std::max(0.0f, cell_w - margins.left - margins.right);
    plot_area.h = std::max(0.0f, cell_h - margins.top - margins.bottom);
    return plot_area;
}

std::vector<Rect> compute_subplot_layout(float             figure_width,
                                         float             figure_height,
                                         const GridLayout& layout,
                                         const Margins&    margins,
                                         float             origin_x,
                                         float             origin_y)
{
    std::vector<Rect> rects;
    rects.reserve(layout.cells().size());
    for (const auto& cell : layout.cells())
    {
        rects.push_back(compute_cell_rect(figure_width,
                                          figure_height,
                                          layout.rows(),
                                          layout.cols(),
                                          cell,
                                          margins,
                                          origin_x,
                                          origin_y));
    }
    return rects;
}

}   // namespace plotscope
