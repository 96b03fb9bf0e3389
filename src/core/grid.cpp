#include <algorithm>
#include <cctype>
#include <cmath>
#include <plotscope/errors.hpp>
#include <plotscope/grid.hpp>
#include <plotscope/logger.hpp>
#include <sstream>

namespace plotscope
{

namespace
{

bool is_blank(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

struct Bounds
{
    int min_row;
    int max_row;
    int min_col;
    int max_col;
};

}   // anonymous namespace

GridLayout::GridLayout(int rows, int cols, std::vector<PlotCell> cells)
    : rows_(rows), cols_(cols), cells_(std::move(cells))
{
}

GridLayout GridLayout::single_cell()
{
    return GridLayout(1, 1, {PlotCell{}});
}

const PlotCell* GridLayout::find(char glyph) const
{
    auto it = std::find_if(cells_.begin(),
                           cells_.end(),
                           [glyph](const PlotCell& c) { return c.glyph == glyph; });
    return it != cells_.end() ? &*it : nullptr;
}

GridLayout GridLayoutResolver::resolve(std::string_view grid_text)
{
    if (!grid_text.empty() && grid_text.back() == '\n')
        grid_text.remove_suffix(1);
    if (!grid_text.empty() && grid_text.back() == '\r')
        grid_text.remove_suffix(1);
    if (grid_text.empty())
        throw InvalidParameterError("grid text is empty");

    std::vector<std::string> rows;
    size_t                   start = 0;
    while (true)
    {
        size_t           end  = grid_text.find('\n', start);
        std::string_view line = grid_text.substr(start, end == std::string_view::npos
                                                            ? std::string_view::npos
                                                            : end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        rows.emplace_back(line);
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return resolve(rows);
}

GridLayout GridLayoutResolver::resolve(const std::vector<std::string>& rows)
{
    if (rows.empty())
        throw InvalidParameterError("grid text is empty");

    // Glyphs are single bytes; a multi-byte UTF-8 character would split into
    // several bogus glyphs
    for (size_t r = 0; r < rows.size(); ++r)
    {
        for (size_t c = 0; c < rows[r].size(); ++c)
        {
            if (static_cast<unsigned char>(rows[r][c]) >= 0x80)
            {
                std::ostringstream ss;
                ss << "grid glyphs must be ASCII characters, found byte 0x" << std::hex
                   << static_cast<int>(static_cast<unsigned char>(rows[r][c])) << std::dec << " in row " << r;
                throw InvalidParameterError(ss.str());
            }
        }
    }

    const int n_rows = static_cast<int>(rows.size());
    const int n_cols = static_cast<int>(rows.front().size());
    if (n_cols == 0)
        throw GridCoverageError("grid row 0 is empty");

    for (int r = 1; r < n_rows; ++r)
    {
        if (static_cast<int>(rows[r].size()) != n_cols)
        {
            std::ostringstream ss;
            ss << "grid row " << r << " has " << rows[r].size() << " cells, expected " << n_cols;
            throw GridCoverageError(ss.str());
        }
    }

    // Bounding box per glyph, in order of first appearance
    std::vector<char>   order;
    std::vector<Bounds> bounds;
    for (int r = 0; r < n_rows; ++r)
    {
        for (int c = 0; c < n_cols; ++c)
        {
            const char g = rows[r][c];
            if (is_blank(g))
                continue;
            auto it = std::find(order.begin(), order.end(), g);
            if (it == order.end())
            {
                order.push_back(g);
                bounds.push_back({r, r, c, c});
                continue;
            }
            Bounds& b = bounds[static_cast<size_t>(it - order.begin())];
            b.min_row = std::min(b.min_row, r);
            b.max_row = std::max(b.max_row, r);
            b.min_col = std::min(b.min_col, c);
            b.max_col = std::max(b.max_col, c);
        }
    }

    std::vector<PlotCell> cells;
    cells.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i)
    {
        const char    g = order[i];
        const Bounds& b = bounds[i];
        for (int r = b.min_row; r <= b.max_row; ++r)
        {
            for (int c = b.min_col; c <= b.max_col; ++c)
            {
                if (rows[r][c] != g)
                    throw IrregularGridError(g, r, c);
            }
        }
        cells.push_back({.glyph    = g,
                         .row      = b.min_row,
                         .col      = b.min_col,
                         .row_span = b.max_row - b.min_row + 1,
                         .col_span = b.max_col - b.min_col + 1});
    }

    // Rectangles are disjoint by now, so any gap is a blank position
    for (int r = 0; r < n_rows; ++r)
    {
        for (int c = 0; c < n_cols; ++c)
        {
            if (is_blank(rows[r][c]))
            {
                std::ostringstream ss;
                ss << "grid cell (" << r << ", " << c << ") is not covered by any plot";
                throw GridCoverageError(ss.str());
            }
        }
    }

    PLOTSCOPE_LOG_DEBUG("grid", "resolved {}x{} grid with {} cells", n_rows, n_cols, cells.size());
    return GridLayout(n_rows, n_cols, std::move(cells));
}

std::pair<int, int> optimal_grid_shape(int n)
{
    if (n <= 0)
        throw InvalidParameterError("grid needs at least one cell, got " + std::to_string(n));

    const double root = std::sqrt(static_cast<double>(n));

    const int rows1 = static_cast<int>(std::floor(root));
    const int cols1 = (n + rows1 - 1) / rows1;

    const int cols2 = static_cast<int>(std::ceil(root));
    const int rows2 = (n + cols2 - 1) / cols2;

    if (rows1 * cols1 < rows2 * cols2)
        return {rows1, cols1};
    return {rows2, cols2};
}

std::string auto_grid_text(const std::vector<char>& glyphs, int cols)
{
    if (glyphs.empty())
        throw InvalidParameterError("auto grid needs at least one glyph");
    if (cols <= 0)
        throw InvalidParameterError("auto grid needs a positive column count");

    std::string text;
    const size_t width = static_cast<size_t>(cols);
    for (size_t i = 0; i < glyphs.size(); i += width)
    {
        if (i > 0)
            text += '\n';
        const size_t end = std::min(glyphs.size(), i + width);
        text.append(glyphs.begin() + static_cast<std::ptrdiff_t>(i),
                    glyphs.begin() + static_cast<std::ptrdiff_t>(end));
        text.append(i + width - end, glyphs[end - 1]);
    }
    return text;
}

}   // namespace plotscope
