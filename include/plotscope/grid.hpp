#pragma once

#include <compare>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plotscope
{

// Glyph reserved for plots issued without an explicit group.
inline constexpr char DEFAULT_GROUP = '_';

struct GridPos
{
    int row = 0;
    int col = 0;

    auto operator<=>(const GridPos&) const = default;
};

// One subplot: the glyph naming it, its top-left position and its span.
struct PlotCell
{
    char glyph    = DEFAULT_GROUP;
    int  row      = 0;
    int  col      = 0;
    int  row_span = 1;
    int  col_span = 1;

    GridPos anchor() const { return {row, col}; }
    bool    operator==(const PlotCell&) const = default;
};

class GridLayout
{
   public:
    GridLayout() = default;
    GridLayout(int rows, int cols, std::vector<PlotCell> cells);

    // 1x1 layout holding the default group.
    static GridLayout single_cell();

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    // Cells in order of first appearance (row-major scan).
    const std::vector<PlotCell>& cells() const { return cells_; }

    const PlotCell* find(char glyph) const;
    bool            contains(char glyph) const { return find(glyph) != nullptr; }

   private:
    int                   rows_ = 1;
    int                   cols_ = 1;
    std::vector<PlotCell> cells_;
};

// Parses ASCII-art subplot descriptions such as
//
//   "AAB\n"
//   "AAB\n"
//   "CCB"
//
// where every glyph is one printable ASCII character, must cover one filled
// rectangle, and the rectangles must tile the whole matrix.
class GridLayoutResolver
{
   public:
    // Throws InvalidParameterError (empty text, non-ASCII glyph),
    // IrregularGridError or GridCoverageError.
    static GridLayout resolve(std::string_view grid_text);
    static GridLayout resolve(const std::vector<std::string>& rows);
};

// (rows, cols) with the smallest area that holds n cells. Candidates are
// floor(sqrt(n)) rows or ceil(sqrt(n)) columns; ties go to the latter.
std::pair<int, int> optimal_grid_shape(int n);

// Lays `glyphs` out row-major, `cols` per row, as grid text; the last row is
// padded by repeating its final glyph so the result always resolves.
std::string auto_grid_text(const std::vector<char>& glyphs, int cols);

}   // namespace plotscope
