#include <gtest/gtest.h>
#include <plotscope/errors.hpp>
#include <plotscope/grid.hpp>

using namespace plotscope;

// ═══════════════════════════════════════════════════════════════════════════════
// Valid grids
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GridLayoutResolverTest, SpanningCells)
{
    auto g = GridLayoutResolver::resolve("AAB\nAAB\nCCB");

    EXPECT_EQ(g.rows(), 3);
    EXPECT_EQ(g.cols(), 3);
    ASSERT_EQ(g.cells().size(), 3u);

    EXPECT_EQ(g.cells()[0], (PlotCell{'A', 0, 0, 2, 2}));
    EXPECT_EQ(g.cells()[1], (PlotCell{'B', 0, 2, 3, 1}));
    EXPECT_EQ(g.cells()[2], (PlotCell{'C', 2, 0, 1, 2}));
}

TEST(GridLayoutResolverTest, CellsInFirstAppearanceOrder)
{
    auto g = GridLayoutResolver::resolve(std::vector<std::string>{"AAA", "BBC", "DEC"});

    ASSERT_EQ(g.cells().size(), 5u);
    EXPECT_EQ(g.cells()[0], (PlotCell{'A', 0, 0, 1, 3}));
    EXPECT_EQ(g.cells()[1], (PlotCell{'B', 1, 0, 1, 2}));
    EXPECT_EQ(g.cells()[2], (PlotCell{'C', 1, 2, 2, 1}));
    EXPECT_EQ(g.cells()[3], (PlotCell{'D', 2, 0, 1, 1}));
    EXPECT_EQ(g.cells()[4], (PlotCell{'E', 2, 1, 1, 1}));
}

TEST(GridLayoutResolverTest, SingleGlyph)
{
    auto g = GridLayoutResolver::resolve("x");
    EXPECT_EQ(g.rows(), 1);
    EXPECT_EQ(g.cols(), 1);
    ASSERT_EQ(g.cells().size(), 1u);
    EXPECT_EQ(g.cells()[0].glyph, 'x');
}

TEST(GridLayoutResolverTest, TrailingNewlineAndCarriageReturns)
{
    auto unix_text = GridLayoutResolver::resolve("AB\nCD\n");
    auto dos_text  = GridLayoutResolver::resolve("AB\r\nCD\r\n");

    EXPECT_EQ(unix_text.rows(), 2);
    EXPECT_EQ(dos_text.rows(), 2);
    EXPECT_EQ(dos_text.cols(), 2);
    EXPECT_EQ(unix_text.cells(), dos_text.cells());
}

TEST(GridLayoutResolverTest, FindByGlyph)
{
    auto g = GridLayoutResolver::resolve("AB");

    ASSERT_NE(g.find('B'), nullptr);
    EXPECT_EQ(g.find('B')->col, 1);
    EXPECT_TRUE(g.contains('A'));
    EXPECT_FALSE(g.contains('Z'));
}

TEST(GridLayoutResolverTest, SingleCellLayoutHoldsDefaultGroup)
{
    auto g = GridLayout::single_cell();
    EXPECT_EQ(g.rows(), 1);
    EXPECT_EQ(g.cols(), 1);
    ASSERT_EQ(g.cells().size(), 1u);
    EXPECT_EQ(g.cells()[0].glyph, DEFAULT_GROUP);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Irregular areas
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GridLayoutResolverErrorTest, NonRectangularArea)
{
    try
    {
        GridLayoutResolver::resolve("AAB\nBAA");
        FAIL() << "expected IrregularGridError";
    }
    catch (const IrregularGridError& e)
    {
        EXPECT_EQ(e.glyph(), 'A');
        EXPECT_EQ(e.row(), 0);
        EXPECT_EQ(e.col(), 2);
    }
}

TEST(GridLayoutResolverErrorTest, SplitArea)
{
    try
    {
        GridLayoutResolver::resolve("ABA");
        FAIL() << "expected IrregularGridError";
    }
    catch (const IrregularGridError& e)
    {
        EXPECT_EQ(e.glyph(), 'A');
        EXPECT_EQ(e.row(), 0);
        EXPECT_EQ(e.col(), 1);
    }
}

TEST(GridLayoutResolverErrorTest, BlankInsideArea)
{
    EXPECT_THROW(GridLayoutResolver::resolve("AAA\nA A\nAAA"), IrregularGridError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Coverage
// ═══════════════════════════════════════════════════════════════════════════════

TEST(GridLayoutResolverErrorTest, RaggedRows)
{
    EXPECT_THROW(GridLayoutResolver::resolve("AB\nC"), GridCoverageError);
    EXPECT_THROW(GridLayoutResolver::resolve("A\nBC"), GridCoverageError);
}

TEST(GridLayoutResolverErrorTest, BlankPosition)
{
    EXPECT_THROW(GridLayoutResolver::resolve("AB\nA "), GridCoverageError);
}

TEST(GridLayoutResolverErrorTest, EmptyRow)
{
    EXPECT_THROW(GridLayoutResolver::resolve("\nAB"), GridCoverageError);
    EXPECT_THROW(GridLayoutResolver::resolve(std::vector<std::string>{"AB", ""}), GridCoverageError);
}

TEST(GridLayoutResolverErrorTest, EmptyText)
{
    EXPECT_THROW(GridLayoutResolver::resolve(""), InvalidParameterError);
    EXPECT_THROW(GridLayoutResolver::resolve("\n"), InvalidParameterError);
    EXPECT_THROW(GridLayoutResolver::resolve(std::vector<std::string>{}), InvalidParameterError);
}

TEST(GridLayoutResolverErrorTest, NonAsciiGlyphsAreRejected)
{
    // "\xce\xb1" and "\xce\xb2" are the UTF-8 encodings of alpha and beta
    EXPECT_THROW(GridLayoutResolver::resolve("\xce\xb1\xce\xb1\n\xce\xb2\xce\xb2"), InvalidParameterError);
    EXPECT_THROW(GridLayoutResolver::resolve(std::vector<std::string>{"A\xce\xb1", "A\xce\xb1"}),
                 InvalidParameterError);
    EXPECT_THROW(GridLayoutResolver::resolve("A\xe9"), InvalidParameterError);
}

TEST(GridLayoutResolverErrorTest, AllErrorsArePlotErrors)
{
    EXPECT_THROW(GridLayoutResolver::resolve("ABA"), PlotError);
    EXPECT_THROW(GridLayoutResolver::resolve("AB\nC"), PlotError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Automatic shapes
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OptimalGridShapeTest, SmallCounts)
{
    EXPECT_EQ(optimal_grid_shape(1), std::make_pair(1, 1));
    EXPECT_EQ(optimal_grid_shape(2), std::make_pair(1, 2));
    EXPECT_EQ(optimal_grid_shape(3), std::make_pair(1, 3));
    EXPECT_EQ(optimal_grid_shape(4), std::make_pair(2, 2));
    EXPECT_EQ(optimal_grid_shape(5), std::make_pair(2, 3));
    EXPECT_EQ(optimal_grid_shape(6), std::make_pair(2, 3));
    EXPECT_EQ(optimal_grid_shape(7), std::make_pair(2, 4));
    EXPECT_EQ(optimal_grid_shape(9), std::make_pair(3, 3));
}

TEST(OptimalGridShapeTest, AlwaysHoldsEveryCell)
{
    for (int n = 1; n <= 50; ++n)
    {
        auto [rows, cols] = optimal_grid_shape(n);
        EXPECT_GE(rows * cols, n) << "n=" << n;
        EXPECT_LT((rows - 1) * cols, n) << "n=" << n;
    }
}

TEST(OptimalGridShapeTest, RejectsNonPositive)
{
    EXPECT_THROW(optimal_grid_shape(0), InvalidParameterError);
    EXPECT_THROW(optimal_grid_shape(-3), InvalidParameterError);
}

TEST(AutoGridTextTest, PadsLastRowWithItsFinalGlyph)
{
    EXPECT_EQ(auto_grid_text({'A', 'B', 'C'}, 2), "AB\nCC");
    EXPECT_EQ(auto_grid_text({'A', 'B', 'C', 'D', 'E'}, 3), "ABC\nDEE");
    EXPECT_EQ(auto_grid_text({'A', 'B'}, 2), "AB");
    EXPECT_EQ(auto_grid_text({'A', 'B'}, 1), "A\nB");
}

TEST(AutoGridTextTest, ResultAlwaysResolves)
{
    const std::vector<char> glyphs = {'a', 'b', 'c', 'd', 'e', 'f', 'g'};
    for (int cols = 1; cols <= 8; ++cols)
    {
        auto g = GridLayoutResolver::resolve(auto_grid_text(glyphs, cols));
        EXPECT_EQ(g.cells().size(), glyphs.size()) << "cols=" << cols;
    }
}

TEST(AutoGridTextTest, RejectsBadInput)
{
    EXPECT_THROW(auto_grid_text({}, 2), InvalidParameterError);
    EXPECT_THROW(auto_grid_text({'A'}, 0), InvalidParameterError);
}
