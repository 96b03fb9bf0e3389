#include <cmath>
#include <gtest/gtest.h>
#include <plotscope/errors.hpp>
#include <plotscope/plot_style.hpp>

using namespace plotscope;

// ─── Helper: compare colors with tolerance ───────────────────────────────────

static bool color_eq(const Color& a, const Color& b, float eps = 0.01f)
{
    return std::abs(a.r - b.r) < eps && std::abs(a.g - b.g) < eps && std::abs(a.b - b.b) < eps
           && std::abs(a.a - b.a) < eps;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Symbols
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LineStyleTest, Symbols)
{
    EXPECT_STREQ(line_style_symbol(LineStyle::None), "");
    EXPECT_STREQ(line_style_symbol(LineStyle::Solid), "-");
    EXPECT_STREQ(line_style_symbol(LineStyle::Dashed), "--");
    EXPECT_STREQ(line_style_symbol(LineStyle::Dotted), ":");
    EXPECT_STREQ(line_style_symbol(LineStyle::DashDot), "-.");
}

TEST(MarkerStyleTest, Symbols)
{
    EXPECT_EQ(marker_style_symbol(MarkerStyle::None), '\0');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::Point), '.');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::Circle), 'o');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::Plus), '+');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::Cross), 'x');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::Star), '*');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::Square), 's');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::Diamond), 'd');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::TriangleUp), '^');
    EXPECT_EQ(marker_style_symbol(MarkerStyle::TriangleDown), 'v');
}

TEST(PlotStyleTest, Defaults)
{
    PlotStyle ps;
    EXPECT_EQ(ps.line_style, LineStyle::Solid);
    EXPECT_EQ(ps.marker_style, MarkerStyle::None);
    EXPECT_FALSE(ps.color.has_value());
    EXPECT_FALSE(ps.line_width.has_value());
    EXPECT_FLOAT_EQ(ps.opacity, 1.0f);
    EXPECT_TRUE(ps.has_line());
    EXPECT_FALSE(ps.has_marker());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Dash Patterns
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DashPatternTest, SolidAndNoneHaveNoPattern)
{
    EXPECT_EQ(dash_pattern(LineStyle::Solid, 2.0f).count, 0);
    EXPECT_EQ(dash_pattern(LineStyle::None, 2.0f).count, 0);
}

TEST(DashPatternTest, DashedPattern)
{
    auto dp = dash_pattern(LineStyle::Dashed, 1.0f);
    EXPECT_EQ(dp.count, 2);
    EXPECT_GT(dp.segments[0], dp.segments[1]);
}

TEST(DashPatternTest, DashDotPattern)
{
    auto dp = dash_pattern(LineStyle::DashDot, 1.0f);
    EXPECT_EQ(dp.count, 4);
}

TEST(DashPatternTest, ScalesWithLineWidth)
{
    auto thin  = dash_pattern(LineStyle::Dotted, 1.0f);
    auto thick = dash_pattern(LineStyle::Dotted, 3.0f);
    EXPECT_FLOAT_EQ(thick.segments[0], thin.segments[0] * 3.0f);
    EXPECT_FLOAT_EQ(thick.segments[1], thin.segments[1] * 3.0f);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Format String Parser
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FormatParserTest, ColorOnly)
{
    auto ps = parse_format_string("r");
    ASSERT_TRUE(ps.color.has_value());
    EXPECT_TRUE(color_eq(*ps.color, colors::red));
    EXPECT_EQ(ps.line_style, LineStyle::Solid);   // default when only color
    EXPECT_EQ(ps.marker_style, MarkerStyle::None);

    EXPECT_TRUE(color_eq(*parse_format_string("g").color, colors::green));
    EXPECT_TRUE(color_eq(*parse_format_string("b").color, colors::blue));
    EXPECT_TRUE(color_eq(*parse_format_string("c").color, colors::cyan));
    EXPECT_TRUE(color_eq(*parse_format_string("m").color, colors::magenta));
    EXPECT_TRUE(color_eq(*parse_format_string("y").color, colors::yellow));
    EXPECT_TRUE(color_eq(*parse_format_string("k").color, colors::black));
    EXPECT_TRUE(color_eq(*parse_format_string("w").color, colors::white));
}

TEST(FormatParserTest, LineStyles)
{
    EXPECT_EQ(parse_format_string("-").line_style, LineStyle::Solid);
    EXPECT_EQ(parse_format_string("--").line_style, LineStyle::Dashed);
    EXPECT_EQ(parse_format_string(":").line_style, LineStyle::Dotted);
    EXPECT_EQ(parse_format_string("-.").line_style, LineStyle::DashDot);
    EXPECT_FALSE(parse_format_string("--").color.has_value());
}

TEST(FormatParserTest, MarkerOnlyHasNoLine)
{
    auto ps = parse_format_string("o");
    EXPECT_EQ(ps.marker_style, MarkerStyle::Circle);
    EXPECT_EQ(ps.line_style, LineStyle::None);

    EXPECT_EQ(parse_format_string(".").marker_style, MarkerStyle::Point);
    EXPECT_EQ(parse_format_string("+").marker_style, MarkerStyle::Plus);
    EXPECT_EQ(parse_format_string("x").marker_style, MarkerStyle::Cross);
    EXPECT_EQ(parse_format_string("*").marker_style, MarkerStyle::Star);
    EXPECT_EQ(parse_format_string("s").marker_style, MarkerStyle::Square);
    EXPECT_EQ(parse_format_string("d").marker_style, MarkerStyle::Diamond);
    EXPECT_EQ(parse_format_string("^").marker_style, MarkerStyle::TriangleUp);
    EXPECT_EQ(parse_format_string("v").marker_style, MarkerStyle::TriangleDown);
}

TEST(FormatParserTest, RedDashedCircle)
{
    auto ps = parse_format_string("r--o");
    EXPECT_TRUE(color_eq(*ps.color, colors::red));
    EXPECT_EQ(ps.line_style, LineStyle::Dashed);
    EXPECT_EQ(ps.marker_style, MarkerStyle::Circle);
}

TEST(FormatParserTest, FlexibleOrder)
{
    auto ps = parse_format_string("--gs");
    EXPECT_TRUE(color_eq(*ps.color, colors::green));
    EXPECT_EQ(ps.line_style, LineStyle::Dashed);
    EXPECT_EQ(ps.marker_style, MarkerStyle::Square);

    auto ps2 = parse_format_string("o:b");
    EXPECT_TRUE(color_eq(*ps2.color, colors::blue));
    EXPECT_EQ(ps2.line_style, LineStyle::Dotted);
    EXPECT_EQ(ps2.marker_style, MarkerStyle::Circle);
}

TEST(FormatParserTest, ColorAndMarkerNoLine)
{
    auto ps = parse_format_string("k*");
    EXPECT_EQ(ps.line_style, LineStyle::None);
    EXPECT_EQ(ps.marker_style, MarkerStyle::Star);
}

TEST(FormatParserTest, EmptyStringIsSolid)
{
    auto ps = parse_format_string("");
    EXPECT_EQ(ps.line_style, LineStyle::Solid);
    EXPECT_EQ(ps.marker_style, MarkerStyle::None);
    EXPECT_FALSE(ps.color.has_value());
}

TEST(FormatParserTest, LastColorWins)
{
    auto ps = parse_format_string("rb");
    EXPECT_TRUE(color_eq(*ps.color, colors::blue));
}

TEST(FormatParserTest, UnknownCharacterThrows)
{
    EXPECT_THROW(parse_format_string("rq"), InvalidParameterError);
    EXPECT_THROW(parse_format_string("r -"), InvalidParameterError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// to_format_string
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FormatStringTest, RedDashedCircle)
{
    EXPECT_EQ(to_format_string(parse_format_string("r--o")), "r--o");
}

TEST(FormatStringTest, NoColor)
{
    PlotStyle ps;
    ps.line_style   = LineStyle::Dotted;
    ps.marker_style = MarkerStyle::Square;
    EXPECT_EQ(to_format_string(ps), ":s");
}

TEST(FormatStringTest, UnnamedColorIsOmitted)
{
    PlotStyle ps;
    ps.color = rgb(0.3f, 0.4f, 0.5f);
    EXPECT_EQ(to_format_string(ps), "-");
}
