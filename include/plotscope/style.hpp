#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <plotscope/color.hpp>
#include <plotscope/plot_style.hpp>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace plotscope
{

// Word-level aliases ("top" -> "upper", "xrange" -> "xlim"). Immutable once
// built; share one instance between resolvers.
class AliasTable
{
   public:
    AliasTable() = default;
    AliasTable(std::initializer_list<std::pair<const std::string, std::string>> entries);

    // Canonical spelling of `word`, or nullptr when it has no alias.
    const std::string* lookup(std::string_view word) const;
    size_t             size() const { return aliases_.size(); }

   private:
    std::map<std::string, std::string, std::less<>> aliases_;
};

// Process-wide table, built on first use.
const AliasTable& default_alias_table();

struct Theme
{
    std::span<const Color> palette          = palette::default_cycle;
    float                  line_width       = 1.75f;
    float                  marker_size      = 7.0f;
    Color                  figure_face      = colors::white;
    Color                  axes_face        = Color::from_hex(0xEAEAF2);
    Color                  grid_color       = colors::white;
    Color                  text_color       = colors::dark_gray;
    std::string            font_family      = "serif";
    float                  label_font_size  = 11.0f;
    float                  title_font_size  = 12.0f;
    float                  tick_font_size   = 10.0f;
    float                  legend_font_size = 10.0f;
    bool                   use_latex        = false;   // Computer Modern text, $...$ math spans

    // Default theme with use_latex set from detect_latex().
    static Theme detect();
};

class StyleResolver
{
   public:
    explicit StyleResolver(const AliasTable& aliases = default_alias_table(), Theme theme = {});

    // Lowercased, whitespace-collapsed and with every word replaced by its
    // alias: "  Top   Left" -> "upper left".
    std::string canonical(std::string_view token) const;

    // One of the canonical legend locations; "true" means "best".
    // Throws InvalidParameterError for anything else.
    std::string legend_location(std::string_view token) const;

    // Fills unset values from the theme; the color cycles through the
    // palette by `series_index` within one cell.
    ResolvedStyle resolve(const PlotStyle& style, size_t series_index) const;

    const Theme& theme() const { return theme_; }

   private:
    const AliasTable* aliases_;
    Theme             theme_;
};

// All of latex, gs and dvipng are executable somewhere on PATH.
bool detect_latex();

bool program_on_path(std::string_view program);

}   // namespace plotscope
