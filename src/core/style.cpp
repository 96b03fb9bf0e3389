#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <plotscope/errors.hpp>
#include <plotscope/logger.hpp>
#include <plotscope/style.hpp>
#include <unistd.h>

namespace plotscope
{

namespace
{

constexpr std::array<std::string_view, 11> LEGEND_LOCATIONS = {
    "best",
    "upper right",
    "upper left",
    "lower left",
    "lower right",
    "right",
    "center left",
    "center right",
    "lower center",
    "upper center",
    "center",
};

}   // anonymous namespace

AliasTable::AliasTable(std::initializer_list<std::pair<const std::string, std::string>> entries)
    : aliases_(entries)
{
}

const std::string* AliasTable::lookup(std::string_view word) const
{
    auto it = aliases_.find(word);
    return it != aliases_.end() ? &it->second : nullptr;
}

const AliasTable& default_alias_table()
{
    static const AliasTable table{
        {"top", "upper"},
        {"bottom", "lower"},
        {"centre", "center"},
        {"middle", "center"},
        {"xrange", "xlim"},
        {"yrange", "ylim"},
        {"on", "true"},
        {"yes", "true"},
        {"off", "false"},
        {"no", "false"},
    };
    return table;
}

Theme Theme::detect()
{
    Theme t;
    t.use_latex = detect_latex();
    return t;
}

StyleResolver::StyleResolver(const AliasTable& aliases, Theme theme)
    : aliases_(&aliases), theme_(std::move(theme))
{
}

std::string StyleResolver::canonical(std::string_view token) const
{
    std::string out;
    std::string word;

    auto flush_word = [&]()
    {
        if (word.empty())
            return;
        if (!out.empty())
            out += ' ';
        const std::string* alias = aliases_->lookup(word);
        out += alias ? *alias : word;
        word.clear();
    };

    for (char c : token)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc))
            flush_word();
        else
            word += static_cast<char>(std::tolower(uc));
    }
    flush_word();
    return out;
}

std::string StyleResolver::legend_location(std::string_view token) const
{
    std::string loc = canonical(token);
    if (loc == "true")
        return "best";
    for (auto valid : LEGEND_LOCATIONS)
    {
        if (loc == valid)
            return loc;
    }
    throw InvalidParameterError("unknown legend location '" + std::string(token) + "'");
}

ResolvedStyle StyleResolver::resolve(const PlotStyle& style, size_t series_index) const
{
    ResolvedStyle r;
    r.line_style   = style.line_style;
    r.marker_style = style.marker_style;
    r.opacity      = style.opacity;
    r.line_width   = style.line_width.value_or(theme_.line_width);
    r.marker_size  = style.marker_size.value_or(theme_.marker_size);

    if (style.color)
        r.color = *style.color;
    else if (!theme_.palette.empty())
        r.color = theme_.palette[series_index % theme_.palette.size()];
    else
        r.color = theme_.text_color;
    return r;
}

bool program_on_path(std::string_view program)
{
    const char* path = std::getenv("PATH");
    if (!path || program.empty())
        return false;

    std::string_view dirs(path);
    while (!dirs.empty())
    {
        size_t           sep = dirs.find(':');
        std::string_view dir = dirs.substr(0, sep);
        dirs = sep == std::string_view::npos ? std::string_view{} : dirs.substr(sep + 1);
        if (dir.empty())
            dir = ".";

        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        if (::access(candidate.c_str(), X_OK) == 0)
            return true;
    }
    return false;
}

bool detect_latex()
{
    const bool found =
        program_on_path("latex") && program_on_path("gs") && program_on_path("dvipng");
    PLOTSCOPE_LOG_DEBUG("style", "LaTeX toolchain {}", found ? "found" : "not found");
    return found;
}

}   // namespace plotscope
