// Several subplots described by a text grid.
//   ./grid_layout [output.svg]

#include <cmath>
#include <iostream>
#include <plotscope/plotscope.hpp>
#include <vector>

using namespace plotscope;

int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    const std::string path = argc > 1 ? argv[1] : "grid_layout.svg";

    std::vector<double> xs;
    std::vector<double> ys;
    for (int i = 0; i < 40; ++i)
    {
        const double x = 0.25 * i;
        xs.push_back(x);
        ys.push_back(std::sqrt(x) + 0.3 * std::sin(3.0 * x));
    }

    SvgBackend backend({.width = 1000, .height = 700});
    try
    {
        FigureContext fig(backend, {.save_path = path});
        fig.set_grid("AAB\n"
                     "AAB\n"
                     "CCD");

        fig.plot([](double x) { return std::sin(x); }, {0.0, 12.0}, {.label = "sin", .group = 'A'});
        fig.plot([](double x) { return std::cos(x); }, {0.0, 12.0}, {.label = "cos", .group = 'A'});
        fig.title("Trigonometry", 'A');

        fig.scatter(xs, ys, {.label = "noisy sqrt", .group = 'B'});
        fig.title("Measurements", 'B');

        fig.plot([](double x) { return std::exp(x); }, {0.0, 5.0}, {.group = 'C'});
        fig.yscale(ScaleMode::Log, 'C');
        fig.title("Exponential (log y)", 'C');

        fig.plot([](double t) { return t * t; }, {-1.0, 1.0}, {.group = 'D', .invert = true});
        fig.xlabel("t", 'D');
        fig.ylabel("t^2", 'D');
        fig.equal_aspect(true, 'D');

        fig.exit();
    }
    catch (const PlotError& e)
    {
        std::cerr << "grid_layout: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
