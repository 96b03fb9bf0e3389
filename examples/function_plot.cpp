// Adaptive function plotting to an SVG file.
//   ./function_plot [output.svg]

#include <cmath>
#include <iostream>
#include <plotscope/plotscope.hpp>

using namespace plotscope;

int main(int argc, char** argv)
{
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().configure_from_env();

    const std::string path = argc > 1 ? argv[1] : "function_plot.svg";

    SvgBackend backend;
    try
    {
        FigureContext fig(backend, {.title = "Adaptive sampling", .save_path = path});

        fig.plot([](double x) { return std::sin(x) / x; }, {-20.0, 20.0}, {.label = "sin(x)/x"});
        fig.plot([](double x) { return std::exp(-0.1 * x * x); },
                 {-20.0, 20.0},
                 {.label = "gaussian", .format = "r--"});

        // Sharp feature: refinement concentrates near x = 0
        SamplingTask task{.function  = [](double x) { return std::tanh(50.0 * x); },
                          .interval  = {-20.0, 20.0},
                          .tolerance = 1e-4};
        fig.plot(task, {.label = "tanh(50x)", .format = ":"});

        fig.xlabel("x");
        fig.ylabel("f(x)");
        fig.legend("lower right");
        fig.exit();
    }
    catch (const PlotError& e)
    {
        std::cerr << "function_plot: " << e.what() << '\n';
        return 1;
    }

    PLOTSCOPE_LOG_INFO("example", "wrote {}", path);
    return 0;
}
