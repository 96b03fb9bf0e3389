// Eigen integration demo: pass Eigen vectors directly to a figure.
// Build with: cmake -DPLOTSCOPE_USE_EIGEN=ON ..

#include <cmath>
#include <eigen3/Eigen/Core>
#include <iostream>
#include <plotscope/eigen.hpp>
#include <plotscope/svg_backend.hpp>

int main()
{
    const int       N = 200;
    Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(N, 0.0, 4.0 * M_PI);

    plotscope::SvgBackend backend;
    try
    {
        plotscope::FigureContext fig(backend, {.save_path = "eigen_demo.svg"});
        fig.set_grid("AB");

        plotscope::plot(fig, x, x.array().sin(), {.label = "sin(x)", .group = 'A'});
        plotscope::plot(fig, x, (-0.1 * x.array()).exp() * x.array().sin(),
                        {.label = "damped", .group = 'A', .format = "r--"});
        fig.title("Eigen expressions", 'A');

        Eigen::VectorXd sx = Eigen::VectorXd::Random(100) * 5.0;
        Eigen::VectorXd sy = sx.array().square();
        plotscope::scatter(fig, sx, sy, {.group = 'B'});
        fig.title("Scatter (Eigen::Random)", 'B');

        fig.exit();
    }
    catch (const plotscope::PlotError& e)
    {
        std::cerr << "eigen_demo: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
