#pragma once

// ─── plotscope ↔ Eigen ──────────────────────────────────────────────────────
//
// Include this header to pass Eigen vectors straight to FigureContext and
// evaluate_at(). Requires Eigen 3.x and PLOTSCOPE_USE_EIGEN=ON.
//
//   Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(200, 0.0, 10.0);
//   Eigen::VectorXd y = x.array().sin();
//
//   plotscope::FigureContext fig(backend);
//   plotscope::plot(fig, x, y, {.label = "sin"});
//   plotscope::plot(fig, x, x.array().cos(), {.format = "r--"});   // expressions too
//
// ─────────────────────────────────────────────────────────────────────────────

#include <eigen3/Eigen/Core>
#include <plotscope/figure.hpp>
#include <plotscope/sample_buffer.hpp>
#include <plotscope/sampler.hpp>
#include <span>
#include <type_traits>
#include <utility>

namespace plotscope
{

namespace eigen_detail
{

// Any dense Eigen expression with double scalar and a single column.
template <typename T, typename = void>
struct is_eigen_double_vector : std::false_type
{
};

template <typename T>
struct is_eigen_double_vector<
    T,
    std::enable_if_t<std::is_base_of_v<Eigen::DenseBase<std::decay_t<T>>, std::decay_t<T>>
                     && std::is_same_v<typename std::decay_t<T>::Scalar, double>
                     && (std::decay_t<T>::ColsAtCompileTime == 1
                         || std::decay_t<T>::ColsAtCompileTime == Eigen::Dynamic)>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_eigen_double_vector_v = is_eigen_double_vector<T>::value;

// Lazy expressions are evaluated into the returned vector; keep it alive for
// as long as the span is used.
template <typename Derived>
Eigen::VectorXd evaluate(const Eigen::DenseBase<Derived>& v)
{
    static_assert(std::is_same_v<typename Derived::Scalar, double>,
                  "plotscope Eigen adapter requires double scalar type. "
                  "Use .cast<double>() to convert.");
    return v.derived();
}

inline std::span<const double> to_span(const Eigen::VectorXd& v)
{
    return {v.data(), static_cast<size_t>(v.size())};
}

}   // namespace eigen_detail

template <typename XDerived, typename YDerived>
auto plot(FigureContext&                    fig,
          const Eigen::DenseBase<XDerived>& x,
          const Eigen::DenseBase<YDerived>& y,
          const PlotOptions&                opts = {})
    -> std::enable_if_t<eigen_detail::is_eigen_double_vector_v<XDerived>
                        && eigen_detail::is_eigen_double_vector_v<YDerived>>
{
    const Eigen::VectorXd xs = eigen_detail::evaluate(x);
    const Eigen::VectorXd ys = eigen_detail::evaluate(y);
    fig.plot(eigen_detail::to_span(xs), eigen_detail::to_span(ys), opts);
}

template <typename XDerived, typename YDerived>
auto scatter(FigureContext&                    fig,
             const Eigen::DenseBase<XDerived>& x,
             const Eigen::DenseBase<YDerived>& y,
             const PlotOptions&                opts = {})
    -> std::enable_if_t<eigen_detail::is_eigen_double_vector_v<XDerived>
                        && eigen_detail::is_eigen_double_vector_v<YDerived>>
{
    const Eigen::VectorXd xs = eigen_detail::evaluate(x);
    const Eigen::VectorXd ys = eigen_detail::evaluate(y);
    fig.scatter(eigen_detail::to_span(xs), eigen_detail::to_span(ys), opts);
}

// Function evaluated at the entries of `x`.
template <typename XDerived>
auto plot(FigureContext&                    fig,
          const ScalarFunction&             f,
          const Eigen::DenseBase<XDerived>& x,
          const PlotOptions&                opts = {})
    -> std::enable_if_t<eigen_detail::is_eigen_double_vector_v<XDerived>>
{
    const Eigen::VectorXd xs = eigen_detail::evaluate(x);
    fig.plot(f, eigen_detail::to_span(xs), opts);
}

template <typename XDerived>
auto evaluate_at(const ScalarFunction& f, const Eigen::DenseBase<XDerived>& x)
    -> std::enable_if_t<eigen_detail::is_eigen_double_vector_v<XDerived>, SampleBuffer>
{
    const Eigen::VectorXd xs = eigen_detail::evaluate(x);
    return evaluate_at(f, eigen_detail::to_span(xs));
}

// Sample coordinates as two column vectors.
inline std::pair<Eigen::VectorXd, Eigen::VectorXd> to_eigen(const SampleBuffer& buffer)
{
    Eigen::VectorXd xs(static_cast<Eigen::Index>(buffer.size()));
    Eigen::VectorXd ys(static_cast<Eigen::Index>(buffer.size()));
    Eigen::Index    i = 0;
    for (const auto& s : buffer.samples())
    {
        xs[i] = s.x;
        ys[i] = s.y;
        ++i;
    }
    return {std::move(xs), std::move(ys)};
}

}   // namespace plotscope
