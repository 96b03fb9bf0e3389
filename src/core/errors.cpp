#include <plotscope/errors.hpp>
#include <sstream>
#include <utility>

namespace plotscope
{

namespace
{

std::string describe_interval(double lo, double hi)
{
    std::ostringstream ss;
    ss << "invalid sampling interval [" << lo << ", " << hi << "]";
    return ss.str();
}

std::string describe_duplicate(double x)
{
    std::ostringstream ss;
    ss << "sample at x=" << x << " already present";
    return ss.str();
}

std::string describe_irregular(char glyph, int row, int col)
{
    std::ostringstream ss;
    ss << "grid area '" << glyph << "' is not a rectangle: cell (" << row << ", " << col
       << ") breaks it";
    return ss.str();
}

std::string describe_aggregate(const std::vector<BackendError>& failures)
{
    std::ostringstream ss;
    ss << failures.size() << " backend call(s) failed during replay";
    for (const auto& f : failures)
        ss << "\n  - " << f.what();
    return ss.str();
}

}   // anonymous namespace

InvalidIntervalError::InvalidIntervalError(double lo, double hi)
    : PlotError(describe_interval(lo, hi)), lo_(lo), hi_(hi)
{
}

DuplicateXError::DuplicateXError(double x) : PlotError(describe_duplicate(x)), x_(x) {}

IrregularGridError::IrregularGridError(char glyph, int row, int col)
    : PlotError(describe_irregular(glyph, row, col)), glyph_(glyph), row_(row), col_(col)
{
}

ClosedContextError::ClosedContextError(const std::string& operation)
    : PlotError(operation + ": figure context is closed")
{
}

GridAlreadySetError::GridAlreadySetError() : PlotError("grid layout was already set") {}

BackendError::BackendError(std::string operation, const std::string& detail)
    : PlotError(operation + ": " + detail), operation_(std::move(operation))
{
}

AggregateReplayError::AggregateReplayError(std::vector<BackendError> failures)
    : PlotError(describe_aggregate(failures)), failures_(std::move(failures))
{
}

}   // namespace plotscope
