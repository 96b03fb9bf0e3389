#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace plotscope
{

// Base class of every error raised by plotscope.
class PlotError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

class InvalidParameterError : public PlotError
{
   public:
    using PlotError::PlotError;
};

class InvalidIntervalError : public PlotError
{
   public:
    InvalidIntervalError(double lo, double hi);

    double lo() const { return lo_; }
    double hi() const { return hi_; }

   private:
    double lo_;
    double hi_;
};

class DuplicateXError : public PlotError
{
   public:
    explicit DuplicateXError(double x);

    double x() const { return x_; }

   private:
    double x_;
};

class OverlapError : public PlotError
{
   public:
    using PlotError::PlotError;
};

// A glyph whose occurrences do not form a single filled rectangle.
// row/col locate the first cell inside the glyph's bounding box that
// carries a different character.
class IrregularGridError : public PlotError
{
   public:
    IrregularGridError(char glyph, int row, int col);

    char glyph() const { return glyph_; }
    int  row() const { return row_; }
    int  col() const { return col_; }

   private:
    char glyph_;
    int  row_;
    int  col_;
};

class GridCoverageError : public PlotError
{
   public:
    using PlotError::PlotError;
};

class ClosedContextError : public PlotError
{
   public:
    explicit ClosedContextError(const std::string& operation);
};

class GridAlreadySetError : public PlotError
{
   public:
    GridAlreadySetError();
};

class ConcurrentAccessError : public PlotError
{
   public:
    using PlotError::PlotError;
};

// Wraps any failure reported by a PlotBackend call.
class BackendError : public PlotError
{
   public:
    BackendError(std::string operation, const std::string& detail);

    const std::string& operation() const { return operation_; }

   private:
    std::string operation_;
};

// Every BackendError raised during one flush, in replay order.
class AggregateReplayError : public PlotError
{
   public:
    explicit AggregateReplayError(std::vector<BackendError> failures);

    const std::vector<BackendError>& failures() const { return failures_; }
    size_t                           count() const { return failures_.size(); }

   private:
    std::vector<BackendError> failures_;
};

}   // namespace plotscope
