#pragma once

#include <plotscope/backend.hpp>
#include <plotscope/color.hpp>
#include <plotscope/errors.hpp>
#include <plotscope/figure.hpp>
#include <plotscope/fwd.hpp>
#include <plotscope/grid.hpp>
#include <plotscope/logger.hpp>
#include <plotscope/plot_style.hpp>
#include <plotscope/sample_buffer.hpp>
#include <plotscope/sampler.hpp>
#include <plotscope/style.hpp>
#include <plotscope/svg_backend.hpp>
