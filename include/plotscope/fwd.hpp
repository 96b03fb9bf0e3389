#pragma once

namespace plotscope
{

class Logger;

class SampleBuffer;
class AdaptiveSampler;
struct SamplingTask;
struct Sample;
struct SamplingEvent;

class GridLayout;
class GridLayoutResolver;
struct PlotCell;

class FigureContext;
struct FigureOptions;
struct PlotOptions;
struct DrawOp;

class AliasTable;
class StyleResolver;
struct Theme;
struct PlotStyle;
struct ResolvedStyle;

class PlotBackend;
class SvgBackend;

class PlotError;

}   // namespace plotscope
