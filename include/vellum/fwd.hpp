#pragma once

#include <memory>

namespace vellum
{

class Primitive;
class PrimitiveKind;
class Registry;
class PointerDispatcher;
class FrameEngine;
class TickSource;
class ManualTickSource;
class TimerTickSource;
class AnimationQueue;
struct AnimationTask;
struct Frame;

class Surface;
class RecordingSurface;
class SvgSurface;

class SeriesData;
class StyleResolver;
struct ChartConfig;
struct Theme;
class Chart;
class ChartContext;
class ChartTypeHandler;
class ChartTypeRegistry;

using PrimitivePtr = std::shared_ptr<Primitive>;

}   // namespace vellum
