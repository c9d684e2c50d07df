#pragma once

// Umbrella header

#include <vellum/animation.hpp>
#include <vellum/chart.hpp>
#include <vellum/color.hpp>
#include <vellum/config.hpp>
#include <vellum/easing.hpp>
#include <vellum/error.hpp>
#include <vellum/frame.hpp>
#include <vellum/frame_engine.hpp>
#include <vellum/fwd.hpp>
#include <vellum/logger.hpp>
#include <vellum/pointer.hpp>
#include <vellum/primitive.hpp>
#include <vellum/property.hpp>
#include <vellum/recording_surface.hpp>
#include <vellum/registry.hpp>
#include <vellum/series_data.hpp>
#include <vellum/surface.hpp>
#include <vellum/svg_surface.hpp>
#include <vellum/tick_source.hpp>
