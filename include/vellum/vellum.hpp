#pragma once

/**
 * Vellum - Generic 2D drawing on a recording vector canvas
 *
 * Usage:
 *
 *   #include <vellum/vellum.hpp>
 *   auto surface = vellum::Surface::MakeRaster(400, 300);
 *   auto fonts = vellum::CompositeFontSource::MakeSystem();
 *
 *   surface->beginFrame(vellum::ColorU{255, 255, 255, 255});
 *   {
 *       vellum::CanvasRenderContext rc(*surface->canvas(), fonts);
 *       auto black = rc.solidBrush(vellum::Color::black());
 *       rc.stroke(vellum::Rect(75, 140, 225, 250), black, 10.0);
 *       rc.finish();
 *   }
 *   surface->endFrame();
 *   surface->flush();
 */

// Version
#include "vellum/version.hpp"

// Backend types and pixel data
#include "vellum/types.hpp"
#include "vellum/pixmap.hpp"
#include "vellum/image.hpp"

// Backend scene: paths, recording, device, canvas
#include "vellum/path2d.hpp"
#include "vellum/paint.hpp"
#include "vellum/recording.hpp"
#include "vellum/draw_op_visitor.hpp"
#include "vellum/device.hpp"
#include "vellum/canvas.hpp"

// Surface (top-level rendering target)
#include "vellum/renderer.hpp"
#include "vellum/surface.hpp"

// Generic drawing interface
#include "vellum/shape.hpp"
#include "vellum/brush.hpp"
#include "vellum/error.hpp"
#include "vellum/image_format.hpp"
#include "vellum/stroke_style.hpp"
#include "vellum/render_context.hpp"

// Conversions
#include "vellum/convert.hpp"
#include "vellum/style.hpp"
#include "vellum/image_bridge.hpp"
#include "vellum/blur.hpp"

// Fonts and text
#include "vellum/font_source.hpp"
#include "vellum/font_matching.hpp"
#include "vellum/mem_font_source.hpp"
#include "vellum/multi_font_source.hpp"
#include "vellum/system_font_source.hpp"
#include "vellum/composite_font_source.hpp"
#include "vellum/text.hpp"

// Canvas adapter
#include "vellum/canvas_render_context.hpp"
