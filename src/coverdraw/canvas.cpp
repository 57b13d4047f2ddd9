/*!
 * \file canvas.cpp
 * \brief file canvas.cpp
 *
 * Copyright 2016 by Intel.
 *
 * Contact: kevin.rogovin@intel.com
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@intel.com>
 *
 */

#include <coverdraw/canvas.hpp>
#include <coverdraw/stroked_path.hpp>
#include <coverdraw/raster/coverage_rasterizer.hpp>
#include <coverdraw/raster/compositor.hpp>
#include <coverdraw/text/caching_glyph_renderer.hpp>
#include <coverdraw/util/log.hpp>
#include <private/util_private.hpp>

namespace
{
  class CanvasPrivate
  {
  public:
    CanvasPrivate(coverdraw::ImageFrame &frame,
                  const coverdraw::RasterParams &params,
                  const coverdraw::GraphicsOptions &options):
      m_frame(frame),
      m_params(params),
      m_rasterizer(params),
      m_compositor(params, options),
      m_glyph_renderer(params)
    {}

    void
    add(const coverdraw::reference_counted_ptr<const coverdraw::Brush> &brush,
        const coverdraw::reference_counted_ptr<coverdraw::CoverageMap> &coverage,
        int render_pass)
    {
      if (brush && !coverage->empty())
        {
          m_operations.push_back(coverdraw::DrawingOperation(brush, coverage, render_pass));
        }
    }

    coverdraw::ImageFrame &m_frame;
    coverdraw::RasterParams m_params;
    coverdraw::CoverageRasterizer m_rasterizer;
    coverdraw::Compositor m_compositor;
    coverdraw::CachingGlyphRenderer m_glyph_renderer;
    std::vector<coverdraw::DrawingOperation> m_operations;
  };
}

///////////////////////////////////
// coverdraw::Canvas methods
coverdraw::Canvas::
Canvas(ImageFrame &frame, const RasterParams &params,
       const GraphicsOptions &options)
{
  m_d = COVERDRAWnew CanvasPrivate(frame, params, options);
}

coverdraw::Canvas::
~Canvas()
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  COVERDRAWdelete(d);
}

coverdraw::ImageFrame&
coverdraw::Canvas::
frame(void)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  return d->m_frame;
}

const coverdraw::RasterParams&
coverdraw::Canvas::
params(void) const
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  return d->m_params;
}

void
coverdraw::Canvas::
fill_path(const Path &path, const reference_counted_ptr<const Brush> &brush,
          enum RasterEnums::fill_rule_t fill_rule, int render_pass)
{
  fill_path(path, brush, CustomFillRuleFunction(fill_rule), render_pass);
}

void
coverdraw::Canvas::
fill_path(const Path &path, const reference_counted_ptr<const Brush> &brush,
          const CustomFillRuleBase &fill_rule, int render_pass)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);

  FlattenedPath flat(path.flatten(d->m_params.curve_tolerance()));
  IRect clip(d->m_frame.bounds());
  d->add(brush, d->m_rasterizer.rasterize(flat, fill_rule, &clip), render_pass);
}

void
coverdraw::Canvas::
stroke_path(const Path &path, const Pen &pen, int render_pass)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);

  FlattenedPath flat(path.flatten(d->m_params.curve_tolerance()));
  FlattenedPath stroke(StrokedPath::create(flat, pen, d->m_params.curve_tolerance()));
  IRect clip(d->m_frame.bounds());
  d->add(pen.brush(), d->m_rasterizer.rasterize(stroke, RasterEnums::nonzero_fill_rule, &clip),
         render_pass);
}

void
coverdraw::Canvas::
draw_text(const GlyphRun &run, const reference_counted_ptr<const Brush> &brush,
          const Pen *pen, int render_pass)
{
  CanvasPrivate *d;
  unsigned int start;

  d = static_cast<CanvasPrivate*>(m_d);
  start = d->m_operations.size();
  d->m_glyph_renderer.render(run, brush, pen, &d->m_operations);
  for (unsigned int i = start, endi = d->m_operations.size(); i < endi; ++i)
    {
      d->m_operations[i].m_render_pass += render_pass;
    }

  /* the recorded operations hold the coverage maps,
   * the cache only lives for one text draw.
   */
  d->m_glyph_renderer.clear();
}

void
coverdraw::Canvas::
add_operation(const DrawingOperation &op)
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  d->m_operations.push_back(op);
}

unsigned int
coverdraw::Canvas::
number_operations(void) const
{
  CanvasPrivate *d;
  d = static_cast<CanvasPrivate*>(m_d);
  return d->m_operations.size();
}

unsigned int
coverdraw::Canvas::
flush(void)
{
  CanvasPrivate *d;
  unsigned int return_value;

  d = static_cast<CanvasPrivate*>(m_d);
  return_value = d->m_compositor.composite(make_c_array(d->m_operations), d->m_frame);
  COVERDRAWlog_debug("flushed " << d->m_operations.size() << " operations, "
                     << return_value << " blended");
  d->m_operations.clear();
  return return_value;
}
