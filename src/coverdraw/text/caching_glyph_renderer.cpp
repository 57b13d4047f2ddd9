/*!
 * \file caching_glyph_renderer.cpp
 * \brief file caching_glyph_renderer.cpp
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

#include <coverdraw/text/caching_glyph_renderer.hpp>
#include <coverdraw/raster/coverage_rasterizer.hpp>
#include <coverdraw/stroked_path.hpp>
#include <coverdraw/util/log.hpp>
#include <private/util_private.hpp>

namespace
{
  bool
  same_stroke(const coverdraw::Pen &a, const coverdraw::Pen &b)
  {
    if (a.width() != b.width()
        || a.join_style() != b.join_style()
        || a.cap_style() != b.cap_style()
        || a.miter_limit() != b.miter_limit()
        || a.dash_pattern().size() != b.dash_pattern().size())
      {
        return false;
      }

    for (unsigned int i = 0, endi = a.dash_pattern().size(); i < endi; ++i)
      {
        if (a.dash_pattern()[i] != b.dash_pattern()[i])
          {
            return false;
          }
      }
    return true;
  }

  /* the outline of a glyph, flattened on first use and
   * shared between the fill and the stroke of the glyph
   */
  class GlyphOutline
  {
  public:
    GlyphOutline(const coverdraw::GlyphRun &run, unsigned int glyph,
                 const coverdraw::vec2 &sub_pixel_offset, float tolerance):
      m_run(run),
      m_glyph(glyph),
      m_sub_pixel_offset(sub_pixel_offset),
      m_tolerance(tolerance),
      m_state(not_fetched)
    {}

    /* returns nullptr if the outline is not available */
    const coverdraw::FlattenedPath*
    path(void)
    {
      if (m_state == not_fetched)
        {
          coverdraw::Path P;
          enum coverdraw::return_code R;

          R = m_run.source()->glyph_outline(m_run.glyph_code(m_glyph),
                                            m_run.pixel_size(), &P);
          if (R == coverdraw::routine_success)
            {
              m_path = P.flatten(m_tolerance);
              m_path.translate(m_sub_pixel_offset);
              m_state = fetched;
            }
          else
            {
              m_state = fetch_failed;
            }
        }
      return (m_state == fetched) ? &m_path : nullptr;
    }

  private:
    enum state_t
      {
        not_fetched,
        fetched,
        fetch_failed
      };

    const coverdraw::GlyphRun &m_run;
    unsigned int m_glyph;
    coverdraw::vec2 m_sub_pixel_offset;
    float m_tolerance;
    enum state_t m_state;
    coverdraw::FlattenedPath m_path;
  };

  class CachingGlyphRendererPrivate
  {
  public:
    explicit
    CachingGlyphRendererPrivate(const coverdraw::RasterParams &params):
      m_params(params),
      m_rasterizer(params)
    {}

    uint32_t
    variant(const coverdraw::Pen &pen);

    coverdraw::reference_counted_ptr<const coverdraw::CoverageMap>
    fetch_fill(const coverdraw::GlyphCache::Key &key, GlyphOutline &outline);

    coverdraw::reference_counted_ptr<const coverdraw::CoverageMap>
    fetch_outline(const coverdraw::GlyphCache::Key &key, GlyphOutline &outline,
                  const coverdraw::Pen &pen);

    coverdraw::RasterParams m_params;
    coverdraw::CoverageRasterizer m_rasterizer;
    coverdraw::GlyphCache m_cache;

    /* stroke styles seen, the variant of a stroke style
     * is one plus its index
     */
    std::vector<coverdraw::Pen> m_pens;
  };
}

/////////////////////////////////////////////
// CachingGlyphRendererPrivate methods
uint32_t
CachingGlyphRendererPrivate::
variant(const coverdraw::Pen &pen)
{
  for (unsigned int i = 0, endi = m_pens.size(); i < endi; ++i)
    {
      if (same_stroke(pen, m_pens[i]))
        {
          return i + 1u;
        }
    }
  m_pens.push_back(pen);
  return m_pens.size();
}

coverdraw::reference_counted_ptr<const coverdraw::CoverageMap>
CachingGlyphRendererPrivate::
fetch_fill(const coverdraw::GlyphCache::Key &key, GlyphOutline &outline)
{
  coverdraw::reference_counted_ptr<const coverdraw::CoverageMap> return_value;

  if (!m_cache.fetch(key, &return_value))
    {
      const coverdraw::FlattenedPath *path(outline.path());
      if (path)
        {
          return_value = m_rasterizer.rasterize(*path, coverdraw::RasterEnums::nonzero_fill_rule);
          m_cache.store(key, return_value);
        }
    }
  return return_value;
}

coverdraw::reference_counted_ptr<const coverdraw::CoverageMap>
CachingGlyphRendererPrivate::
fetch_outline(const coverdraw::GlyphCache::Key &key, GlyphOutline &outline,
              const coverdraw::Pen &pen)
{
  coverdraw::reference_counted_ptr<const coverdraw::CoverageMap> return_value;

  if (!m_cache.fetch(key, &return_value))
    {
      const coverdraw::FlattenedPath *path(outline.path());
      if (path)
        {
          coverdraw::FlattenedPath stroke;

          stroke = coverdraw::StrokedPath::create(*path, pen, m_params.curve_tolerance());
          return_value = m_rasterizer.rasterize(stroke, coverdraw::RasterEnums::nonzero_fill_rule);
          m_cache.store(key, return_value);
        }
    }
  return return_value;
}

/////////////////////////////////////////////
// coverdraw::CachingGlyphRenderer methods
coverdraw::CachingGlyphRenderer::
CachingGlyphRenderer(const RasterParams &params)
{
  m_d = COVERDRAWnew CachingGlyphRendererPrivate(params);
}

coverdraw::CachingGlyphRenderer::
~CachingGlyphRenderer()
{
  CachingGlyphRendererPrivate *d;
  d = static_cast<CachingGlyphRendererPrivate*>(m_d);
  COVERDRAWdelete(d);
}

const coverdraw::RasterParams&
coverdraw::CachingGlyphRenderer::
params(void) const
{
  CachingGlyphRendererPrivate *d;
  d = static_cast<CachingGlyphRendererPrivate*>(m_d);
  return d->m_params;
}

coverdraw::GlyphCache&
coverdraw::CachingGlyphRenderer::
cache(void)
{
  CachingGlyphRendererPrivate *d;
  d = static_cast<CachingGlyphRendererPrivate*>(m_d);
  return d->m_cache;
}

const coverdraw::GlyphCache&
coverdraw::CachingGlyphRenderer::
cache(void) const
{
  CachingGlyphRendererPrivate *d;
  d = static_cast<CachingGlyphRendererPrivate*>(m_d);
  return d->m_cache;
}

void
coverdraw::CachingGlyphRenderer::
clear(void)
{
  CachingGlyphRendererPrivate *d;
  d = static_cast<CachingGlyphRendererPrivate*>(m_d);

  /* variants are only meaningful for the keys they were made for */
  d->m_cache.clear();
  d->m_pens.clear();
}

unsigned int
coverdraw::CachingGlyphRenderer::
number_stroke_styles(void) const
{
  CachingGlyphRendererPrivate *d;
  d = static_cast<CachingGlyphRendererPrivate*>(m_d);
  return d->m_pens.size();
}

unsigned int
coverdraw::CachingGlyphRenderer::
render(const GlyphRun &run,
       const reference_counted_ptr<const Brush> &brush,
       const Pen *pen,
       std::vector<DrawingOperation> *out_operations)
{
  CachingGlyphRendererPrivate *d;
  unsigned int return_value(0);
  uint32_t pen_variant(0);

  d = static_cast<CachingGlyphRendererPrivate*>(m_d);
  if (pen)
    {
      pen_variant = d->variant(*pen);
    }

  for (unsigned int i = 0, endi = run.number_glyphs(); i < endi; ++i)
    {
      ivec2 pixel, sub_pixel;

      GlyphCache::split_position(run.position(i), &pixel, &sub_pixel);
      GlyphOutline outline(run, i, GlyphCache::sub_pixel_offset(sub_pixel),
                           d->m_params.curve_tolerance());

      if (brush)
        {
          GlyphCache::Key key(run.source()->font_id(), run.pixel_size(),
                              run.glyph_code(i), sub_pixel);
          reference_counted_ptr<const CoverageMap> coverage;

          coverage = d->fetch_fill(key, outline);
          if (coverage && !coverage->empty())
            {
              out_operations->push_back(DrawingOperation(brush, coverage,
                                                         coverage->origin() + pixel,
                                                         fill_render_pass));
              ++return_value;
            }
        }

      if (pen)
        {
          GlyphCache::Key key(run.source()->font_id(), run.pixel_size(),
                              run.glyph_code(i), sub_pixel, pen_variant);
          reference_counted_ptr<const CoverageMap> coverage;

          coverage = d->fetch_outline(key, outline, *pen);
          if (coverage && !coverage->empty())
            {
              out_operations->push_back(DrawingOperation(pen->brush(), coverage,
                                                         coverage->origin() + pixel,
                                                         outline_render_pass));
              ++return_value;
            }
        }
    }

  COVERDRAWlog_debug("rendered " << run.number_glyphs() << " glyphs to "
                     << return_value << " operations, cache hits = "
                     << d->m_cache.number_hits() << ", misses = "
                     << d->m_cache.number_misses());
  return return_value;
}
