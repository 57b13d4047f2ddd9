/*!
 * \file glyph_run.cpp
 * \brief file glyph_run.cpp
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

#include <vector>
#include <coverdraw/text/glyph_run.hpp>
#include <private/util_private.hpp>

namespace
{
  class GlyphRunPrivate
  {
  public:
    GlyphRunPrivate(const coverdraw::reference_counted_ptr<const coverdraw::GlyphSource> &source,
                    unsigned int pixel_size):
      m_source(source),
      m_pixel_size(pixel_size)
    {}

    coverdraw::reference_counted_ptr<const coverdraw::GlyphSource> m_source;
    unsigned int m_pixel_size;
    std::vector<uint32_t> m_glyph_codes;
    std::vector<coverdraw::vec2> m_positions;
  };
}

///////////////////////////////////
// coverdraw::GlyphRun methods
coverdraw::GlyphRun::
GlyphRun(const reference_counted_ptr<const GlyphSource> &source,
         unsigned int pixel_size)
{
  COVERDRAWrequire(source, "GlyphRun requires a GlyphSource");
  COVERDRAWrequire(pixel_size > 0, "GlyphRun pixel size must be positive");
  m_d = COVERDRAWnew GlyphRunPrivate(source, pixel_size);
}

copy_ctor(coverdraw::GlyphRun, GlyphRun, GlyphRunPrivate)

coverdraw::GlyphRun::
~GlyphRun()
{
  GlyphRunPrivate *d;
  d = static_cast<GlyphRunPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

assign_swap_implement(coverdraw::GlyphRun)

get_implement(coverdraw::GlyphRun, GlyphRunPrivate,
              const coverdraw::reference_counted_ptr<const coverdraw::GlyphSource>&, source)
get_implement(coverdraw::GlyphRun, GlyphRunPrivate, unsigned int, pixel_size)

coverdraw::GlyphRun&
coverdraw::GlyphRun::
add_glyph(uint32_t glyph_code, const vec2 &position)
{
  GlyphRunPrivate *d;
  d = static_cast<GlyphRunPrivate*>(m_d);
  d->m_glyph_codes.push_back(glyph_code);
  d->m_positions.push_back(position);
  return *this;
}

coverdraw::vec2
coverdraw::GlyphRun::
add_text(c_array<const uint32_t> character_codes, vec2 pen)
{
  GlyphRunPrivate *d;
  d = static_cast<GlyphRunPrivate*>(m_d);

  for (uint32_t c : character_codes)
    {
      uint32_t g;

      g = d->m_source->glyph_code(c);
      add_glyph(g, pen);
      pen += d->m_source->glyph_metrics(g, d->m_pixel_size).m_advance;
    }
  return pen;
}

coverdraw::vec2
coverdraw::GlyphRun::
add_text(c_string text, vec2 pen)
{
  std::vector<uint32_t> codes;

  for (; text && *text; ++text)
    {
      codes.push_back(static_cast<unsigned char>(*text));
    }
  return add_text(make_c_array(codes), pen);
}

unsigned int
coverdraw::GlyphRun::
number_glyphs(void) const
{
  GlyphRunPrivate *d;
  d = static_cast<GlyphRunPrivate*>(m_d);
  return d->m_glyph_codes.size();
}

uint32_t
coverdraw::GlyphRun::
glyph_code(unsigned int I) const
{
  GlyphRunPrivate *d;
  d = static_cast<GlyphRunPrivate*>(m_d);
  COVERDRAWassert(I < d->m_glyph_codes.size());
  return d->m_glyph_codes[I];
}

const coverdraw::vec2&
coverdraw::GlyphRun::
position(unsigned int I) const
{
  GlyphRunPrivate *d;
  d = static_cast<GlyphRunPrivate*>(m_d);
  COVERDRAWassert(I < d->m_positions.size());
  return d->m_positions[I];
}

void
coverdraw::GlyphRun::
clear(void)
{
  GlyphRunPrivate *d;
  d = static_cast<GlyphRunPrivate*>(m_d);
  d->m_glyph_codes.clear();
  d->m_positions.clear();
}
