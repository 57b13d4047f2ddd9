/*!
 * \file font_freetype.cpp
 * \brief file font_freetype.cpp
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

#include <coverdraw/text/font_freetype.hpp>
#include <coverdraw/util/log.hpp>
#include <private/util_private.hpp>

#include <ft2build.h>
#include FT_OUTLINE_H

namespace
{
  /* convert from FreeType 26.6 values in pixels to coverdraw
   * coordinates, where y points down.
   */
  inline
  coverdraw::vec2
  from_freetype(const FT_Vector *pt)
  {
    return coverdraw::vec2(static_cast<float>(pt->x) / 64.0f,
                           -static_cast<float>(pt->y) / 64.0f);
  }

  class PathCreator
  {
  public:
    static
    enum coverdraw::return_code
    decompose_to_path(FT_Outline *outline, coverdraw::Path *p)
    {
      PathCreator datum(p);
      FT_Outline_Funcs funcs;
      FT_Error error_code;

      funcs.move_to = &ft_outline_move_to;
      funcs.line_to = &ft_outline_line_to;
      funcs.conic_to = &ft_outline_conic_to;
      funcs.cubic_to = &ft_outline_cubic_to;
      funcs.shift = 0;
      funcs.delta = 0;
      error_code = FT_Outline_Decompose(outline, &funcs, &datum);
      datum.close_current();

      if (error_code != 0)
        {
          COVERDRAWlog_warning("FT_Outline_Decompose failed with error " << error_code);
          return coverdraw::routine_fail;
        }
      return coverdraw::routine_success;
    }

  private:
    explicit
    PathCreator(coverdraw::Path *P):
      m_path(P),
      m_contour_open(false)
    {}

    void
    close_current(void)
    {
      if (m_contour_open)
        {
          m_path->close_contour();
          m_contour_open = false;
        }
    }

    static
    int
    ft_outline_move_to(const FT_Vector *pt, void *user)
    {
      PathCreator *p;
      p = static_cast<PathCreator*>(user);
      p->close_current();
      p->m_path->move(from_freetype(pt));
      p->m_contour_open = true;
      return 0;
    }

    static
    int
    ft_outline_line_to(const FT_Vector *pt, void *user)
    {
      PathCreator *p;
      p = static_cast<PathCreator*>(user);
      p->m_path->line_to(from_freetype(pt));
      return 0;
    }

    static
    int
    ft_outline_conic_to(const FT_Vector *control_pt,
                        const FT_Vector *pt, void *user)
    {
      PathCreator *p;
      p = static_cast<PathCreator*>(user);
      p->m_path->quadratic_to(from_freetype(control_pt), from_freetype(pt));
      return 0;
    }

    static
    int
    ft_outline_cubic_to(const FT_Vector *control_pt0,
                        const FT_Vector *control_pt1,
                        const FT_Vector *pt, void *user)
    {
      PathCreator *p;
      p = static_cast<PathCreator*>(user);
      p->m_path->cubic_to(from_freetype(control_pt0),
                          from_freetype(control_pt1),
                          from_freetype(pt));
      return 0;
    }

    coverdraw::Path *m_path;
    bool m_contour_open;
  };

  class FontFreeTypePrivate
  {
  public:
    FontFreeTypePrivate(const coverdraw::reference_counted_ptr<coverdraw::FreeTypeFace::GeneratorBase> &generator,
                        coverdraw::reference_counted_ptr<coverdraw::FreeTypeLib> lib);

    enum coverdraw::return_code
    load_glyph(FT_Face face, uint32_t glyph_code, unsigned int pixel_size);

    coverdraw::reference_counted_ptr<coverdraw::FreeTypeFace::GeneratorBase> m_generator;
    coverdraw::reference_counted_ptr<coverdraw::FreeTypeLib> m_lib;
    coverdraw::reference_counted_ptr<coverdraw::FreeTypeFace> m_face;
    unsigned int m_number_glyphs;
  };
}

//////////////////////////////////////////////////
// FontFreeTypePrivate methods
FontFreeTypePrivate::
FontFreeTypePrivate(const coverdraw::reference_counted_ptr<coverdraw::FreeTypeFace::GeneratorBase> &generator,
                    coverdraw::reference_counted_ptr<coverdraw::FreeTypeLib> lib):
  m_generator(generator),
  m_lib(lib),
  m_number_glyphs(0)
{
  if (!m_lib)
    {
      m_lib = COVERDRAWnew coverdraw::FreeTypeLib();
    }

  if (m_generator)
    {
      m_face = m_generator->create_face(m_lib);
    }

  if (m_face)
    {
      m_number_glyphs = m_face->face()->num_glyphs;
      FT_Set_Transform(m_face->face(), nullptr, nullptr);
    }
  else
    {
      COVERDRAWlog_warning("FontFreeType created without a face");
    }
}

enum coverdraw::return_code
FontFreeTypePrivate::
load_glyph(FT_Face face, uint32_t glyph_code, unsigned int pixel_size)
{
  FT_Error error_code;

  if (glyph_code >= m_number_glyphs)
    {
      COVERDRAWlog_warning("Glyph code " << glyph_code << " out of range, font has "
                           << m_number_glyphs << " glyphs");
      return coverdraw::routine_fail;
    }

  if (pixel_size == 0)
    {
      COVERDRAWlog_warning("Glyph " << glyph_code << " requested at pixel size 0");
      return coverdraw::routine_fail;
    }

  error_code = FT_Set_Pixel_Sizes(face, pixel_size, pixel_size);
  if (error_code != 0)
    {
      COVERDRAWlog_warning("FT_Set_Pixel_Sizes(" << pixel_size
                           << ") failed with error " << error_code);
      return coverdraw::routine_fail;
    }

  error_code = FT_Load_Glyph(face, glyph_code, FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP);
  if (error_code != 0)
    {
      COVERDRAWlog_warning("FT_Load_Glyph(" << glyph_code
                           << ") failed with error " << error_code);
      return coverdraw::routine_fail;
    }

  return coverdraw::routine_success;
}

///////////////////////////////////////////
// coverdraw::FontFreeType methods
coverdraw::FontFreeType::
FontFreeType(const reference_counted_ptr<FreeTypeFace::GeneratorBase> &face_generator,
             const reference_counted_ptr<FreeTypeLib> &lib)
{
  m_d = COVERDRAWnew FontFreeTypePrivate(face_generator, lib);
}

coverdraw::FontFreeType::
~FontFreeType()
{
  FontFreeTypePrivate *d;
  d = static_cast<FontFreeTypePrivate*>(m_d);
  COVERDRAWdelete(d);
}

bool
coverdraw::FontFreeType::
valid(void) const
{
  FontFreeTypePrivate *d;
  d = static_cast<FontFreeTypePrivate*>(m_d);
  return bool(d->m_face);
}

unsigned int
coverdraw::FontFreeType::
number_glyphs(void) const
{
  FontFreeTypePrivate *d;
  d = static_cast<FontFreeTypePrivate*>(m_d);
  return d->m_number_glyphs;
}

const coverdraw::reference_counted_ptr<coverdraw::FreeTypeFace::GeneratorBase>&
coverdraw::FontFreeType::
face_generator(void) const
{
  FontFreeTypePrivate *d;
  d = static_cast<FontFreeTypePrivate*>(m_d);
  return d->m_generator;
}

const coverdraw::reference_counted_ptr<coverdraw::FreeTypeLib>&
coverdraw::FontFreeType::
lib(void) const
{
  FontFreeTypePrivate *d;
  d = static_cast<FontFreeTypePrivate*>(m_d);
  return d->m_lib;
}

uint32_t
coverdraw::FontFreeType::
glyph_code(uint32_t character_code) const
{
  FontFreeTypePrivate *d;
  d = static_cast<FontFreeTypePrivate*>(m_d);

  if (!d->m_face)
    {
      return 0u;
    }

  Mutex::Guard m(d->m_face->mutex());
  return FT_Get_Char_Index(d->m_face->face(), FT_ULong(character_code));
}

enum coverdraw::return_code
coverdraw::FontFreeType::
glyph_outline(uint32_t glyph_code, unsigned int pixel_size,
              Path *out_path) const
{
  FontFreeTypePrivate *d;
  d = static_cast<FontFreeTypePrivate*>(m_d);

  if (!d->m_face)
    {
      return routine_fail;
    }

  Mutex::Guard m(d->m_face->mutex());
  FT_Face face(d->m_face->face());
  if (d->load_glyph(face, glyph_code, pixel_size) == routine_fail)
    {
      return routine_fail;
    }

  if (face->glyph->format != FT_GLYPH_FORMAT_OUTLINE)
    {
      COVERDRAWlog_warning("Glyph " << glyph_code << " is not an outline");
      return routine_fail;
    }

  return PathCreator::decompose_to_path(&face->glyph->outline, out_path);
}

coverdraw::GlyphMetrics
coverdraw::FontFreeType::
glyph_metrics(uint32_t glyph_code, unsigned int pixel_size) const
{
  FontFreeTypePrivate *d;
  GlyphMetrics return_value;

  d = static_cast<FontFreeTypePrivate*>(m_d);

  if (!d->m_face)
    {
      return return_value;
    }

  Mutex::Guard m(d->m_face->mutex());
  FT_Face face(d->m_face->face());
  if (d->load_glyph(face, glyph_code, pixel_size) == routine_fail)
    {
      return return_value;
    }

  const FT_Glyph_Metrics &gm(face->glyph->metrics);

  /* linearHoriAdvance is a 16.16 value that is not rounded */
  return_value.m_advance = vec2(static_cast<float>(face->glyph->linearHoriAdvance) / 65536.0f,
                                0.0f);
  return_value.m_offset = vec2(static_cast<float>(gm.horiBearingX) / 64.0f,
                               -static_cast<float>(gm.horiBearingY) / 64.0f);
  return_value.m_size = vec2(static_cast<float>(gm.width) / 64.0f,
                             static_cast<float>(gm.height) / 64.0f);
  return return_value;
}
