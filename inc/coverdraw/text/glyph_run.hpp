/*!
 * \file glyph_run.hpp
 * \brief file glyph_run.hpp
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


#pragma once

#include <stdint.h>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/vecN.hpp>
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/text/glyph_source.hpp>

namespace coverdraw
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A GlyphRun is a sequence of glyphs of a single GlyphSource
   * at a single pixel size, each glyph placed at a pen position
   * on the baseline. Positions are in pixels and need not be
   * at integer locations.
   */
  class GlyphRun
  {
  public:
    /*!
     * Ctor.
     * \param source GlyphSource of the glyphs, must not be nullptr
     * \param pixel_size pixel size of the glyphs, must be positive
     */
    GlyphRun(const reference_counted_ptr<const GlyphSource> &source,
             unsigned int pixel_size);

    /*!
     * Copy ctor.
     * \param obj value from which to copy
     */
    GlyphRun(const GlyphRun &obj);

    ~GlyphRun();

    /*!
     * Assignment operator
     * \param rhs value from which to copy
     */
    GlyphRun&
    operator=(const GlyphRun &rhs);

    /*!
     * Swap operation
     * \param obj object with which to swap
     */
    void
    swap(GlyphRun &obj);

    /*!
     * Returns the GlyphSource of the glyphs.
     */
    const reference_counted_ptr<const GlyphSource>&
    source(void) const;

    /*!
     * Returns the pixel size of the glyphs.
     */
    unsigned int
    pixel_size(void) const;

    /*!
     * Add a glyph.
     * \param glyph_code glyph code of the glyph within source()
     * \param position pen position of the glyph
     */
    GlyphRun&
    add_glyph(uint32_t glyph_code, const vec2 &position);

    /*!
     * Lays out a sequence of character codes left to right,
     * advancing the pen by the advance of each glyph; returns
     * the pen position after the last glyph.
     * \param character_codes character codes (Unicode) to add
     * \param pen pen position of the first glyph
     */
    vec2
    add_text(c_array<const uint32_t> character_codes, vec2 pen);

    /*!
     * Provided as a conveniance, lays out a string whose bytes
     * are taken as Latin-1 character codes.
     * \param text nul-terminated string
     * \param pen pen position of the first glyph
     */
    vec2
    add_text(c_string text, vec2 pen);

    /*!
     * Returns the number of glyphs of the run.
     */
    unsigned int
    number_glyphs(void) const;

    /*!
     * Returns the glyph code of the named glyph.
     * \param I index of glyph with 0 <= I < number_glyphs()
     */
    uint32_t
    glyph_code(unsigned int I) const;

    /*!
     * Returns the pen position of the named glyph.
     * \param I index of glyph with 0 <= I < number_glyphs()
     */
    const vec2&
    position(unsigned int I) const;

    /*!
     * Remove all glyphs.
     */
    void
    clear(void);

  private:
    void *m_d;
  };
/*! @} */
}
