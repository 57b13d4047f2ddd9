/*!
 * \file glyph_source.hpp
 * \brief file glyph_source.hpp
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
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/path.hpp>
#include <coverdraw/text/glyph_metrics.hpp>

namespace coverdraw
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A GlyphSource is the interface through which glyph
   * outlines and metrics are fetched. Each GlyphSource
   * is given a unique value at construction, font_id(),
   * that is used to key cached glyph data.
   *
   * The methods of a GlyphSource may be called from
   * several threads at the same time; implementations
   * must be thread safe.
   */
  class GlyphSource:public reference_counted<GlyphSource>::concurrent
  {
  public:
    GlyphSource(void);

    virtual
    ~GlyphSource()
    {}

    /*!
     * Returns the unique ID of this GlyphSource.
     */
    uint32_t
    font_id(void) const
    {
      return m_font_id;
    }

    /*!
     * To be implemented by a derived class to return the
     * glyph code of a character code; returns 0 (the
     * missing glyph) if the character has no glyph.
     * \param character_code character code (Unicode)
     */
    virtual
    uint32_t
    glyph_code(uint32_t character_code) const = 0;

    /*!
     * To be implemented by a derived class to add the
     * outline of a glyph to a Path as closed contours.
     * The outline is in pixels, relative to the pen
     * position on the baseline with y pointing down.
     * Returns routine_fail if the outline could not
     * be produced.
     * \param glyph_code glyph code of the glyph
     * \param pixel_size pixel size at which to produce the outline
     * \param out_path (output) Path to which to add the contours
     */
    virtual
    enum return_code
    glyph_outline(uint32_t glyph_code, unsigned int pixel_size,
                  Path *out_path) const = 0;

    /*!
     * To be implemented by a derived class to return the
     * metrics of a glyph; if the metrics are not available
     * a GlyphMetrics with all values zero is returned.
     * \param glyph_code glyph code of the glyph
     * \param pixel_size pixel size at which to compute the metrics
     */
    virtual
    GlyphMetrics
    glyph_metrics(uint32_t glyph_code, unsigned int pixel_size) const = 0;

  private:
    uint32_t m_font_id;
  };
/*! @} */
}
