/*!
 * \file glyph_metrics.hpp
 * \brief file glyph_metrics.hpp
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

#include <coverdraw/util/vecN.hpp>

namespace coverdraw
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A GlyphMetrics provides information on the metrics
   * of a glyph at a pixel size. All values are in pixels
   * with the y-axis pointing down, relative to the pen
   * position on the baseline.
   */
  class GlyphMetrics
  {
  public:
    /*!
     * Ctor, initializes all values as zero.
     */
    GlyphMetrics(void):
      m_advance(0.0f, 0.0f),
      m_offset(0.0f, 0.0f),
      m_size(0.0f, 0.0f)
    {}

    /*!
     * How much to advance the pen after drawing the glyph.
     */
    vec2 m_advance;

    /*!
     * Offset from the pen to the top-left corner of the
     * box of the glyph.
     */
    vec2 m_offset;

    /*!
     * Size of the box of the glyph.
     */
    vec2 m_size;
  };
/*! @} */
}
