/*!
 * \file drawing_operation.hpp
 * \brief file drawing_operation.hpp
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

#include <coverdraw/util/util.hpp>
#include <coverdraw/util/vecN.hpp>
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/brush/brush.hpp>
#include <coverdraw/raster/coverage_map.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * \brief
   * A DrawingOperation is a request to blend a Brush into a
   * frame weighted by a CoverageMap placed at an origin.
   * Operations are composited by ascending render pass, and
   * operations of the same render pass in the order given.
   */
  class DrawingOperation
  {
  public:
    DrawingOperation(void):
      m_origin(0, 0),
      m_render_pass(0)
    {}

    /*!
     * Ctor, places the coverage at its own origin.
     * \param brush value with which to initialize \ref m_brush
     * \param coverage value with which to initialize \ref m_coverage
     * \param render_pass value with which to initialize \ref m_render_pass
     */
    DrawingOperation(const reference_counted_ptr<const Brush> &brush,
                     const reference_counted_ptr<const CoverageMap> &coverage,
                     int render_pass = 0):
      m_brush(brush),
      m_coverage(coverage),
      m_origin(coverage ? coverage->origin() : ivec2(0, 0)),
      m_render_pass(render_pass)
    {}

    /*!
     * Ctor.
     * \param brush value with which to initialize \ref m_brush
     * \param coverage value with which to initialize \ref m_coverage
     * \param origin value with which to initialize \ref m_origin
     * \param render_pass value with which to initialize \ref m_render_pass
     */
    DrawingOperation(const reference_counted_ptr<const Brush> &brush,
                     const reference_counted_ptr<const CoverageMap> &coverage,
                     const ivec2 &origin, int render_pass):
      m_brush(brush),
      m_coverage(coverage),
      m_origin(origin),
      m_render_pass(render_pass)
    {}

    /*!
     * Brush to blend.
     */
    reference_counted_ptr<const Brush> m_brush;

    /*!
     * Coverage weighting the blend.
     */
    reference_counted_ptr<const CoverageMap> m_coverage;

    /*!
     * Location in the frame of the element (0, 0) of
     * \ref m_coverage; this may differ from the origin
     * of the map when one map is drawn at several places.
     */
    ivec2 m_origin;

    /*!
     * Render pass of the operation.
     */
    int m_render_pass;
  };

/*! @} */
}
