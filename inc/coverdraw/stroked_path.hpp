/*!
 * \file stroked_path.hpp
 * \brief file stroked_path.hpp
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
#include <coverdraw/flattened_path.hpp>
#include <coverdraw/pen.hpp>
#include <coverdraw/path.hpp>

namespace coverdraw
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * StrokedPath expands the polygons of a FlattenedPath into
   * the closed polygons that cover the stroke of a Pen: one
   * quadrilateral per segment, one polygon per join and one
   * per cap. Each polygon is oriented to have positive signed
   * area so that filling the result with
   * RasterEnums::nonzero_fill_rule gives the union of the
   * pieces.
   */
  class StrokedPath
  {
  public:
    enum
      {
        /*!
         * Largest number of dash elements (drawn and skipped)
         * a dashed polyline is split into; a polyline needing
         * more is logged and stroked without dashes.
         */
        max_dash_elements = 65536
      };

    /*!
     * Create the polygons covering the stroke.
     * \param path polylines to stroke; a closed polygon also
     *             strokes the segment from its last point to its
     *             first point and has joins instead of caps
     * \param pen pen with which to stroke
     * \param tolerance maximum distance between the arcs of round
     *                  joins and caps and their polygons, must be
     *                  positive
     */
    static
    FlattenedPath
    create(const FlattenedPath &path, const Pen &pen,
           float tolerance = PathEnums::default_curve_tolerance());
  };

/*! @} */
}
