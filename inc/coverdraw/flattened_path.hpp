/*!
 * \file flattened_path.hpp
 * \brief file flattened_path.hpp
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

#include <vector>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/vecN.hpp>
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/rect.hpp>

namespace coverdraw {

/*!\addtogroup Paths
 * @{
 */

/*!
 * \brief
 * A FlattenedPath is a list of polygons, each polygon an
 * ordered sequence of points joined by line segments.
 * A closed polygon is implicitely connected from its last
 * point back to its first point. FlattenedPath values are
 * what the rasterizer consumes; they are produced by
 * Path::flatten(), StrokedPath::create() or built directly
 * with add_polygon().
 */
class FlattenedPath
{
public:
  /*!
   * Ctor, initializes as empty.
   */
  FlattenedPath(void);

  /*!
   * Copy ctor.
   * \param obj value from which to copy
   */
  FlattenedPath(const FlattenedPath &obj);

  ~FlattenedPath();

  /*!
   * Assignment operator
   * \param rhs value from which to copy
   */
  FlattenedPath&
  operator=(const FlattenedPath &rhs);

  /*!
   * Swap operation
   * \param obj object with which to swap
   */
  void
  swap(FlattenedPath &obj);

  /*!
   * Add a polygon.
   * \param pts points of the polygon, values are copied
   * \param closed if true, the polygon has an edge from its
   *               last point to its first point
   */
  FlattenedPath&
  add_polygon(c_array<const vec2> pts, bool closed = true);

  /*!
   * Provided as a conveniance, equivalent to
   * \code
   * add_polygon(make_c_array(pts), closed);
   * \endcode
   */
  FlattenedPath&
  add_polygon(const std::vector<vec2> &pts, bool closed = true)
  {
    return add_polygon(make_c_array(pts), closed);
  }

  /*!
   * Add all the polygons of another FlattenedPath.
   */
  FlattenedPath&
  add_polygons(const FlattenedPath &obj);

  /*!
   * Remove all polygons.
   */
  void
  clear(void);

  /*!
   * Returns the number of polygons.
   */
  unsigned int
  number_polygons(void) const;

  /*!
   * Returns the points of the named polygon.
   * \param I index of polygon with 0 <= I < number_polygons()
   */
  c_array<const vec2>
  polygon(unsigned int I) const;

  /*!
   * Returns true if the named polygon is closed.
   * \param I index of polygon with 0 <= I < number_polygons()
   */
  bool
  closed(unsigned int I) const;

  /*!
   * Returns the total number of points over all polygons.
   */
  unsigned int
  number_points(void) const;

  /*!
   * Returns true if there are no points.
   */
  bool
  empty(void) const;

  /*!
   * Computes the bounding box of all points. Returns
   * false if there are no points.
   * \param out_bb (output) location to which to write
   *               the bounding box
   */
  bool
  bounding_box(Rect *out_bb) const;

  /*!
   * Translate every point.
   */
  FlattenedPath&
  translate(const vec2 &tr);

  /*!
   * Scale every point about the origin.
   */
  FlattenedPath&
  scale(float s);

private:
  void *m_d;
};

/*! @} */

}
