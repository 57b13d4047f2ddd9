/*!
 * \file coverage_map.hpp
 * \brief file coverage_map.hpp
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
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/rect.hpp>
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/scratch_allocator.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * \brief
   * A CoverageMap is a rectangle of coverage values in [0, 1]
   * placed at an integer origin in frame coordinates; element
   * (c, r) is the coverage of the pixel at origin() + (c, r).
   * A CoverageMap is shared by every DrawingOperation drawing
   * it and is not modified once rasterization completes.
   */
  class CoverageMap:
    public reference_counted<CoverageMap>::concurrent
  {
  public:
    /*!
     * Ctor, all values are initialized as 0.
     * Throws std::bad_alloc if allocation fails.
     * \param origin location of element (0, 0) in frame coordinates
     * \param width number of columns, non-negative
     * \param height number of rows, non-negative
     * \param allocator allocator from which to take the values
     */
    CoverageMap(const ivec2 &origin, int width, int height,
                const reference_counted_ptr<ScratchAllocator> &allocator
                = ScratchAllocator::default_allocator());

    ~CoverageMap();

    /*!
     * Location of element (0, 0) in frame coordinates.
     */
    const ivec2&
    origin(void) const;

    /*!
     * Number of columns.
     */
    int
    width(void) const;

    /*!
     * Number of rows.
     */
    int
    height(void) const;

    /*!
     * Returns true if width() or height() is 0.
     */
    bool
    empty(void) const;

    /*!
     * Returns the rectangle in frame coordinates covered
     * by the map, i.e. [origin, origin + (width, height)).
     */
    IRect
    bounds(void) const;

    /*!
     * Returns the values of a row.
     * \param r row with 0 <= r < height()
     */
    c_array<float>
    row(int r);

    /*!
     * Returns the values of a row.
     * \param r row with 0 <= r < height()
     */
    c_array<const float>
    row(int r) const;

    /*!
     * Returns the value at column c and row r; values
     * outside of the map are 0.
     */
    float
    value(int c, int r) const;

  private:
    void *m_d;
  };

/*! @} */
}
