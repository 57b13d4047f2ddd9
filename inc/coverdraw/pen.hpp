/*!
 * \file pen.hpp
 * \brief file pen.hpp
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
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/raster/raster_enums.hpp>
#include <coverdraw/brush/brush.hpp>

namespace coverdraw
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * A Pen specifies how to stroke a path: the Brush to draw
   * the stroke with, the width of the stroke, how segments are
   * joined, how open contours end and an optional dash pattern.
   */
  class Pen
  {
  public:
    /*!
     * Ctor. Initializes as solid (no dashes) with
     * join_style() = RasterEnums::miter_joins,
     * cap_style() = RasterEnums::flat_caps and
     * miter_limit() = 4.
     * \param brush brush with which to draw the stroke
     * \param width width of the stroke, must be positive
     */
    explicit
    Pen(const reference_counted_ptr<const Brush> &brush, float width = 1.0f);

    /*!
     * Copy ctor.
     * \param obj value from which to copy
     */
    Pen(const Pen &obj);

    ~Pen();

    /*!
     * Assignment operator.
     * \param rhs value from which to copy
     */
    Pen&
    operator=(const Pen &rhs);

    /*!
     * Swap operation
     * \param obj object with which to swap
     */
    void
    swap(Pen &obj);

    /*!
     * Brush with which to draw the stroke.
     */
    const reference_counted_ptr<const Brush>&
    brush(void) const;

    /*!
     * Width of the stroke.
     */
    float
    width(void) const;

    /*!
     * Returns the dash pattern, alternating lengths of drawn and
     * skipped intervals in units of width(); an empty pattern
     * indicates a solid stroke.
     */
    c_array<const float>
    dash_pattern(void) const;

    /*!
     * Set the value returned by dash_pattern(void) const. Every
     * length must be non-negative and, unless the pattern is empty,
     * at least one length must be positive.
     */
    Pen&
    dash_pattern(c_array<const float> v);

    /*!
     * Returns true if dash_pattern() is not empty.
     */
    bool
    dashed(void) const;

    /*!
     * How consecutive segments are joined.
     */
    enum RasterEnums::join_style
    join_style(void) const;

    /*!
     * Set the value returned by join_style(void) const.
     */
    Pen&
    join_style(enum RasterEnums::join_style v);

    /*!
     * How the ends of open contours and dashes are drawn.
     */
    enum RasterEnums::cap_style
    cap_style(void) const;

    /*!
     * Set the value returned by cap_style(void) const.
     */
    Pen&
    cap_style(enum RasterEnums::cap_style v);

    /*!
     * Maximum ratio of the miter length to half the width;
     * a miter join exceeding it is drawn as a bevel join.
     */
    float
    miter_limit(void) const;

    /*!
     * Set the value returned by miter_limit(void) const,
     * must be positive.
     */
    Pen&
    miter_limit(float v);

  private:
    void *m_d;
  };

/*! @} */
}
