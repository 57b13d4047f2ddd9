/*!
 * \file colorstop.hpp
 * \brief file colorstop.hpp
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

namespace coverdraw
{
/*!\addtogroup Brushes
 * @{
 */

  /*!
   * \brief
   * Color of a gradient at a position along the gradient,
   * the position being 0 at the start point and 1 at the
   * end point.
   */
  class ColorStop
  {
  public:
    ColorStop(void):
      m_color(0.0f, 0.0f, 0.0f, 0.0f),
      m_place(0.0f)
    {}

    ColorStop(const vec4 &c, float p):
      m_color(c),
      m_place(p)
    {}

    /*!
     * Orders by m_place.
     */
    bool
    operator<(const ColorStop &rhs) const
    {
      return m_place < rhs.m_place;
    }

    /*!
     * Non-premultiplied RGBA.
     */
    vec4 m_color;

    /*!
     * Position of the stop.
     */
    float m_place;
  };

  /*!
   * \brief
   * The stops of a gradient, kept sorted by position; stops
   * sharing a position keep the order in which they were added.
   */
  class ColorStopArray:noncopyable
  {
  public:
    ColorStopArray(void);

    ~ColorStopArray();

    /*!
     * Adds a stop, stops may be added in any order.
     */
    void
    add(const ColorStop &c);

    /*!
     * Removes all stops.
     */
    void
    clear(void);

    /*!
     * The stops sorted by ColorStop::m_place.
     */
    c_array<const ColorStop>
    values(void) const;

    /*!
     * Linearly interpolates the color at q between the two
     * stops around q. Positions before the first stop give its
     * color, positions past the last stop give the color of the
     * last stop. Throws std::invalid_argument if there are no
     * stops.
     */
    vec4
    color(float q) const;

  private:
    void *m_d;
  };

/*! @} */
}
