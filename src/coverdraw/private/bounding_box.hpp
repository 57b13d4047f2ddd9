/*!
 * \file bounding_box.hpp
 * \brief file bounding_box.hpp
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
#include <coverdraw/util/rect.hpp>

namespace coverdraw
{
  /* Accumulates the axis aligned bounds of points; the
   * rectangle is meaningful only once a point is added.
   */
  class BoundingBox
  {
  public:
    BoundingBox(void):
      m_has_points(false)
    {}

    void
    add(const vec2 &p)
    {
      if (!m_has_points)
        {
          m_rect.m_min_point = m_rect.m_max_point = p;
          m_has_points = true;
          return;
        }

      for (int i = 0; i < 2; ++i)
        {
          take_min(p[i], m_rect.m_min_point[i]);
          take_max(p[i], m_rect.m_max_point[i]);
        }
    }

    template<typename iterator>
    void
    add(iterator begin, iterator end)
    {
      for (; begin != end; ++begin)
        {
          add(*begin);
        }
    }

    void
    add(const Rect &r)
    {
      add(r.m_min_point);
      add(r.m_max_point);
    }

    /* Writes the bounds to *out and returns true if
     * any point was added, otherwise *out is reset.
     */
    bool
    get(Rect *out) const
    {
      *out = m_has_points ? m_rect : Rect();
      return m_has_points;
    }

  private:
    /* a NaN coordinate sticks so that callers can reject the bounds */
    static
    void
    take_min(float v, float &dst)
    {
      if (v < dst || v != v)
        {
          dst = v;
        }
    }

    static
    void
    take_max(float v, float &dst)
    {
      if (v > dst || v != v)
        {
          dst = v;
        }
    }

    Rect m_rect;
    bool m_has_points;
  };
}
