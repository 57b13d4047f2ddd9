/*!
 * \file rect.hpp
 * \brief file rect.hpp
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
#include <coverdraw/util/math.hpp>

namespace coverdraw
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * Class for describing an axis aligned rectangle; the
   * rectangle covers [min_x, max_x) x [min_y, max_y).
   */
  template<typename T>
  class RectT
  {
  public:
    /*!
     * Empty ctor; intializes both \ref m_min_point and
     * \ref m_max_point to (0, 0);
     */
    RectT(void):
      m_min_point(T(0), T(0)),
      m_max_point(T(0), T(0))
    {}

    /*!
     * Ctor from the four extents of the rectangle.
     */
    RectT(T pmin_x, T pmin_y, T pmax_x, T pmax_y):
      m_min_point(pmin_x, pmin_y),
      m_max_point(pmax_x, pmax_y)
    {}

    /*!
     * Copy ctor from different Rect type
     * \param rect value from which to copy
     */
    template<typename S>
    explicit
    RectT(const RectT<S> &rect):
      m_min_point(rect.m_min_point),
      m_max_point(rect.m_max_point)
    {}

    /*!
     * Set \ref m_min_point.
     */
    RectT&
    min_point(const vecN<T, 2> &p)
    {
      m_min_point = p;
      return *this;
    }

    /*!
     * Set \ref m_max_point.
     */
    RectT&
    max_point(const vecN<T, 2> &p)
    {
      m_max_point = p;
      return *this;
    }

    /*!
     * Returns the x-coordinate of \ref m_min_point.
     */
    T
    min_x(void) const { return m_min_point.x(); }

    /*!
     * Returns the y-coordinate of \ref m_min_point.
     */
    T
    min_y(void) const { return m_min_point.y(); }

    /*!
     * Returns the x-coordinate of \ref m_max_point.
     */
    T
    max_x(void) const { return m_max_point.x(); }

    /*!
     * Returns the y-coordinate of \ref m_max_point.
     */
    T
    max_y(void) const { return m_max_point.y(); }

    /*!
     * Translate the Rect, equivalent to
     * \code
     * m_min_point += tr;
     * m_max_point += tr;
     * \endcode
     * \param tr amount by which to translate
     */
    RectT&
    translate(const vecN<T, 2> &tr)
    {
      m_min_point += tr;
      m_max_point += tr;
      return *this;
    }

    /*!
     * Set the size of the rectangle leaving \ref m_min_point
     * unchanged.
     */
    RectT&
    size(T width, T height)
    {
      m_max_point.x() = m_min_point.x() + width;
      m_max_point.y() = m_min_point.y() + height;
      return *this;
    }

    /*!
     * Returns the size of the Rect; provided as
     * a conveniance and equivalent to
     * \code
     * m_max_point - m_min_point
     * \endcode
     */
    vecN<T, 2>
    size(void) const
    {
      return m_max_point - m_min_point;
    }

    /*!
     * Returns the width of the Rect, equivalent to
     * \code
     * m_max_point.x() - m_min_point.x()
     * \endcode
     */
    T
    width(void) const
    {
      return m_max_point.x() - m_min_point.x();
    }

    /*!
     * Returns the height of the Rect, equivalent to
     * \code
     * m_max_point.y() - m_min_point.y()
     * \endcode
     */
    T
    height(void) const
    {
      return m_max_point.y() - m_min_point.y();
    }

    /*!
     * Returns true if the rectangle covers no area.
     */
    bool
    empty(void) const
    {
      return !(m_min_point.x() < m_max_point.x())
        || !(m_min_point.y() < m_max_point.y());
    }

    /*!
     * Returns the intersection of this rectangle with
     * another; if they do not intersect, the returned
     * rectangle is empty().
     */
    RectT
    intersection(const RectT &rect) const
    {
      RectT R;

      R.m_min_point.x() = t_max(min_x(), rect.min_x());
      R.m_min_point.y() = t_max(min_y(), rect.min_y());
      R.m_max_point.x() = t_max(R.m_min_point.x(), t_min(max_x(), rect.max_x()));
      R.m_max_point.y() = t_max(R.m_min_point.y(), t_min(max_y(), rect.max_y()));
      return R;
    }

    /*!
     * Specifies the min-corner of the rectangle
     */
    vecN<T, 2> m_min_point;

    /*!
     * Specifies the max-corner of the rectangle.
     */
    vecN<T, 2> m_max_point;
  };

  /*!
   * Conveniance typedef for RectT<float>
   */
  typedef RectT<float> Rect;

  /*!
   * Conveniance typedef for RectT<int>
   */
  typedef RectT<int> IRect;

/*! @} */
}
