/*!
 * \file util_private_ostream.hpp
 * \brief file util_private_ostream.hpp
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

#include <ostream>
#include <coverdraw/util/vecN.hpp>
#include <coverdraw/util/rect.hpp>

/* stream output of points and rectangles for the
 * COVERDRAWlog_ macros
 */
namespace coverdraw
{
  template<typename T, size_t N>
  std::ostream&
  operator<<(std::ostream &ostr, const vecN<T, N> &obj)
  {
    const char *sep("(");
    for (const T &v : obj)
      {
        ostr << sep << v;
        sep = ", ";
      }
    return ostr << ")";
  }

  template<typename T>
  std::ostream&
  operator<<(std::ostream &ostr, const RectT<T> &obj)
  {
    return ostr << obj.m_min_point << "-" << obj.m_max_point;
  }
}
