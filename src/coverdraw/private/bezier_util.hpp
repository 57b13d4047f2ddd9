/*!
 * \file bezier_util.hpp
 * \brief file bezier_util.hpp
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
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/vecN.hpp>

namespace coverdraw
{
  namespace detail
  {
    /*!
     * Split a bezier curve of any degree at t = 0.5 via de
     * Casteljau's algorithm.
     * \param pts control points of the curve, including the end points
     * \param out_front control points of the curve on [0, 0.5]
     * \param out_back control points of the curve on [0.5, 1]
     */
    inline
    void
    split_bezier(c_array<const vec2> pts,
                 std::vector<vec2> *out_front,
                 std::vector<vec2> *out_back)
    {
      std::vector<vec2> work(pts.begin(), pts.end());
      const unsigned int n(pts.size());

      COVERDRAWassert(n >= 2);
      out_front->resize(n);
      out_back->resize(n);

      for (unsigned int level = 0; level < n; ++level)
        {
          (*out_front)[level] = work[0];
          (*out_back)[n - 1 - level] = work[n - 1 - level];
          for (unsigned int i = 0; i + 1 < n - level; ++i)
            {
              work[i] = (work[i] + work[i + 1]) * 0.5f;
            }
        }
    }

    /*!
     * Evaluate a bezier curve of any degree at t = 0.5.
     */
    inline
    vec2
    bezier_midpoint(c_array<const vec2> pts)
    {
      std::vector<vec2> work(pts.begin(), pts.end());

      COVERDRAWassert(!work.empty());
      for (unsigned int n = work.size(); n > 1; --n)
        {
          for (unsigned int i = 0; i + 1 < n; ++i)
            {
              work[i] = (work[i] + work[i + 1]) * 0.5f;
            }
        }
      return work[0];
    }
  }
}
