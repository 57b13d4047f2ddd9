/*!
 * \file math.hpp
 * \brief file math.hpp
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

#include <math.h>
#include <stdlib.h>

namespace coverdraw
{
/*!\addtogroup Utility
 * @{
 */

/*!\def COVERDRAW_PI
 * pi as a float
 */
#define COVERDRAW_PI 3.14159265358979323846f

  /* float and int overloads of the C math functions,
   * so that geometry code never mixes in double
   */
  inline float t_sin(float x) { return ::sinf(x); }
  inline float t_cos(float x) { return ::cosf(x); }
  inline float t_acos(float x) { return ::acosf(x); }
  inline float t_atan2(float y, float x) { return ::atan2f(y, x); }
  inline float t_sqrt(float x) { return ::sqrtf(x); }
  inline float t_floor(float x) { return ::floorf(x); }
  inline float t_ceil(float x) { return ::ceilf(x); }
  inline float t_abs(float x) { return ::fabsf(x); }
  inline int t_abs(int x) { return ::abs(x); }

  template<typename T>
  inline
  const T&
  t_min(const T &a, const T &b)
  {
    return (b < a) ? b : a;
  }

  template<typename T>
  inline
  const T&
  t_max(const T &a, const T &b)
  {
    return (a < b) ? b : a;
  }

  /*!
   * Restricts v to [lo, hi], lo must not exceed hi.
   */
  template<typename T>
  inline
  T
  t_clamp(const T &v, const T &lo, const T &hi)
  {
    return t_min(hi, t_max(lo, v));
  }

  /*!
   * v modulo m as a value in [0, m), m must be positive;
   * used to repeat patterns and dash arrays.
   */
  inline
  int
  t_wrap(int v, int m)
  {
    int r(v % m);
    return (r < 0) ? r + m : r;
  }

/*! @} */
}
