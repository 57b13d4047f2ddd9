/*!
 * \file colorstop.cpp
 * \brief file colorstop.cpp
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

#include <algorithm>
#include <vector>
#include <coverdraw/colorstop.hpp>
#include <private/util_private.hpp>

namespace
{
  class ColorStopArrayPrivate
  {
  public:
    ColorStopArrayPrivate(void):
      m_dirty(true)
    {}

    /* sorted lazily by values() */
    std::vector<coverdraw::ColorStop> m_values;
    bool m_dirty;
  };
}

/////////////////////////////////////
// coverdraw::ColorStopArray methods
coverdraw::ColorStopArray::
ColorStopArray(void):
  m_d(COVERDRAWnew ColorStopArrayPrivate())
{}

coverdraw::ColorStopArray::
~ColorStopArray()
{
  ColorStopArrayPrivate *d;
  d = static_cast<ColorStopArrayPrivate*>(m_d);
  COVERDRAWdelete(d);
}

void
coverdraw::ColorStopArray::
add(const ColorStop &c)
{
  ColorStopArrayPrivate *d;
  d = static_cast<ColorStopArrayPrivate*>(m_d);
  d->m_dirty = true;
  d->m_values.push_back(c);
}

void
coverdraw::ColorStopArray::
clear(void)
{
  ColorStopArrayPrivate *d;
  d = static_cast<ColorStopArrayPrivate*>(m_d);
  d->m_dirty = true;
  d->m_values.clear();
}

coverdraw::c_array<const coverdraw::ColorStop>
coverdraw::ColorStopArray::
values(void) const
{
  ColorStopArrayPrivate *d;
  d = static_cast<ColorStopArrayPrivate*>(m_d);
  if (d->m_dirty)
    {
      d->m_dirty = false;
      std::stable_sort(d->m_values.begin(), d->m_values.end());
    }
  return make_c_array(d->m_values);
}

coverdraw::vec4
coverdraw::ColorStopArray::
color(float q) const
{
  c_array<const ColorStop> stops(values());
  unsigned int K;

  COVERDRAWrequire(!stops.empty(), "color() requires at least one ColorStop");
  if (q <= stops.front().m_place)
    {
      return stops.front().m_color;
    }

  if (q >= stops.back().m_place)
    {
      return stops.back().m_color;
    }

  /* K is the first stop with place greater than q,
   * thus 1 <= K < stops.size().
   */
  K = std::upper_bound(stops.begin(), stops.end(), ColorStop(vec4(0.0f), q)) - stops.begin();
  const ColorStop &S(stops[K - 1]);
  const ColorStop &T(stops[K]);
  float delta(T.m_place - S.m_place), t;

  t = (delta > 0.0f) ? (q - S.m_place) / delta : 1.0f;
  return S.m_color * (1.0f - t) + T.m_color * t;
}
