/*!
 * \file coverage_map.cpp
 * \brief file coverage_map.cpp
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

#include <coverdraw/raster/coverage_map.hpp>
#include <private/util_private.hpp>

namespace
{
  class CoverageMapPrivate
  {
  public:
    CoverageMapPrivate(const coverdraw::ivec2 &origin, int width, int height,
                       const coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator> &allocator):
      m_origin(origin),
      m_width(width),
      m_height(height),
      m_values(allocator, static_cast<size_t>(width) * static_cast<size_t>(height), 0.0f)
    {}

    coverdraw::ivec2 m_origin;
    int m_width, m_height;
    coverdraw::ScratchBuffer<float> m_values;
  };
}

/////////////////////////////////////
// coverdraw::CoverageMap methods
coverdraw::CoverageMap::
CoverageMap(const ivec2 &origin, int width, int height,
            const reference_counted_ptr<ScratchAllocator> &allocator)
{
  COVERDRAWrequire(width >= 0 && height >= 0, "CoverageMap dimensions must be non-negative");
  COVERDRAWrequire(allocator.get() != nullptr, "CoverageMap requires an allocator");
  m_d = COVERDRAWnew CoverageMapPrivate(origin, width, height, allocator);
}

coverdraw::CoverageMap::
~CoverageMap()
{
  CoverageMapPrivate *d;
  d = static_cast<CoverageMapPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

get_implement(coverdraw::CoverageMap, CoverageMapPrivate, const coverdraw::ivec2&, origin)
get_implement(coverdraw::CoverageMap, CoverageMapPrivate, int, width)
get_implement(coverdraw::CoverageMap, CoverageMapPrivate, int, height)

bool
coverdraw::CoverageMap::
empty(void) const
{
  CoverageMapPrivate *d;
  d = static_cast<CoverageMapPrivate*>(m_d);
  return d->m_width == 0 || d->m_height == 0;
}

coverdraw::IRect
coverdraw::CoverageMap::
bounds(void) const
{
  CoverageMapPrivate *d;
  IRect R;

  d = static_cast<CoverageMapPrivate*>(m_d);
  R.min_point(d->m_origin);
  R.size(d->m_width, d->m_height);
  return R;
}

coverdraw::c_array<float>
coverdraw::CoverageMap::
row(int r)
{
  CoverageMapPrivate *d;
  d = static_cast<CoverageMapPrivate*>(m_d);

  COVERDRAWassert(r >= 0 && r < d->m_height);
  if (d->m_width == 0)
    {
      return c_array<float>();
    }
  return d->m_values.data().sub_array(r * d->m_width, d->m_width);
}

coverdraw::c_array<const float>
coverdraw::CoverageMap::
row(int r) const
{
  CoverageMapPrivate *d;
  d = static_cast<CoverageMapPrivate*>(m_d);

  COVERDRAWassert(r >= 0 && r < d->m_height);
  if (d->m_width == 0)
    {
      return c_array<const float>();
    }
  return d->m_values.data().sub_array(r * d->m_width, d->m_width);
}

float
coverdraw::CoverageMap::
value(int c, int r) const
{
  CoverageMapPrivate *d;
  d = static_cast<CoverageMapPrivate*>(m_d);

  if (c < 0 || r < 0 || c >= d->m_width || r >= d->m_height)
    {
      return 0.0f;
    }
  return d->m_values.data()[r * d->m_width + c];
}
