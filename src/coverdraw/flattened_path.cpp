/*!
 * \file flattened_path.cpp
 * \brief file flattened_path.cpp
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

#include <vector>
#include <coverdraw/flattened_path.hpp>
#include <private/util_private.hpp>
#include <private/bounding_box.hpp>

namespace
{
  class Polygon
  {
  public:
    /* range into FlattenedPathPrivate::m_pts */
    coverdraw::range_type<unsigned int> m_range;
    bool m_closed;
  };

  class FlattenedPathPrivate
  {
  public:
    std::vector<coverdraw::vec2> m_pts;
    std::vector<Polygon> m_polygons;
  };
}

//////////////////////////////////////////
// coverdraw::FlattenedPath methods
coverdraw::FlattenedPath::
FlattenedPath(void)
{
  m_d = COVERDRAWnew FlattenedPathPrivate();
}

copy_ctor(coverdraw::FlattenedPath, FlattenedPath, FlattenedPathPrivate)

assign_swap_implement(coverdraw::FlattenedPath)

coverdraw::FlattenedPath::
~FlattenedPath()
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

coverdraw::FlattenedPath&
coverdraw::FlattenedPath::
add_polygon(c_array<const vec2> pts, bool closed)
{
  FlattenedPathPrivate *d;
  Polygon P;

  d = static_cast<FlattenedPathPrivate*>(m_d);
  P.m_range.m_begin = d->m_pts.size();
  d->m_pts.insert(d->m_pts.end(), pts.begin(), pts.end());
  P.m_range.m_end = d->m_pts.size();
  P.m_closed = closed;
  d->m_polygons.push_back(P);

  return *this;
}

coverdraw::FlattenedPath&
coverdraw::FlattenedPath::
add_polygons(const FlattenedPath &obj)
{
  FlattenedPathPrivate *obj_d;

  obj_d = static_cast<FlattenedPathPrivate*>(obj.m_d);
  for (unsigned int i = 0, endi = obj_d->m_polygons.size(); i < endi; ++i)
    {
      /* the polygon is fetched before adding since
       * obj may be this object.
       */
      std::vector<vec2> pts(obj.polygon(i).begin(), obj.polygon(i).end());
      add_polygon(pts, obj.closed(i));
    }
  return *this;
}

void
coverdraw::FlattenedPath::
clear(void)
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);
  d->m_pts.clear();
  d->m_polygons.clear();
}

unsigned int
coverdraw::FlattenedPath::
number_polygons(void) const
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);
  return d->m_polygons.size();
}

coverdraw::c_array<const coverdraw::vec2>
coverdraw::FlattenedPath::
polygon(unsigned int I) const
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);

  COVERDRAWassert(I < d->m_polygons.size());
  return make_c_array(d->m_pts).sub_array(d->m_polygons[I].m_range.m_begin,
                                          d->m_polygons[I].m_range.difference());
}

bool
coverdraw::FlattenedPath::
closed(unsigned int I) const
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);

  COVERDRAWassert(I < d->m_polygons.size());
  return d->m_polygons[I].m_closed;
}

unsigned int
coverdraw::FlattenedPath::
number_points(void) const
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);
  return d->m_pts.size();
}

bool
coverdraw::FlattenedPath::
empty(void) const
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);
  return d->m_pts.empty();
}

bool
coverdraw::FlattenedPath::
bounding_box(Rect *out_bb) const
{
  FlattenedPathPrivate *d;
  BoundingBox bb;

  d = static_cast<FlattenedPathPrivate*>(m_d);
  bb.add(d->m_pts.begin(), d->m_pts.end());
  return bb.get(out_bb);
}

coverdraw::FlattenedPath&
coverdraw::FlattenedPath::
translate(const vec2 &tr)
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);
  for (vec2 &p : d->m_pts)
    {
      p += tr;
    }
  return *this;
}

coverdraw::FlattenedPath&
coverdraw::FlattenedPath::
scale(float s)
{
  FlattenedPathPrivate *d;
  d = static_cast<FlattenedPathPrivate*>(m_d);
  for (vec2 &p : d->m_pts)
    {
      p *= s;
    }
  return *this;
}
