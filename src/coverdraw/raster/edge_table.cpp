/*!
 * \file edge_table.cpp
 * \brief file edge_table.cpp
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
#include <coverdraw/raster/edge_table.hpp>
#include <coverdraw/util/math.hpp>
#include <private/util_private.hpp>

namespace
{
  /* Edge stored with m_y_min < m_y_max; m_x is the x-coordinate
   * at m_y_min and m_dxdy the change of x per unit of y.
   */
  class Edge
  {
  public:
    Edge(const coverdraw::vec2 &p0, const coverdraw::vec2 &p1)
    {
      const coverdraw::vec2 *lo, *hi;

      if (p1.y() > p0.y())
        {
          lo = &p0;
          hi = &p1;
          m_winding = 1;
        }
      else
        {
          lo = &p1;
          hi = &p0;
          m_winding = -1;
        }

      m_x = lo->x();
      m_y_min = lo->y();
      m_y_max = hi->y();
      m_dxdy = (hi->x() - lo->x()) / (hi->y() - lo->y());
    }

    bool
    operator<(const Edge &rhs) const
    {
      return m_y_min < rhs.m_y_min;
    }

    float
    x_at(float y) const
    {
      return m_x + (y - m_y_min) * m_dxdy;
    }

    float m_x, m_dxdy;
    float m_y_min, m_y_max;
    int m_winding;
  };

  class EdgeTablePrivate
  {
  public:
    EdgeTablePrivate(const coverdraw::FlattenedPath &path, bool close_open_polygons);

    void
    add_edge(const coverdraw::vec2 &p0, const coverdraw::vec2 &p1);

    /* sorted by Edge::m_y_min */
    std::vector<Edge> m_edges;
    coverdraw::range_type<float> m_y_extent;
  };
}

/////////////////////////////////
// EdgeTablePrivate methods
EdgeTablePrivate::
EdgeTablePrivate(const coverdraw::FlattenedPath &path, bool close_open_polygons):
  m_y_extent(0.0f, 0.0f)
{
  for (unsigned int p = 0, endp = path.number_polygons(); p < endp; ++p)
    {
      coverdraw::c_array<const coverdraw::vec2> pts(path.polygon(p));

      if (pts.size() < 2)
        {
          continue;
        }

      for (unsigned int i = 0; i + 1 < pts.size(); ++i)
        {
          add_edge(pts[i], pts[i + 1]);
        }

      if (close_open_polygons || path.closed(p))
        {
          add_edge(pts.back(), pts.front());
        }
    }

  /* stable so that edges with the same minimum y stay
   * in the order of the polygons.
   */
  std::stable_sort(m_edges.begin(), m_edges.end());
  for (unsigned int i = 0; i < m_edges.size(); ++i)
    {
      if (i == 0)
        {
          m_y_extent.m_begin = m_edges[i].m_y_min;
          m_y_extent.m_end = m_edges[i].m_y_max;
        }
      else
        {
          m_y_extent.m_begin = coverdraw::t_min(m_y_extent.m_begin, m_edges[i].m_y_min);
          m_y_extent.m_end = coverdraw::t_max(m_y_extent.m_end, m_edges[i].m_y_max);
        }
    }
}

void
EdgeTablePrivate::
add_edge(const coverdraw::vec2 &p0, const coverdraw::vec2 &p1)
{
  /* horizontal and zero-length edges never cross a scan line
   * under the half-open rule.
   */
  if (p0.y() != p1.y())
    {
      m_edges.push_back(Edge(p0, p1));
    }
}

/////////////////////////////////
// coverdraw::EdgeTable methods
coverdraw::EdgeTable::
EdgeTable(const FlattenedPath &path, bool close_open_polygons)
{
  m_d = COVERDRAWnew EdgeTablePrivate(path, close_open_polygons);
}

coverdraw::EdgeTable::
~EdgeTable()
{
  EdgeTablePrivate *d;
  d = static_cast<EdgeTablePrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

unsigned int
coverdraw::EdgeTable::
number_edges(void) const
{
  EdgeTablePrivate *d;
  d = static_cast<EdgeTablePrivate*>(m_d);
  return d->m_edges.size();
}

coverdraw::range_type<float>
coverdraw::EdgeTable::
y_extent(void) const
{
  EdgeTablePrivate *d;
  d = static_cast<EdgeTablePrivate*>(m_d);
  return d->m_y_extent;
}

unsigned int
coverdraw::EdgeTable::
crossings(float y, std::vector<Crossing> *out_crossings) const
{
  EdgeTablePrivate *d;

  d = static_cast<EdgeTablePrivate*>(m_d);
  out_crossings->clear();
  for (const Edge &E : d->m_edges)
    {
      if (E.m_y_min > y)
        {
          break;
        }

      if (y < E.m_y_max)
        {
          out_crossings->push_back(Crossing(E.x_at(y), E.m_winding));
        }
    }

  std::stable_sort(out_crossings->begin(), out_crossings->end());
  return out_crossings->size();
}

unsigned int
coverdraw::EdgeTable::
spans(float y, enum RasterEnums::fill_rule_t fill_rule,
      std::vector<Span> *out_spans) const
{
  return spans(y, CustomFillRuleFunction(fill_rule), out_spans);
}

unsigned int
coverdraw::EdgeTable::
spans(float y, const CustomFillRuleBase &fill_rule,
      std::vector<Span> *out_spans) const
{
  std::vector<Crossing> work_room;

  out_spans->clear();
  crossings(y, &work_room);
  spans_from_crossings(make_c_array(work_room), fill_rule, out_spans);
  return out_spans->size();
}

void
coverdraw::EdgeTable::
spans_from_crossings(c_array<const Crossing> crossings,
                     const CustomFillRuleBase &fill_rule,
                     std::vector<Span> *out_spans)
{
  int winding(0);
  bool inside(false);
  float enter(0.0f);

  COVERDRAWassert(!fill_rule(0));
  for (const Crossing &C : crossings)
    {
      bool now_inside;

      winding += C.m_winding;
      now_inside = fill_rule(winding);
      if (now_inside && !inside)
        {
          enter = C.m_x;
        }
      else if (!now_inside && inside)
        {
          out_spans->push_back(Span(enter, C.m_x));
        }
      inside = now_inside;
    }

  /* only reachable when open polygons are not closed */
  if (inside)
    {
      out_spans->push_back(Span(enter, crossings.back().m_x));
    }
}

void
coverdraw::
compute_spans(const FlattenedPath &path,
              enum RasterEnums::fill_rule_t fill_rule,
              float y, std::vector<Span> *out_spans)
{
  EdgeTable table(path);
  table.spans(y, fill_rule, out_spans);
}
