/*!
 * \file stroked_path.cpp
 * \brief file stroked_path.cpp
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

#include <stdint.h>
#include <vector>
#include <algorithm>
#include <coverdraw/stroked_path.hpp>
#include <coverdraw/util/math.hpp>
#include <coverdraw/util/log.hpp>
#include <private/util_private.hpp>

namespace
{
  /* Builds the polygons of a stroke into a FlattenedPath;
   * every polygon added has positive signed area.
   */
  class StrokeBuilder:coverdraw::noncopyable
  {
  public:
    StrokeBuilder(const coverdraw::Pen &pen, float tolerance,
                  coverdraw::FlattenedPath *dst);

    /* strokes a polyline without repeated points */
    void
    stroke_polyline(const std::vector<coverdraw::vec2> &pts, bool closed);

    /* strokes a polyline of one point; the caps are
     * oriented along dir.
     */
    void
    stroke_point(const coverdraw::vec2 &p, const coverdraw::vec2 &dir);

    /* splits the polyline by the dash pattern and strokes
     * each dash as an open polyline.
     */
    void
    stroke_dashed(const std::vector<coverdraw::vec2> &pts, bool closed);

  private:
    void
    add_polygon(std::vector<coverdraw::vec2> &pts);

    void
    add_segment(const coverdraw::vec2 &a, const coverdraw::vec2 &b);

    void
    add_join(const coverdraw::vec2 &v, const coverdraw::vec2 &d0, const coverdraw::vec2 &d1);

    void
    add_cap(const coverdraw::vec2 &p, const coverdraw::vec2 &dir);

    void
    add_circle(const coverdraw::vec2 &center);

    void
    flush_dash(std::vector<coverdraw::vec2> &piece, const coverdraw::vec2 &dir);

    /* distance along the polyline at which dash element k starts */
    double
    dash_boundary(uint64_t k) const;

    float m_half_width;
    enum coverdraw::RasterEnums::join_style m_join_style;
    enum coverdraw::RasterEnums::cap_style m_cap_style;
    float m_miter_limit;
    unsigned int m_circle_points;
    std::vector<float> m_dash_lengths;
    std::vector<double> m_dash_offsets;
    double m_dash_period;
    coverdraw::FlattenedPath *m_dst;
    std::vector<coverdraw::vec2> m_work_room;
  };

  coverdraw::vec2
  unit_direction(const coverdraw::vec2 &a, const coverdraw::vec2 &b)
  {
    coverdraw::vec2 d(b - a);
    return d / d.magnitude();
  }

  coverdraw::vec2
  left_normal(const coverdraw::vec2 &d)
  {
    return coverdraw::vec2(-d.y(), d.x());
  }

  float
  signed_area(const std::vector<coverdraw::vec2> &pts)
  {
    float area(0.0f);
    for (unsigned int i = 0, endi = pts.size(); i < endi; ++i)
      {
        const coverdraw::vec2 &p(pts[i]);
        const coverdraw::vec2 &q(pts[(i + 1) % endi]);
        area += coverdraw::crossproduct(p, q);
      }
    return 0.5f * area;
  }

  /* removes consecutive repeated points and, for a closed
   * polyline, a last point equal to the first point.
   */
  void
  remove_repeated_points(coverdraw::c_array<const coverdraw::vec2> src, bool closed,
                         std::vector<coverdraw::vec2> *dst)
  {
    dst->clear();
    for (const coverdraw::vec2 &p : src)
      {
        if (dst->empty() || dst->back() != p)
          {
            dst->push_back(p);
          }
      }

    if (closed && dst->size() > 1 && dst->back() == dst->front())
      {
        dst->pop_back();
      }
  }
}

////////////////////////////////
// StrokeBuilder methods
StrokeBuilder::
StrokeBuilder(const coverdraw::Pen &pen, float tolerance,
              coverdraw::FlattenedPath *dst):
  m_half_width(0.5f * pen.width()),
  m_join_style(pen.join_style()),
  m_cap_style(pen.cap_style()),
  m_miter_limit(pen.miter_limit()),
  m_dst(dst)
{
  float max_angle;

  /* the sagitta of a chord spanning an angle a on
   * a circle of radius r is r * (1 - cos(a / 2)).
   */
  if (tolerance < m_half_width)
    {
      max_angle = 2.0f * coverdraw::t_acos(1.0f - tolerance / m_half_width);
    }
  else
    {
      max_angle = 0.5f * COVERDRAW_PI;
    }
  m_circle_points = static_cast<unsigned int>(coverdraw::t_ceil(2.0f * COVERDRAW_PI / max_angle));
  m_circle_points = coverdraw::t_clamp(m_circle_points, 8u, 1024u);

  m_dash_period = 0.0;
  for (float f : pen.dash_pattern())
    {
      m_dash_offsets.push_back(m_dash_period);
      m_dash_lengths.push_back(f * pen.width());
      m_dash_period += static_cast<double>(f) * static_cast<double>(pen.width());
    }
}

void
StrokeBuilder::
add_polygon(std::vector<coverdraw::vec2> &pts)
{
  float area;

  area = signed_area(pts);
  if (area == 0.0f)
    {
      return;
    }

  if (area < 0.0f)
    {
      std::reverse(pts.begin(), pts.end());
    }
  m_dst->add_polygon(pts, true);
}

void
StrokeBuilder::
add_segment(const coverdraw::vec2 &a, const coverdraw::vec2 &b)
{
  coverdraw::vec2 n;

  n = left_normal(unit_direction(a, b)) * m_half_width;
  m_work_room.clear();
  m_work_room.push_back(a + n);
  m_work_room.push_back(b + n);
  m_work_room.push_back(b - n);
  m_work_room.push_back(a - n);
  add_polygon(m_work_room);
}

void
StrokeBuilder::
add_join(const coverdraw::vec2 &v, const coverdraw::vec2 &d0, const coverdraw::vec2 &d1)
{
  float cr, s;
  coverdraw::vec2 n0, n1, p0, p1;

  cr = coverdraw::crossproduct(d0, d1);
  if (cr == 0.0f && coverdraw::dot(d0, d1) > 0.0f)
    {
      /* collinear, the segment quads already meet */
      return;
    }

  if (m_join_style == coverdraw::RasterEnums::rounded_joins)
    {
      add_circle(v);
      return;
    }

  /* the join fills the gap on the outside of the turn */
  s = (cr > 0.0f) ? -1.0f : 1.0f;
  n0 = left_normal(d0) * (s * m_half_width);
  n1 = left_normal(d1) * (s * m_half_width);
  p0 = v + n0;
  p1 = v + n1;

  m_work_room.clear();
  m_work_room.push_back(v);
  m_work_room.push_back(p0);

  if (m_join_style == coverdraw::RasterEnums::miter_joins)
    {
      coverdraw::vec2 bisector(n0 + n1);
      float bisector_length, cos_half_angle;

      /* the miter point is at distance half_width / cos(theta / 2)
       * from v along the bisector where theta is the angle between
       * the two normals.
       */
      bisector_length = bisector.magnitude();
      if (bisector_length > 0.0f)
        {
          bisector /= bisector_length;
          cos_half_angle = coverdraw::dot(bisector, n0) / m_half_width;
          if (cos_half_angle > 0.0f && 1.0f / cos_half_angle <= m_miter_limit)
            {
              m_work_room.push_back(v + bisector * (m_half_width / cos_half_angle));
            }
        }
    }

  m_work_room.push_back(p1);
  add_polygon(m_work_room);
}

void
StrokeBuilder::
add_cap(const coverdraw::vec2 &p, const coverdraw::vec2 &dir)
{
  switch (m_cap_style)
    {
    case coverdraw::RasterEnums::square_caps:
      {
        coverdraw::vec2 n(left_normal(dir) * m_half_width);
        coverdraw::vec2 e(dir * m_half_width);

        m_work_room.clear();
        m_work_room.push_back(p + n);
        m_work_room.push_back(p + n + e);
        m_work_room.push_back(p - n + e);
        m_work_room.push_back(p - n);
        add_polygon(m_work_room);
      }
      break;

    case coverdraw::RasterEnums::rounded_caps:
      add_circle(p);
      break;

    default:
      break;
    }
}

void
StrokeBuilder::
add_circle(const coverdraw::vec2 &center)
{
  m_work_room.clear();
  for (unsigned int i = 0; i < m_circle_points; ++i)
    {
      float a;

      a = 2.0f * COVERDRAW_PI * static_cast<float>(i) / static_cast<float>(m_circle_points);
      m_work_room.push_back(center + coverdraw::vec2(coverdraw::t_cos(a), coverdraw::t_sin(a)) * m_half_width);
    }
  add_polygon(m_work_room);
}

void
StrokeBuilder::
stroke_point(const coverdraw::vec2 &p, const coverdraw::vec2 &dir)
{
  /* the two caps of a zero length polyline; flat caps draw nothing */
  add_cap(p, dir);
  add_cap(p, -dir);
}

void
StrokeBuilder::
stroke_polyline(const std::vector<coverdraw::vec2> &pts, bool closed)
{
  unsigned int number_segments;

  COVERDRAWassert(pts.size() >= 2);
  number_segments = (closed) ? pts.size() : pts.size() - 1;

  for (unsigned int i = 0; i < number_segments; ++i)
    {
      add_segment(pts[i], pts[(i + 1) % pts.size()]);
    }

  for (unsigned int i = 0; i < pts.size(); ++i)
    {
      unsigned int prev, next;

      if (!closed && (i == 0 || i + 1 == pts.size()))
        {
          continue;
        }

      prev = (i == 0) ? pts.size() - 1 : i - 1;
      next = (i + 1 == pts.size()) ? 0 : i + 1;
      add_join(pts[i],
               unit_direction(pts[prev], pts[i]),
               unit_direction(pts[i], pts[next]));
    }

  if (!closed)
    {
      add_cap(pts.front(), unit_direction(pts[1], pts[0]));
      add_cap(pts.back(), unit_direction(pts[pts.size() - 2], pts.back()));
    }
}

void
StrokeBuilder::
flush_dash(std::vector<coverdraw::vec2> &piece, const coverdraw::vec2 &dir)
{
  std::vector<coverdraw::vec2> pts;

  remove_repeated_points(coverdraw::make_c_array(piece), false, &pts);
  if (pts.size() == 1)
    {
      stroke_point(pts[0], dir);
    }
  else if (pts.size() > 1)
    {
      stroke_polyline(pts, false);
    }
  piece.clear();
}

double
StrokeBuilder::
dash_boundary(uint64_t k) const
{
  uint64_t n(m_dash_lengths.size());
  return static_cast<double>(k / n) * m_dash_period + m_dash_offsets[k % n];
}

void
StrokeBuilder::
stroke_dashed(const std::vector<coverdraw::vec2> &pts, bool closed)
{
  std::vector<coverdraw::vec2> piece;
  unsigned int number_segments;
  double total_length(0.0), segment_start(0.0);
  uint64_t k;
  coverdraw::vec2 dir(1.0f, 0.0f);

  COVERDRAWassert(!m_dash_lengths.empty());
  number_segments = (closed) ? pts.size() : pts.size() - 1;
  for (unsigned int s = 0; s < number_segments; ++s)
    {
      total_length += (pts[(s + 1) % pts.size()] - pts[s]).magnitude();
    }

  if (total_length / m_dash_period * static_cast<double>(m_dash_lengths.size())
      > static_cast<double>(coverdraw::StrokedPath::max_dash_elements))
    {
      COVERDRAWlog_warning("dash pattern of period " << m_dash_period
                           << " on a polyline of length " << total_length
                           << " exceeds " << coverdraw::StrokedPath::max_dash_elements
                           << " dashes, stroking without dashes");
      stroke_polyline(pts, closed);
      return;
    }

  /* dash element k runs from dash_boundary(k) to dash_boundary(k + 1)
   * along the polyline and is drawn when k is even; boundaries are
   * computed from k so that progress does not depend on summing
   * float lengths.
   */
  k = 1;
  piece.push_back(pts[0]);
  for (unsigned int s = 0; s < number_segments; ++s)
    {
      const coverdraw::vec2 &a(pts[s]);
      const coverdraw::vec2 &b(pts[(s + 1) % pts.size()]);
      double length, segment_end;

      dir = unit_direction(a, b);
      length = (b - a).magnitude();
      segment_end = segment_start + length;

      for (; dash_boundary(k) < segment_end; ++k)
        {
          coverdraw::vec2 q;
          float t;

          t = static_cast<float>(dash_boundary(k) - segment_start);
          q = a + dir * t;
          if (k % 2 == 1)
            {
              /* element k - 1 was drawn and ends at q */
              piece.push_back(q);
              flush_dash(piece, dir);
            }
          else
            {
              piece.clear();
              piece.push_back(q);
            }
        }

      if (k % 2 == 1)
        {
          piece.push_back(b);
        }
      segment_start = segment_end;
    }

  if (k % 2 == 1)
    {
      flush_dash(piece, dir);
    }
}

///////////////////////////////////
// coverdraw::StrokedPath methods
coverdraw::FlattenedPath
coverdraw::StrokedPath::
create(const FlattenedPath &path, const Pen &pen, float tolerance)
{
  FlattenedPath return_value;
  std::vector<vec2> pts;

  COVERDRAWrequire(tolerance > 0.0f, "stroking tolerance must be positive");

  StrokeBuilder builder(pen, tolerance, &return_value);
  for (unsigned int p = 0, endp = path.number_polygons(); p < endp; ++p)
    {
      bool closed(path.closed(p));

      remove_repeated_points(path.polygon(p), closed, &pts);
      if (pts.empty())
        {
          continue;
        }

      if (pts.size() == 1)
        {
          builder.stroke_point(pts[0], vec2(1.0f, 0.0f));
        }
      else if (pen.dashed())
        {
          builder.stroke_dashed(pts, closed);
        }
      else
        {
          builder.stroke_polyline(pts, closed);
        }
    }

  return return_value;
}
