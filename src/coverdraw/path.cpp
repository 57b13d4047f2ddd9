/*!
 * \file path.cpp
 * \brief file path.cpp
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
#include <coverdraw/path.hpp>
#include <coverdraw/util/math.hpp>
#include <private/util_private.hpp>
#include <private/bounding_box.hpp>
#include <private/bezier_util.hpp>

namespace
{
  class Segment
  {
  public:
    enum type_t
      {
        line_segment,
        bezier_segment,
        arc_segment,
      };

    enum type_t m_type;
    std::vector<coverdraw::vec2> m_control_points;
    coverdraw::vec2 m_end;
    float m_angle;
  };

  class PathContourPrivate
  {
  public:
    PathContourPrivate(void):
      m_start_pt(0.0f, 0.0f),
      m_started(false),
      m_ended(false),
      m_closed(false)
    {}

    void
    add_segment(enum Segment::type_t tp, const coverdraw::vec2 &pt, float angle);

    const coverdraw::vec2&
    last_point(void) const
    {
      return m_segments.empty() ? m_start_pt : m_segments.back().m_end;
    }

    coverdraw::vec2 m_start_pt;
    bool m_started, m_ended, m_closed;
    std::vector<coverdraw::vec2> m_current_control_points;
    std::vector<Segment> m_segments;
  };

  class PathPrivate
  {
  public:
    const coverdraw::reference_counted_ptr<coverdraw::PathContour>&
    current_contour(void);

    void
    move_common(const coverdraw::vec2 &pt);

    std::vector<coverdraw::reference_counted_ptr<coverdraw::PathContour> > m_contours;
  };

  /* Returns true if every control point of the curve is within
   * tol of the line segment connecting its end points; the curve
   * is in the convex hull of its control points, so it is then
   * within tol of that line segment as well.
   */
  bool
  bezier_is_flat(coverdraw::c_array<const coverdraw::vec2> pts, float tol)
  {
    const coverdraw::vec2 &p0(pts.front());
    coverdraw::vec2 chord(pts.back() - p0);
    float chord_length_sq(chord.magnitudeSq());
    float tol_sq(tol * tol);

    for (unsigned int i = 1; i + 1 < pts.size(); ++i)
      {
        coverdraw::vec2 v(pts[i] - p0);
        float dist_sq;

        if (chord_length_sq > 0.0f)
          {
            float t, cr;

            t = coverdraw::dot(v, chord) / chord_length_sq;
            if (t < 0.0f)
              {
                dist_sq = v.magnitudeSq();
              }
            else if (t > 1.0f)
              {
                dist_sq = (pts[i] - pts.back()).magnitudeSq();
              }
            else
              {
                cr = coverdraw::crossproduct(chord, v);
                dist_sq = cr * cr / chord_length_sq;
              }
          }
        else
          {
            dist_sq = v.magnitudeSq();
          }

        if (dist_sq > tol_sq)
          {
            return false;
          }
      }
    return true;
  }

  void
  flatten_bezier(coverdraw::c_array<const coverdraw::vec2> pts, float tol,
                 unsigned int depth, std::vector<coverdraw::vec2> *out)
  {
    if (depth >= coverdraw::PathEnums::max_recursion_depth || bezier_is_flat(pts, tol))
      {
        out->push_back(pts.back());
        return;
      }

    std::vector<coverdraw::vec2> front, back;
    coverdraw::detail::split_bezier(pts, &front, &back);
    flatten_bezier(coverdraw::make_c_array(front), tol, depth + 1, out);
    flatten_bezier(coverdraw::make_c_array(back), tol, depth + 1, out);
  }

  void
  flatten_arc(const coverdraw::vec2 &start, float angle, const coverdraw::vec2 &end,
              float tol, std::vector<coverdraw::vec2> *out)
  {
    using namespace coverdraw;

    float angle_coeff_dir, abs_angle, s, c, t;
    float radius, start_angle, max_step;
    vec2 end_start, mid, n, center, start_center;
    unsigned int count;

    end_start = end - start;
    abs_angle = t_abs(angle);
    if (abs_angle <= 0.0f || end_start.magnitudeSq() <= 0.0f)
      {
        out->push_back(end);
        return;
      }

    /* the center of the circle is on the perpindicular
     * bisector { t * n + mid | t real } of start and end
     * with |t| = 0.5 / tan(angle / 2).
     */
    angle_coeff_dir = (angle > 0.0f) ? 1.0f : -1.0f;
    mid = (end + start) * 0.5f;
    n = vec2(-end_start.y(), end_start.x());
    s = t_sin(abs_angle * 0.5f);
    c = t_cos(abs_angle * 0.5f);
    t = angle_coeff_dir * 0.5f * c / s;
    center = mid + n * t;

    start_center = start - center;
    radius = start_center.magnitude();
    start_angle = t_atan2(start_center.y(), start_center.x());

    /* the sagitta of a chord spanning an angle a on
     * a circle of radius r is r * (1 - cos(a / 2)).
     */
    if (tol < radius)
      {
        max_step = 2.0f * t_acos(1.0f - tol / radius);
      }
    else
      {
        max_step = 0.5f * COVERDRAW_PI;
      }
    max_step = t_max(max_step, abs_angle / float(1u << PathEnums::max_recursion_depth));
    count = t_max(1u, static_cast<unsigned int>(t_ceil(abs_angle / max_step)));

    for (unsigned int i = 1; i < count; ++i)
      {
        float a;

        a = start_angle + angle_coeff_dir * abs_angle * float(i) / float(count);
        out->push_back(center + vec2(t_cos(a), t_sin(a)) * radius);
      }
    out->push_back(end);
  }
}

////////////////////////////////////////
// PathContourPrivate methods
void
PathContourPrivate::
add_segment(enum Segment::type_t tp, const coverdraw::vec2 &pt, float angle)
{
  Segment S;

  COVERDRAWrequire(m_started, "PathContour must be started before adding segments");
  COVERDRAWrequire(!m_ended, "PathContour is ended, no segments may be added");

  S.m_type = tp;
  S.m_end = pt;
  S.m_angle = angle;
  if (tp == Segment::line_segment && !m_current_control_points.empty())
    {
      S.m_type = Segment::bezier_segment;
      S.m_control_points.swap(m_current_control_points);
    }
  m_current_control_points.clear();
  m_segments.push_back(S);
}

////////////////////////////////////////
// PathPrivate methods
const coverdraw::reference_counted_ptr<coverdraw::PathContour>&
PathPrivate::
current_contour(void)
{
  if (m_contours.empty() || m_contours.back()->ended())
    {
      coverdraw::vec2 pt(0.0f, 0.0f);
      if (!m_contours.empty())
        {
          const coverdraw::PathContour &C(*m_contours.back());
          pt = C.point(C.number_points() - 1);
        }
      move_common(pt);
    }
  return m_contours.back();
}

void
PathPrivate::
move_common(const coverdraw::vec2 &pt)
{
  if (!m_contours.empty() && !m_contours.back()->ended())
    {
      m_contours.back()->end();
    }
  m_contours.push_back(COVERDRAWnew coverdraw::PathContour());
  m_contours.back()->start(pt);
}

/////////////////////////////////////
// coverdraw::PathContour methods
coverdraw::PathContour::
PathContour(void)
{
  m_d = COVERDRAWnew PathContourPrivate();
}

coverdraw::PathContour::
~PathContour(void)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

void
coverdraw::PathContour::
start(const vec2 &start_pt)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);

  COVERDRAWrequire(!d->m_started, "PathContour::start() may only be called once");
  d->m_start_pt = start_pt;
  d->m_started = true;
}

void
coverdraw::PathContour::
add_control_point(const vec2 &pt)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);

  COVERDRAWrequire(!d->m_ended, "PathContour is ended, no control points may be added");
  d->m_current_control_points.push_back(pt);
}

void
coverdraw::PathContour::
clear_control_points(void)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);
  d->m_current_control_points.clear();
}

void
coverdraw::PathContour::
to_point(const vec2 &pt)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);
  d->add_segment(Segment::line_segment, pt, 0.0f);
}

void
coverdraw::PathContour::
to_arc(float angle, const vec2 &pt)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);

  COVERDRAWrequire(d->m_current_control_points.empty(),
                   "an arc may not follow control points");
  d->add_segment(Segment::arc_segment, pt, angle);
}

void
coverdraw::PathContour::
end(void)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);
  d->m_current_control_points.clear();
  d->m_ended = true;
}

void
coverdraw::PathContour::
close(void)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);

  to_point(d->m_start_pt);
  d->m_closed = true;
  d->m_ended = true;
}

void
coverdraw::PathContour::
close_arc(float angle)
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);

  to_arc(angle, d->m_start_pt);
  d->m_closed = true;
  d->m_ended = true;
}

bool
coverdraw::PathContour::
closed(void) const
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);
  return d->m_closed;
}

bool
coverdraw::PathContour::
ended(void) const
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);
  return d->m_ended;
}

unsigned int
coverdraw::PathContour::
number_points(void) const
{
  PathContourPrivate *d;
  unsigned int sz;

  d = static_cast<PathContourPrivate*>(m_d);
  if (!d->m_started)
    {
      return 0;
    }
  sz = d->m_segments.size();
  return (d->m_closed) ? sz : sz + 1u;
}

unsigned int
coverdraw::PathContour::
number_segments(void) const
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);
  return d->m_segments.size();
}

const coverdraw::vec2&
coverdraw::PathContour::
point(unsigned int I) const
{
  PathContourPrivate *d;
  d = static_cast<PathContourPrivate*>(m_d);

  COVERDRAWassert(I < number_points());
  return (I == 0) ?
    d->m_start_pt:
    d->m_segments[I - 1].m_end;
}

bool
coverdraw::PathContour::
approximate_bounding_box(Rect *out_bb) const
{
  PathContourPrivate *d;
  BoundingBox bb;
  vec2 prev;

  d = static_cast<PathContourPrivate*>(m_d);
  if (!d->m_started)
    {
      return false;
    }

  prev = d->m_start_pt;
  bb.add(prev);
  for (const Segment &S : d->m_segments)
    {
      bb.add(S.m_control_points.begin(), S.m_control_points.end());
      bb.add(S.m_end);
      if (S.m_type == Segment::arc_segment)
        {
          std::vector<vec2> pts;

          flatten_arc(prev, S.m_angle, S.m_end,
                      PathEnums::default_curve_tolerance(), &pts);
          bb.add(pts.begin(), pts.end());
        }
      prev = S.m_end;
    }

  return bb.get(out_bb);
}

void
coverdraw::PathContour::
flatten(float tolerance, std::vector<vec2> *out_pts) const
{
  PathContourPrivate *d;
  vec2 prev;

  d = static_cast<PathContourPrivate*>(m_d);
  if (!d->m_started)
    {
      return;
    }

  prev = d->m_start_pt;
  out_pts->push_back(prev);
  for (const Segment &S : d->m_segments)
    {
      switch (S.m_type)
        {
        case Segment::line_segment:
          out_pts->push_back(S.m_end);
          break;

        case Segment::bezier_segment:
          {
            std::vector<vec2> pts;

            pts.reserve(S.m_control_points.size() + 2);
            pts.push_back(prev);
            pts.insert(pts.end(), S.m_control_points.begin(), S.m_control_points.end());
            pts.push_back(S.m_end);
            flatten_bezier(make_c_array(pts), tolerance, 0, out_pts);
          }
          break;

        case Segment::arc_segment:
          flatten_arc(prev, S.m_angle, S.m_end, tolerance, out_pts);
          break;
        }
      prev = S.m_end;
    }

  if (d->m_closed)
    {
      /* the closing segment ends at the start point which
       * is already the first point of the polyline.
       */
      out_pts->pop_back();
    }
}

//////////////////////////////////////////
// coverdraw::Path methods
coverdraw::Path::
Path(void)
{
  m_d = COVERDRAWnew PathPrivate();
}

coverdraw::Path::
~Path()
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

void
coverdraw::Path::
clear(void)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  d->m_contours.clear();
}

coverdraw::Path&
coverdraw::Path::
operator<<(const vec2 &pt)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);

  if (d->m_contours.empty() || d->m_contours.back()->ended())
    {
      d->move_common(pt);
    }
  else
    {
      d->m_contours.back()->to_point(pt);
    }
  return *this;
}

coverdraw::Path&
coverdraw::Path::
operator<<(const control_point &pt)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  d->current_contour()->add_control_point(pt.m_location);
  return *this;
}

coverdraw::Path&
coverdraw::Path::
operator<<(const arc &a)
{
  return arc_to(a.m_angle, a.m_pt);
}

coverdraw::Path&
coverdraw::Path::
operator<<(contour_close)
{
  return close_contour();
}

coverdraw::Path&
coverdraw::Path::
operator<<(contour_end)
{
  return end_contour();
}

coverdraw::Path&
coverdraw::Path::
operator<<(contour_close_arc a)
{
  return close_contour_arc(a.m_angle);
}

coverdraw::Path&
coverdraw::Path::
line_to(const vec2 &pt)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  d->current_contour()->to_point(pt);
  return *this;
}

coverdraw::Path&
coverdraw::Path::
quadratic_to(const vec2 &ct, const vec2 &pt)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  const reference_counted_ptr<PathContour> &h(d->current_contour());
  h->clear_control_points();
  h->add_control_point(ct);
  h->to_point(pt);
  return *this;
}

coverdraw::Path&
coverdraw::Path::
cubic_to(const vec2 &ct1, const vec2 &ct2, const vec2 &pt)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  const reference_counted_ptr<PathContour> &h(d->current_contour());
  h->clear_control_points();
  h->add_control_point(ct1);
  h->add_control_point(ct2);
  h->to_point(pt);
  return *this;
}

coverdraw::Path&
coverdraw::Path::
arc_to(float angle, const vec2 &pt)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  d->current_contour()->to_arc(angle, pt);
  return *this;
}

coverdraw::Path&
coverdraw::Path::
move(const vec2 &pt)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  d->move_common(pt);
  return *this;
}

coverdraw::Path&
coverdraw::Path::
end_contour(void)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  if (!d->m_contours.empty())
    {
      d->m_contours.back()->end();
    }
  return *this;
}

coverdraw::Path&
coverdraw::Path::
close_contour(void)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  d->current_contour()->close();
  return *this;
}

coverdraw::Path&
coverdraw::Path::
close_contour_arc(float angle)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  d->current_contour()->close_arc(angle);
  return *this;
}

unsigned int
coverdraw::Path::
number_contours(void) const
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  return d->m_contours.size();
}

coverdraw::reference_counted_ptr<const coverdraw::PathContour>
coverdraw::Path::
contour(unsigned int i) const
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  COVERDRAWassert(i < d->m_contours.size());
  return d->m_contours[i];
}

bool
coverdraw::Path::
approximate_bounding_box(Rect *out_bb) const
{
  PathPrivate *d;
  BoundingBox bb;

  d = static_cast<PathPrivate*>(m_d);
  for (const reference_counted_ptr<PathContour> &C : d->m_contours)
    {
      Rect R;
      if (C->approximate_bounding_box(&R))
        {
          bb.add(R);
        }
    }
  return bb.get(out_bb);
}

coverdraw::FlattenedPath
coverdraw::Path::
flatten(float tolerance) const
{
  PathPrivate *d;
  FlattenedPath return_value;
  std::vector<vec2> pts;

  COVERDRAWrequire(tolerance > 0.0f, "curve tolerance must be positive");
  d = static_cast<PathPrivate*>(m_d);
  for (const reference_counted_ptr<PathContour> &C : d->m_contours)
    {
      pts.clear();
      C->flatten(tolerance, &pts);
      if (!pts.empty())
        {
          return_value.add_polygon(pts, C->closed());
        }
    }
  return return_value;
}
