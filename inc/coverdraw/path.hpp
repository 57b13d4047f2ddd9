/*!
 * \file path.hpp
 * \brief file path.hpp
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
#include <coverdraw/util/vecN.hpp>
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/rect.hpp>
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/flattened_path.hpp>

namespace coverdraw  {

/*!\addtogroup Paths
 * @{
 */

/*!
 * \brief
 * Class to specify tolerance values used when flattening
 * the curves of a Path into line segments.
 */
class PathEnums
{
public:
  enum
    {
      /*!
       * Maximum number of times a curve is split in two
       * when flattening; bounds the number of line segments
       * a single curve produces to 2^16.
       */
      max_recursion_depth = 16,
    };

  /*!
   * Default tolerance in pixels between a curve and the
   * line segments that approximate it.
   */
  static
  float
  default_curve_tolerance(void)
  {
    return 0.25f;
  }
};

/*!
 * \brief
 * A PathContour represents a single contour within
 * a Path: a start point followed by segments, each
 * segment being a line, a Bezier curve of any degree
 * (given by control points) or an arc of a circle.
 */
class PathContour:
    public reference_counted<PathContour>::non_concurrent
{
public:
  explicit
  PathContour(void);

  ~PathContour();

  /*!
   * Sets the first point; must be called exactly once and
   * before any segment is added.
   */
  void
  start(const vec2 &pt);

  /*!
   * Add a segment ending at the named point; if control points
   * have been added since the last segment, the segment is the
   * Bezier curve with those control points, otherwise it is a
   * line segment.
   * \param pt point location of end of segment
   */
  void
  to_point(const vec2 &pt);

  /*!
   * Queues a control point for the next segment.
   */
  void
  add_control_point(const vec2 &pt);

  /*!
   * Drops queued control points.
   */
  void
  clear_control_points(void);

  /*!
   * Adds an arc of angle radians, counter-clockwise when
   * positive, ending at pt. Throws std::invalid_argument if
   * control points are queued.
   */
  void
  to_arc(float angle, const vec2 &pt);

  /*!
   * Ends the contour open; segments may no longer be added.
   */
  void
  end(void);

  /*!
   * Ends the contour with a segment back to the start point,
   * curved by any queued control points.
   */
  void
  close(void);

  /*!
   * Ends the contour with an arc back to the start point.
   */
  void
  close_arc(float angle);

  bool
  closed(void) const;

  /*!
   * True once end() or a close function was called.
   */
  bool
  ended(void) const;

  /*!
   * Return the I'th point of this PathContour.
   * For I = 0, returns the value passed to start().
   * \param I index of point.
   */
  const vec2&
  point(unsigned int I) const;

  /*!
   * Returns the number of points of this PathContour,
   * i.e. the start point and the end point of each
   * segment that does not close the contour.
   */
  unsigned int
  number_points(void) const;

  /*!
   * Returns the number of segments of this PathContour.
   */
  unsigned int
  number_segments(void) const;

  /*!
   * Returns an approximation of the bounding box for this
   * PathContour from its points, its control points and
   * a coarse flattening of its arcs. Returns false if the
   * contour was never started.
   * \param out_bb (output) location to which to write
   *                        the bounding box value
   */
  bool
  approximate_bounding_box(Rect *out_bb) const;

  /*!
   * Flatten the contour into a polyline, appending to
   * out_pts. The returned points include the start point;
   * for a closed contour the end point of the closing
   * segment (which equals the start point) is not added.
   * \param tolerance maximum distance between the curves
   *                  and their approximating line segments
   * \param out_pts (output) location to which to append
   */
  void
  flatten(float tolerance, std::vector<vec2> *out_pts) const;

private:
  void *m_d;
};

/*!
 * \brief
 * A Path is a sequence of contours built either with the
 * named functions (move(), line_to(), ...) or by streaming
 * points and tags with operator<<, as in
 * \code
 * path << vec2(0, 0) << vec2(10, 0)
 *      << Path::control_point(10, 10) << vec2(0, 10)
 *      << Path::contour_close();
 * \endcode
 * which closes a contour of a line and a quadratic curve.
 */
class Path:noncopyable
{
public:
  /*!
   * \brief
   * Streamed before a point to make it a Bezier control
   * point of the next segment.
   */
  class control_point
  {
  public:
    explicit
    control_point(const vec2 &pt):
      m_location(pt)
    {}

    control_point(float x, float y):
      m_location(x,y)
    {}

    vec2 m_location;
  };

  /*!
   * \brief
   * Arc of m_angle radians (counter-clockwise when
   * positive) from the current point to m_pt.
   */
  class arc
  {
  public:
    arc(float angle, const vec2 &pt):
      m_angle(angle), m_pt(pt)
    {}

    float m_angle;
    vec2 m_pt;
  };

  /*! \brief closes the current contour with a line */
  class contour_close
  {};

  /*! \brief ends the current contour, leaving it open */
  class contour_end
  {};

  /*!
   * \brief
   * Starts a new contour at m_pt, the current one is
   * left open.
   */
  class contour_start
  {
  public:
    explicit
    contour_start(const vec2 &pt):
      m_pt(pt)
    {}

    contour_start(float x, float y):
      m_pt(x, y)
    {}

    vec2 m_pt;
  };

  /*! \brief closes the current contour with an arc */
  class contour_close_arc
  {
  public:
    explicit
    contour_close_arc(float angle):
      m_angle(angle)
    {}

    float m_angle;
  };

  explicit
  Path(void);

  ~Path();

  /*!
   * Removes all contours.
   */
  void
  clear(void);

  /*!
   * Ends the current segment at pt, as a line or as a Bezier
   * curve if control points were streamed before it. With no
   * contour open a new contour starts at pt.
   */
  Path&
  operator<<(const vec2 &pt);

  Path&
  operator<<(const control_point &pt);

  Path&
  operator<<(const arc &a);

  Path&
  operator<<(contour_close);

  Path&
  operator<<(contour_end);

  Path&
  operator<<(contour_close_arc a);

  Path&
  operator<<(const contour_start &st)
  {
    move(st.m_pt);
    return *this;
  }

  Path&
  line_to(const vec2 &pt);

  Path&
  quadratic_to(const vec2 &ct, const vec2 &pt);

  Path&
  cubic_to(const vec2 &ct1, const vec2 &ct2, const vec2 &pt);

  /*!
   * Arc of angle radians from the current point to pt.
   */
  Path&
  arc_to(float angle, const vec2 &pt);

  /*!
   * Starts a new contour at pt; an open current contour
   * is ended, not closed.
   */
  Path&
  move(const vec2 &pt);

  Path&
  end_contour(void);

  Path&
  close_contour(void);

  Path&
  close_contour_arc(float angle);

  unsigned int
  number_contours(void) const;

  reference_counted_ptr<const PathContour>
  contour(unsigned int i) const;

  /*!
   * Union of PathContour::approximate_bounding_box() over
   * the contours, false if there are none.
   */
  bool
  approximate_bounding_box(Rect *out_bb) const;

  /*!
   * Flattens each contour to one polygon whose points lie
   * within tolerance pixels of the curves. Throws
   * std::invalid_argument if tolerance is not positive.
   */
  FlattenedPath
  flatten(float tolerance = PathEnums::default_curve_tolerance()) const;

private:
  void *m_d;
};

/*! @} */

}
