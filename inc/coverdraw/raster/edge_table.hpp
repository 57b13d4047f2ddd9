/*!
 * \file edge_table.hpp
 * \brief file edge_table.hpp
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
#include <coverdraw/flattened_path.hpp>
#include <coverdraw/raster/raster_enums.hpp>
#include <coverdraw/raster/fill_rule.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * \brief
   * A Crossing is where an edge of a polygon crosses a
   * horizontal scan line together with the direction of
   * the edge.
   */
  class Crossing
  {
  public:
    Crossing(void):
      m_x(0.0f),
      m_winding(0)
    {}

    /*!
     * Ctor.
     * \param x value with which to initialize \ref m_x
     * \param w value with which to initialize \ref m_winding
     */
    Crossing(float x, int w):
      m_x(x),
      m_winding(w)
    {}

    /*!
     * Comparison operator to sort Crossing values by \ref m_x.
     */
    bool
    operator<(const Crossing &rhs) const
    {
      return m_x < rhs.m_x;
    }

    /*!
     * x-coordinate of the crossing.
     */
    float m_x;

    /*!
     * +1 if the edge goes to increasing y,
     * -1 if it goes to decreasing y.
     */
    int m_winding;
  };

  /*!
   * \brief
   * A Span is a maximal interval [m_enter, m_exit] of a
   * scan line that is inside a path.
   */
  class Span
  {
  public:
    Span(void):
      m_enter(0.0f),
      m_exit(0.0f)
    {}

    /*!
     * Ctor.
     * \param e value with which to initialize \ref m_enter
     * \param x value with which to initialize \ref m_exit
     */
    Span(float e, float x):
      m_enter(e),
      m_exit(x)
    {}

    /*!
     * Length of the span.
     */
    float
    length(void) const
    {
      return m_exit - m_enter;
    }

    /*!
     * x-coordinate where the span starts.
     */
    float m_enter;

    /*!
     * x-coordinate where the span ends.
     */
    float m_exit;
  };

  /*!
   * \brief
   * An EdgeTable holds the non-horizontal edges of the
   * polygons of a FlattenedPath and computes for a scan
   * line the places where the edges cross it and from
   * those the inside spans under a fill rule.
   *
   * An edge from p0 to p1 crosses the scan line at y
   * exactly when y is in the half-open range
   * [min(p0.y, p1.y), max(p0.y, p1.y)). The query methods
   * are const and only write to their out-arguments, so
   * they may be called from several threads at once.
   */
  class EdgeTable:noncopyable
  {
  public:
    /*!
     * Ctor.
     * \param path polygons from which to build the edges
     * \param close_open_polygons if true, an open polygon of path
     *                            also gets the edge from its last point
     *                            to its first point, which is what
     *                            filling requires
     */
    explicit
    EdgeTable(const FlattenedPath &path, bool close_open_polygons = true);

    ~EdgeTable();

    /*!
     * Returns the number of (non-horizontal) edges.
     */
    unsigned int
    number_edges(void) const;

    /*!
     * Returns the range [min y, max y] of the edges;
     * the range is (0, 0) if there are no edges.
     */
    range_type<float>
    y_extent(void) const;

    /*!
     * Computes the crossings of the edges with the horizontal
     * line at y, sorted by x; crossings with equal x are kept
     * in the order of the edges. Returns the number of crossings.
     * \param y scan line
     * \param out_crossings (output) location to which to write
     *                      the crossings; cleared first
     */
    unsigned int
    crossings(float y, std::vector<Crossing> *out_crossings) const;

    /*!
     * Computes the inside spans of the horizontal line at y.
     * Returns the number of spans.
     * \param y scan line
     * \param fill_rule fill rule deciding what is inside
     * \param out_spans (output) location to which to write
     *                  the spans; cleared first
     */
    unsigned int
    spans(float y, enum RasterEnums::fill_rule_t fill_rule,
          std::vector<Span> *out_spans) const;

    /*!
     * Computes the inside spans of the horizontal line at y
     * with a custom fill rule. Returns the number of spans.
     * \param y scan line
     * \param fill_rule fill rule deciding what is inside
     * \param out_spans (output) location to which to write
     *                  the spans; cleared first
     */
    unsigned int
    spans(float y, const CustomFillRuleBase &fill_rule,
          std::vector<Span> *out_spans) const;

    /*!
     * Reduces crossings sorted by x to the spans where
     * the fill rule reports inside: a span starts at a
     * crossing where the running winding sum goes from
     * outside to inside and ends at the crossing where
     * it goes back to outside. Crossings at the same
     * x may produce a span of length zero. Spans are
     * appended to out_spans.
     * \param crossings crossings sorted by x
     * \param fill_rule fill rule deciding what is inside
     * \param out_spans (output) location to which to append
     */
    static
    void
    spans_from_crossings(c_array<const Crossing> crossings,
                         const CustomFillRuleBase &fill_rule,
                         std::vector<Span> *out_spans);

  private:
    void *m_d;
  };

  /*!
   * Conveniance function, equivalent to
   * \code
   * EdgeTable(path).spans(y, fill_rule, out_spans);
   * \endcode
   */
  void
  compute_spans(const FlattenedPath &path,
                enum RasterEnums::fill_rule_t fill_rule,
                float y, std::vector<Span> *out_spans);

/*! @} */
}
