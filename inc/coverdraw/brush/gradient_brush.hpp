/*!
 * \file gradient_brush.hpp
 * \brief file gradient_brush.hpp
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

#include <coverdraw/brush/brush.hpp>
#include <coverdraw/colorstop.hpp>

namespace coverdraw
{
/*!\addtogroup Brushes
 * @{
 */

  /*!
   * \brief
   * A LinearGradientBrush draws the colors of a ColorStopArray
   * along the line from a start point to an end point. The
   * interpolate of a pixel is the projection of its center onto
   * that line, where the start point has interpolate 0 and the
   * end point has interpolate 1.
   */
  class LinearGradientBrush:public Brush
  {
  public:
    /*!
     * \brief
     * Enumeration to specify how the interpolate is
     * handled outside of [0, 1].
     */
    enum spread_type_t
      {
        /*!
         * Clamp the value to its range, i.e.
         * for a value t the value is clamp(t, 0, 1).
         */
        spread_clamp,

        /*!
         * Mirror the value across the start of
         * its range, i.e. the value is
         * clamp(abs(t), 0, 1)
         */
        spread_mirror,

        /*!
         * Repeat the value to its range, i.e.
         * the value is mod(t, 1)
         */
        spread_repeat,

        /*!
         * Mirror repeat the value across the start
         * of its range, i.e. the value is
         * 1 - abs(mod(t, 2) - 1)
         */
        spread_mirror_repeat,

        number_spread_types
      };

    /*!
     * Ctor. The color stops are sampled into a lookup
     * table of lookup_size entries at construction.
     * \param start_pt point where the interpolate is 0
     * \param end_pt point where the interpolate is 1
     * \param stops color stops of the gradient, must not be empty
     * \param spread how to handle interpolates outside of [0, 1]
     * \param lookup_size number of entries of the lookup table,
     *                    at least 2
     */
    LinearGradientBrush(const vec2 &start_pt, const vec2 &end_pt,
                        const ColorStopArray &stops,
                        enum spread_type_t spread = spread_clamp,
                        unsigned int lookup_size = 256);

    ~LinearGradientBrush();

    /*!
     * Returns the interpolate of a point after the spread
     * is applied, a value in [0, 1].
     * \param p point to query
     */
    float
    interpolate(const vec2 &p) const;

    /*!
     * Returns the color of the pixel at (x, y).
     */
    vec4
    color(int x, int y) const;

    virtual
    reference_counted_ptr<BrushApplicator>
    create_applicator(const GraphicsOptions &options, ImageFrame &frame,
                      const IRect &region,
                      const reference_counted_ptr<ScratchAllocator> &allocator
                      = ScratchAllocator::default_allocator()) const;

    /*!
     * Applies a spread to a value.
     * \param t value to which to apply
     * \param spread spread to apply
     */
    static
    float
    apply_spread(float t, enum spread_type_t spread);

  private:
    void *m_d;
  };

/*! @} */
}
