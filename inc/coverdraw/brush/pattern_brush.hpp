/*!
 * \file pattern_brush.hpp
 * \brief file pattern_brush.hpp
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

namespace coverdraw
{
/*!\addtogroup Brushes
 * @{
 */

  /*!
   * \brief
   * A PatternBrush repeats a tile of colors of rows() x columns()
   * pixels across the frame; the pixel at (x, y) takes the tile
   * color at row y mod rows() and column x mod columns(), where
   * negative coordinates wrap to non-negative indices.
   *
   * A tile is typically made from a template of flags where each
   * flag selects the fore or the back color; for example a diagonal
   * line repeating every 4 pixels is
   * \code
   * 1000
   * 0100
   * 0010
   * 0001
   * \endcode
   */
  class PatternBrush:public Brush
  {
  public:
    /*!
     * Ctor from a template of flags.
     * \param fore_color color where the template is true
     * \param back_color color where the template is false
     * \param rows number of rows of the tile, must be positive
     * \param columns number of columns of the tile, must be positive
     * \param pattern template of the tile, row by row; must have
     *                exactly rows * columns elements
     */
    PatternBrush(const vec4 &fore_color, const vec4 &back_color,
                 int rows, int columns, c_array<const bool> pattern);

    /*!
     * Ctor from the colors of the tile.
     * \param rows number of rows of the tile, must be positive
     * \param columns number of columns of the tile, must be positive
     * \param colors colors of the tile, row by row; must have
     *               exactly rows * columns elements
     */
    PatternBrush(int rows, int columns, c_array<const vec4> colors);

    ~PatternBrush();

    /*!
     * Number of rows of the tile.
     */
    int
    rows(void) const;

    /*!
     * Number of columns of the tile.
     */
    int
    columns(void) const;

    /*!
     * Returns the color of the brush at a pixel.
     * \param x column of pixel
     * \param y row of pixel
     */
    const vec4&
    color(int x, int y) const;

    virtual
    reference_counted_ptr<BrushApplicator>
    create_applicator(const GraphicsOptions &options, ImageFrame &frame,
                      const IRect &region,
                      const reference_counted_ptr<ScratchAllocator> &allocator
                      = ScratchAllocator::default_allocator()) const;

    /*!
     * A 4x4 pattern with 10 percent of pixels in the fore color.
     */
    static
    reference_counted_ptr<PatternBrush>
    percent10(const vec4 &fore_color, const vec4 &back_color);

    /*!
     * A 4x4 pattern with 20 percent of pixels in the fore color.
     */
    static
    reference_counted_ptr<PatternBrush>
    percent20(const vec4 &fore_color, const vec4 &back_color);

    /*!
     * Horizontal lines repeating every 4 pixels.
     */
    static
    reference_counted_ptr<PatternBrush>
    horizontal(const vec4 &fore_color, const vec4 &back_color);

    /*!
     * Vertical lines repeating every 4 pixels.
     */
    static
    reference_counted_ptr<PatternBrush>
    vertical(const vec4 &fore_color, const vec4 &back_color);

    /*!
     * Lines going from bottom-left to top-right.
     */
    static
    reference_counted_ptr<PatternBrush>
    forward_diagonal(const vec4 &fore_color, const vec4 &back_color);

    /*!
     * Lines going from top-left to bottom-right.
     */
    static
    reference_counted_ptr<PatternBrush>
    backward_diagonal(const vec4 &fore_color, const vec4 &back_color);

  private:
    void *m_d;
  };

/*! @} */
}
