/*!
 * \file image_frame.hpp
 * \brief file image_frame.hpp
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

#include <coverdraw/util/util.hpp>
#include <coverdraw/util/vecN.hpp>
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/rect.hpp>

namespace coverdraw
{
/*!\addtogroup Imaging
 * @{
 */

  /*!
   * \brief
   * An ImageFrame is the destination of drawing: a rectangle
   * of linear RGBA float pixels addressed by row, where row 0
   * is the top row.
   */
  class ImageFrame:noncopyable
  {
  public:
    /*!
     * Ctor.
     * \param width number of pixels of each row, non-negative
     * \param height number of rows, non-negative
     * \param clear_color value to which to set each pixel
     */
    ImageFrame(int width, int height,
               const vec4 &clear_color = vec4(0.0f, 0.0f, 0.0f, 0.0f));

    ~ImageFrame();

    /*!
     * Number of pixels of each row.
     */
    int
    width(void) const;

    /*!
     * Number of rows.
     */
    int
    height(void) const;

    /*!
     * Returns the rectangle [0, width()) x [0, height()).
     */
    IRect
    bounds(void) const;

    /*!
     * Returns the pixels of a row.
     * \param y row with 0 <= y < height()
     */
    c_array<vec4>
    row(int y);

    /*!
     * Returns the pixels of a row.
     * \param y row with 0 <= y < height()
     */
    c_array<const vec4>
    row(int y) const;

    /*!
     * Returns the pixel at column x of row y.
     */
    vec4&
    pixel(int x, int y);

    /*!
     * Returns the pixel at column x of row y.
     */
    const vec4&
    pixel(int x, int y) const;

    /*!
     * Set every pixel to a color.
     * \param color value to which to set each pixel
     */
    void
    clear(const vec4 &color);

  private:
    void *m_d;
  };

/*! @} */
}
