/*!
 * \file brush.hpp
 * \brief file brush.hpp
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
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/image_frame.hpp>
#include <coverdraw/scratch_allocator.hpp>
#include <coverdraw/brush/graphics_options.hpp>

namespace coverdraw
{
/*!\addtogroup Brushes
 * @{
 */

  /*!
   * \brief
   * A BrushApplicator blends the color of a Brush into the rows
   * of an ImageFrame weighted by coverage values. An applicator
   * may be used from several threads at once as long as each
   * thread blends different rows; each thread gets its own
   * scratch record on first use, and all scratch records are
   * released when the applicator is destroyed.
   */
  class BrushApplicator:
    public reference_counted<BrushApplicator>::concurrent
  {
  public:
    /*!
     * Ctor.
     * \param options options of blending, value is copied
     * \param frame destination of blending
     * \param region region of frame to which the applicator is bound
     * \param allocator allocator of the scratch records
     */
    BrushApplicator(const GraphicsOptions &options, ImageFrame &frame,
                    const IRect &region,
                    const reference_counted_ptr<ScratchAllocator> &allocator);

    virtual
    ~BrushApplicator();

    /*!
     * Blends into row y of the frame, starting at column x,
     * for coverage.size() pixels. Pixel x + i is blended with
     * amount clamp(coverage[i] * blend_percentage, 0, 1) times
     * the alpha of the brush color by source-over. Pixels
     * outside of the frame are skipped.
     * \param coverage coverage values
     * \param x first column to blend
     * \param y row to blend
     */
    virtual
    void
    apply(c_array<const float> coverage, int x, int y);

    /*!
     * Returns the options of blending.
     */
    const GraphicsOptions&
    options(void) const;

    /*!
     * Returns the frame to which the applicator blends.
     */
    ImageFrame&
    frame(void) const;

    /*!
     * Returns the region to which the applicator is bound.
     */
    const IRect&
    region(void) const;

    /*!
     * Returns the number of scratch records created so far,
     * i.e. the number of distinct threads that called apply().
     */
    unsigned int
    number_scratch_records(void) const;

  protected:
    /*!
     * To be implemented by a derived class to write the brush
     * colors of the pixels (x + i, y) for 0 <= i < out_colors.size().
     * Called concurrently from several threads.
     * \param x first column
     * \param y row
     * \param out_colors (output) location to which to write
     */
    virtual
    void
    colors(int x, int y, c_array<vec4> out_colors) const = 0;

  private:
    void *m_d;
  };

  /*!
   * \brief
   * A Brush is a source of color. Brushes are immutable once
   * constructed and may be shared between threads. A Brush must
   * be created with COVERDRAWnew and held by reference_counted_ptr,
   * since an applicator may hold a reference to its Brush.
   */
  class Brush:
    public reference_counted<Brush>::concurrent
  {
  public:
    virtual
    ~Brush()
    {}

    /*!
     * To be implemented by a derived class to create the
     * BrushApplicator that blends this Brush into a frame.
     * \param options options of blending
     * \param frame destination of blending
     * \param region region of frame to which to bind
     * \param allocator allocator of the scratch records
     */
    virtual
    reference_counted_ptr<BrushApplicator>
    create_applicator(const GraphicsOptions &options, ImageFrame &frame,
                      const IRect &region,
                      const reference_counted_ptr<ScratchAllocator> &allocator
                      = ScratchAllocator::default_allocator()) const = 0;
  };

/*! @} */
}
