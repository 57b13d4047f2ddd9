/*!
 * \file compositor.hpp
 * \brief file compositor.hpp
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
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/rect.hpp>
#include <coverdraw/image_frame.hpp>
#include <coverdraw/brush/graphics_options.hpp>
#include <coverdraw/raster/raster_params.hpp>
#include <coverdraw/raster/drawing_operation.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * \brief
   * A Compositor blends DrawingOperation values into an ImageFrame.
   */
  class Compositor:noncopyable
  {
  public:
    /*!
     * Ctor.
     * \param params provides the number of threads and the allocator
     *               of scratch records, value is copied
     * \param options options of blending, value is copied
     */
    explicit
    Compositor(const RasterParams &params = RasterParams(),
               const GraphicsOptions &options = GraphicsOptions());

    ~Compositor();

    /*!
     * Returns the RasterParams of the Compositor.
     */
    const RasterParams&
    params(void) const;

    /*!
     * Returns the GraphicsOptions of the Compositor.
     */
    const GraphicsOptions&
    options(void) const;

    /*!
     * Composites operations into a frame. The operations are
     * processed one after the other sorted by ascending
     * DrawingOperation::m_render_pass, keeping the given order
     * within a render pass. Each operation is clipped to the
     * intersection of region and the frame; an operation with
     * no pixels in it is skipped. The rows of an operation are
     * blended in parallel by RasterParams::number_threads()
     * threads with one BrushApplicator for the operation.
     * Returns the number of operations that blended pixels.
     * \param operations operations to composite
     * \param frame destination
     * \param region region of frame to which to clip
     */
    unsigned int
    composite(c_array<const DrawingOperation> operations,
              ImageFrame &frame, const IRect &region) const;

    /*!
     * Provided as a conveniance, equivalent to
     * \code
     * composite(operations, frame, frame.bounds());
     * \endcode
     */
    unsigned int
    composite(c_array<const DrawingOperation> operations,
              ImageFrame &frame) const
    {
      return composite(operations, frame, frame.bounds());
    }

  private:
    void *m_d;
  };

/*! @} */
}
