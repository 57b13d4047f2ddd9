/*!
 * \file canvas.hpp
 * \brief file canvas.hpp
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
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/path.hpp>
#include <coverdraw/pen.hpp>
#include <coverdraw/image_frame.hpp>
#include <coverdraw/brush/brush.hpp>
#include <coverdraw/brush/graphics_options.hpp>
#include <coverdraw/raster/raster_enums.hpp>
#include <coverdraw/raster/fill_rule.hpp>
#include <coverdraw/raster/raster_params.hpp>
#include <coverdraw/raster/drawing_operation.hpp>
#include <coverdraw/text/glyph_run.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * \brief
   * A Canvas records drawing commands against an ImageFrame
   * as DrawingOperation values, rasterizing the coverage of
   * each command when it is recorded; flush() composites the
   * recorded operations into the frame. Operations recorded
   * with the same render pass are blended in the order
   * recorded.
   */
  class Canvas:noncopyable
  {
  public:
    /*!
     * Ctor.
     * \param frame frame into which to draw, the frame must
     *              outlive the Canvas
     * \param params parameters of rasterization and compositing
     * \param options options of blending
     */
    explicit
    Canvas(ImageFrame &frame,
           const RasterParams &params = RasterParams(),
           const GraphicsOptions &options = GraphicsOptions());

    /*!
     * Dtor. Operations not flushed are discarded.
     */
    ~Canvas();

    /*!
     * Returns the ImageFrame of the Canvas.
     */
    ImageFrame&
    frame(void);

    /*!
     * Returns the parameters of rasterization.
     */
    const RasterParams&
    params(void) const;

    /*!
     * Record filling a path. Only the pixels of the path within
     * the frame are rasterized, so a path outside of the frame,
     * or one whose coordinates are not finite, records nothing.
     * \param path path to fill, flattened with RasterParams::curve_tolerance()
     * \param brush brush with which to fill
     * \param fill_rule fill rule
     * \param render_pass render pass of the operation
     */
    void
    fill_path(const Path &path, const reference_counted_ptr<const Brush> &brush,
              enum RasterEnums::fill_rule_t fill_rule = RasterEnums::nonzero_fill_rule,
              int render_pass = 0);

    /*!
     * Record filling a path with a custom fill rule.
     * \param path path to fill, flattened with RasterParams::curve_tolerance()
     * \param brush brush with which to fill
     * \param fill_rule fill rule
     * \param render_pass render pass of the operation
     */
    void
    fill_path(const Path &path, const reference_counted_ptr<const Brush> &brush,
              const CustomFillRuleBase &fill_rule, int render_pass = 0);

    /*!
     * Record stroking a path with the brush of a Pen; like
     * fill_path(), the stroke is clipped to the frame.
     * \param path path to stroke, flattened with RasterParams::curve_tolerance()
     * \param pen pen with which to stroke
     * \param render_pass render pass of the operation
     */
    void
    stroke_path(const Path &path, const Pen &pen, int render_pass = 0);

    /*!
     * Record drawing text. The glyph fills are recorded in render
     * pass render_pass and the glyph outlines in render pass
     * render_pass + 1. Repeated glyphs of the run share one
     * coverage map; the glyph cache is emptied when the call
     * returns.
     * \param run glyphs to draw
     * \param brush brush filling the glyphs, may be nullptr
     * \param pen pen stroking the outline of the glyphs, may be nullptr
     * \param render_pass render pass of the glyph fills
     */
    void
    draw_text(const GlyphRun &run, const reference_counted_ptr<const Brush> &brush,
              const Pen *pen = nullptr, int render_pass = 0);

    /*!
     * Record an operation directly.
     */
    void
    add_operation(const DrawingOperation &op);

    /*!
     * Returns the number of operations recorded since
     * the last flush().
     */
    unsigned int
    number_operations(void) const;

    /*!
     * Composite the recorded operations into the frame and
     * discard them. Returns the number of operations that
     * blended pixels.
     */
    unsigned int
    flush(void);

  private:
    void *m_d;
  };

/*! @} */
}
