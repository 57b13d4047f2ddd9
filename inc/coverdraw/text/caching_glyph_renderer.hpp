/*!
 * \file caching_glyph_renderer.hpp
 * \brief file caching_glyph_renderer.hpp
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
#include <coverdraw/brush/brush.hpp>
#include <coverdraw/pen.hpp>
#include <coverdraw/raster/raster_params.hpp>
#include <coverdraw/raster/drawing_operation.hpp>
#include <coverdraw/text/glyph_run.hpp>
#include <coverdraw/text/glyph_cache.hpp>

namespace coverdraw
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A CachingGlyphRenderer turns the glyphs of a GlyphRun into
   * DrawingOperation values. The coverage of each glyph is
   * rasterized with RasterEnums::nonzero_fill_rule and stored in
   * a GlyphCache owned by the renderer, so that a glyph drawn again
   * at the same pixel size and sub-pixel position is not
   * rasterized again.
   */
  class CachingGlyphRenderer:noncopyable
  {
  public:
    /*!
     * Render passes of the operations created.
     */
    enum render_pass_t
      {
        /*!
         * Render pass of the operations filling glyphs.
         */
        fill_render_pass = 0,

        /*!
         * Render pass of the operations stroking the outline of
         * glyphs; outlines are drawn over the fills of every glyph.
         */
        outline_render_pass = 1,
      };

    /*!
     * Ctor.
     * \param params parameters with which glyphs are flattened
     *               and rasterized
     */
    explicit
    CachingGlyphRenderer(const RasterParams &params = RasterParams());

    ~CachingGlyphRenderer();

    /*!
     * Returns the parameters passed in the ctor.
     */
    const RasterParams&
    params(void) const;

    /*!
     * Returns the cache of the renderer.
     */
    GlyphCache&
    cache(void);

    /*!
     * Returns the cache of the renderer.
     */
    const GlyphCache&
    cache(void) const;

    /*!
     * Clears the cache and forgets the stroke styles seen so far.
     * The coverage maps held by operations already created stay
     * valid.
     */
    void
    clear(void);

    /*!
     * Returns the number of distinct stroke styles seen since
     * the renderer was created or last cleared.
     */
    unsigned int
    number_stroke_styles(void) const;

    /*!
     * Append the operations drawing a GlyphRun. Glyphs whose
     * outline cannot be fetched and glyphs that cover no
     * pixels (such as a space) create no operation. Returns
     * the number of operations appended.
     * \param run glyphs to draw
     * \param brush brush filling the glyphs; if nullptr, the
     *              glyphs are not filled
     * \param pen pen stroking the outline of the glyphs; if
     *            nullptr, the outline is not stroked
     * \param out_operations (output) location to which to append
     */
    unsigned int
    render(const GlyphRun &run,
           const reference_counted_ptr<const Brush> &brush,
           const Pen *pen,
           std::vector<DrawingOperation> *out_operations);

  private:
    void *m_d;
  };
/*! @} */
}
