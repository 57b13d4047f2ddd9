/*!
 * \file font_freetype.hpp
 * \brief file font_freetype.hpp
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

#include <coverdraw/text/glyph_source.hpp>
#include <coverdraw/text/freetype_lib.hpp>
#include <coverdraw/text/freetype_face.hpp>

namespace coverdraw
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A FontFreeType implements GlyphSource using the FreeType
   * library. Outlines are taken unhinted and are scaled to
   * the requested pixel size by FreeType.
   */
  class FontFreeType:public GlyphSource
  {
  public:
    /*!
     * Ctor.
     * \param face_generator object used to generate the FT_Face
     *                       from which glyphs are fetched
     * \param lib the FreeTypeLib used to create the face; if
     *            nullptr, a new FreeTypeLib is created
     */
    explicit
    FontFreeType(const reference_counted_ptr<FreeTypeFace::GeneratorBase> &face_generator,
                 const reference_counted_ptr<FreeTypeLib> &lib = reference_counted_ptr<FreeTypeLib>());

    ~FontFreeType();

    /*!
     * Returns true if the face was created successfully;
     * if false, every fetch of an outline fails and every
     * glyph has zero metrics.
     */
    bool
    valid(void) const;

    /*!
     * Returns the number of glyphs of the face.
     */
    unsigned int
    number_glyphs(void) const;

    /*!
     * Returns the FreeTypeFace::GeneratorBase that generated
     * the face used by this FontFreeType.
     */
    const reference_counted_ptr<FreeTypeFace::GeneratorBase>&
    face_generator(void) const;

    /*!
     * Returns the FreeTypeLib used by this FontFreeType.
     */
    const reference_counted_ptr<FreeTypeLib>&
    lib(void) const;

    virtual
    uint32_t
    glyph_code(uint32_t character_code) const;

    virtual
    enum return_code
    glyph_outline(uint32_t glyph_code, unsigned int pixel_size,
                  Path *out_path) const;

    virtual
    GlyphMetrics
    glyph_metrics(uint32_t glyph_code, unsigned int pixel_size) const;

  private:
    void *m_d;
  };
/*! @} */
}
