/*!
 * \file glyph_cache.hpp
 * \brief file glyph_cache.hpp
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

#include <stdint.h>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/vecN.hpp>
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/raster/coverage_map.hpp>

namespace coverdraw
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A GlyphCache stores the coverage of rendered glyphs so that
   * repeated glyphs are rasterized once. Glyphs are placed at
   * sub-pixel positions, which are rounded to one of
   * \ref number_sub_pixel_buckets positions per axis; the key
   * of an entry records the bucket.
   *
   * The methods of GlyphCache are thread safe because it
   * maintains an internal mutex lock for the durations
   * of its methods.
   */
  class GlyphCache:noncopyable
  {
  public:
    enum
      {
        /*!
         * Number of sub-pixel positions per axis.
         */
        number_sub_pixel_buckets = 8
      };

    /*!
     * \brief
     * A Key identifies a glyph rendered in one way
     * at a sub-pixel position.
     */
    class Key
    {
    public:
      Key(void):
        m_font_id(0),
        m_pixel_size(0),
        m_glyph_code(0),
        m_sub_pixel(0, 0),
        m_variant(0)
      {}

      /*!
       * Ctor.
       * \param font_id value with which to initialize \ref m_font_id
       * \param pixel_size value with which to initialize \ref m_pixel_size
       * \param glyph_code value with which to initialize \ref m_glyph_code
       * \param sub_pixel value with which to initialize \ref m_sub_pixel
       * \param variant value with which to initialize \ref m_variant
       */
      Key(uint32_t font_id, unsigned int pixel_size, uint32_t glyph_code,
          const ivec2 &sub_pixel, uint32_t variant = 0):
        m_font_id(font_id),
        m_pixel_size(pixel_size),
        m_glyph_code(glyph_code),
        m_sub_pixel(sub_pixel),
        m_variant(variant)
      {}

      /*!
       * Comparison operator for sorting.
       * \param rhs value to compare against
       */
      bool
      operator<(const Key &rhs) const;

      /*!
       * GlyphSource::font_id() of the source of the glyph
       */
      uint32_t m_font_id;

      /*!
       * Pixel size of the glyph
       */
      unsigned int m_pixel_size;

      /*!
       * Glyph code of the glyph
       */
      uint32_t m_glyph_code;

      /*!
       * Sub-pixel bucket of the glyph position, each
       * coordinate is in [0, number_sub_pixel_buckets)
       */
      ivec2 m_sub_pixel;

      /*!
       * Distinguishes the ways a glyph is rendered, for
       * example filled (value 0) or stroked with a pen.
       */
      uint32_t m_variant;
    };

    GlyphCache(void);

    ~GlyphCache();

    /*!
     * Splits a position into the pixel and the sub-pixel
     * bucket; each coordinate of the bucket is the fraction
     * rounded to a multiple of 1 / number_sub_pixel_buckets,
     * and a fraction that rounds up to a whole pixel is
     * carried into the pixel.
     * \param position position to split
     * \param out_pixel (output) location to which to write the pixel
     * \param out_sub_pixel (output) location to which to write the bucket
     */
    static
    void
    split_position(const vec2 &position, ivec2 *out_pixel, ivec2 *out_sub_pixel);

    /*!
     * Returns the offset within a pixel of a sub-pixel bucket,
     * i.e. bucket / number_sub_pixel_buckets.
     */
    static
    vec2
    sub_pixel_offset(const ivec2 &sub_pixel);

    /*!
     * Fetch an entry; returns true and writes the entry to
     * out_coverage if the key is in the cache. Every fetch
     * increments either number_hits() or number_misses().
     * \param key key of the entry
     * \param out_coverage (output) location to which to write
     *                     the coverage of the entry
     */
    bool
    fetch(const Key &key, reference_counted_ptr<const CoverageMap> *out_coverage);

    /*!
     * Store an entry, replacing the entry of the key if present.
     * \param key key of the entry
     * \param coverage coverage of the glyph, relative to the
     *                 pixel of the glyph position
     */
    void
    store(const Key &key, const reference_counted_ptr<const CoverageMap> &coverage);

    /*!
     * Remove all entries; the hit and miss counters are
     * not reset.
     */
    void
    clear(void);

    /*!
     * Returns the number of entries.
     */
    unsigned int
    size(void) const;

    /*!
     * Returns the number of calls to fetch() that found
     * their key.
     */
    unsigned int
    number_hits(void) const;

    /*!
     * Returns the number of calls to fetch() that did
     * not find their key.
     */
    unsigned int
    number_misses(void) const;

  private:
    void *m_d;
  };
/*! @} */
}
