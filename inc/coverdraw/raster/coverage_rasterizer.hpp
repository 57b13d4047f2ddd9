/*!
 * \file coverage_rasterizer.hpp
 * \brief file coverage_rasterizer.hpp
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
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/rect.hpp>
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/flattened_path.hpp>
#include <coverdraw/raster/raster_enums.hpp>
#include <coverdraw/raster/fill_rule.hpp>
#include <coverdraw/raster/edge_table.hpp>
#include <coverdraw/raster/coverage_map.hpp>
#include <coverdraw/raster/raster_params.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * Adds to each element of a row the length of the overlap
   * of its pixel with the spans, multiplied by weight. Element
   * c of row is the pixel covering [x0 + c, x0 + c + 1).
   * \param spans spans of one scan line
   * \param x0 x-coordinate of the left side of the first pixel
   * \param weight multiplier for the overlap lengths
   * \param row (output) values to which to add
   */
  void
  accumulate_span_coverage(c_array<const Span> spans, int x0,
                           float weight, c_array<float> row);

  /*!
   * Computes the coverage of a pixel row from the spans of
   * its sub-sample scan lines. The row is first cleared, then
   * the spans of each sub-sample are accumulated with weight
   * 1 / sub_samples and finally each value is clamped to [0, 1],
   * where values within 1e-4 of 0 or 1 become exactly 0 or 1.
   * \param subsample_spans spans of each sub-sample scan line
   * \param sub_samples number of sub-samples of the row
   * \param x0 x-coordinate of the left side of the first pixel
   * \param row (output) location to which to write coverage values
   */
  void
  coverage_row(c_array<const std::vector<Span> > subsample_spans,
               unsigned int sub_samples, int x0, c_array<float> row);

  /*!
   * \brief
   * A CoverageRasterizer computes the CoverageMap of a
   * FlattenedPath under a fill rule.
   */
  class CoverageRasterizer:noncopyable
  {
  public:
    /*!
     * Ctor.
     * \param params parameters of rasterization, value is copied
     */
    explicit
    CoverageRasterizer(const RasterParams &params = RasterParams());

    ~CoverageRasterizer();

    /*!
     * Returns the parameters of rasterization.
     */
    const RasterParams&
    params(void) const;

    /*!
     * Computes the coverage of a path. The map covers the
     * pixels of the bounding box of the path, i.e. from the
     * floor of its minimum to the ceiling of its maximum,
     * intersected with clip when clip is given; an empty path
     * gives a map with no pixels. The sub-sample scan lines of
     * pixel row r are at r + (i + 0.5) / n for 0 <= i < n where
     * n is RasterParams::sub_samples(), or just r + 0.5 if
     * RasterParams::antialias() is false. A path with non-finite
     * coordinates, or whose (clipped) bounds lie beyond 2^30
     * pixels, is logged and gives a map with no pixels.
     * \param path polygons to rasterize; open polygons are
     *             filled as if closed
     * \param fill_rule fill rule deciding what is inside
     * \param clip if non-null, pixels outside of it are
     *             not computed
     */
    reference_counted_ptr<CoverageMap>
    rasterize(const FlattenedPath &path,
              enum RasterEnums::fill_rule_t fill_rule,
              const IRect *clip = nullptr) const;

    /*!
     * Computes the coverage of a path under a custom
     * fill rule, as above.
     */
    reference_counted_ptr<CoverageMap>
    rasterize(const FlattenedPath &path,
              const CustomFillRuleBase &fill_rule,
              const IRect *clip = nullptr) const;

  private:
    void *m_d;
  };

/*! @} */
}
