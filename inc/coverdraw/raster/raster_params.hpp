/*!
 * \file raster_params.hpp
 * \brief file raster_params.hpp
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
#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/scratch_allocator.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * \brief
   * A RasterParams specifies how paths are converted to coverage
   * and how many threads do the work.
   */
  class RasterParams
  {
  public:
    /*!
     * Ctor, sets values to defaults:
     *  - sub_samples() = 16
     *  - curve_tolerance() = PathEnums::default_curve_tolerance()
     *  - antialias() = true
     *  - number_threads() = 0
     *  - allocator() = ScratchAllocator::default_allocator()
     */
    RasterParams(void);

    /*!
     * Copy ctor.
     * \param obj value from which to copy
     */
    RasterParams(const RasterParams &obj);

    ~RasterParams();

    /*!
     * Assignment operator.
     * \param rhs value from which to copy
     */
    RasterParams&
    operator=(const RasterParams &rhs);

    /*!
     * Swap operation
     * \param obj object with which to swap
     */
    void
    swap(RasterParams &obj);

    /*!
     * Number of sub-sample scan lines per pixel row used
     * to compute anti-aliased coverage.
     */
    unsigned int
    sub_samples(void) const;

    /*!
     * Set the value returned by sub_samples(void) const,
     * must be positive.
     */
    RasterParams&
    sub_samples(unsigned int v);

    /*!
     * Maximum distance in pixels between a curve and the
     * line segments that approximate it.
     */
    float
    curve_tolerance(void) const;

    /*!
     * Set the value returned by curve_tolerance(void) const,
     * must be positive.
     */
    RasterParams&
    curve_tolerance(float v);

    /*!
     * If false, coverage is computed from a single sample
     * at the pixel center and is either 0 or 1.
     */
    bool
    antialias(void) const;

    /*!
     * Set the value returned by antialias(void) const.
     */
    RasterParams&
    antialias(bool v);

    /*!
     * Number of threads that process rows; 0 indicates
     * to use one thread per hardware thread.
     */
    unsigned int
    number_threads(void) const;

    /*!
     * Set the value returned by number_threads(void) const.
     */
    RasterParams&
    number_threads(unsigned int v);

    /*!
     * Allocator providing coverage maps and scratch buffers.
     */
    const reference_counted_ptr<ScratchAllocator>&
    allocator(void) const;

    /*!
     * Set the value returned by allocator(void) const,
     * must not be nullptr.
     */
    RasterParams&
    allocator(const reference_counted_ptr<ScratchAllocator> &v);

  private:
    void *m_d;
  };

/*! @} */
}
