/*!
 * \file raster_params.cpp
 * \brief file raster_params.cpp
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

#include <coverdraw/raster/raster_params.hpp>
#include <coverdraw/path.hpp>
#include <private/util_private.hpp>

namespace
{
  class RasterParamsPrivate
  {
  public:
    RasterParamsPrivate(void):
      m_sub_samples(16),
      m_curve_tolerance(coverdraw::PathEnums::default_curve_tolerance()),
      m_antialias(true),
      m_number_threads(0),
      m_allocator(coverdraw::ScratchAllocator::default_allocator())
    {}

    unsigned int m_sub_samples;
    float m_curve_tolerance;
    bool m_antialias;
    unsigned int m_number_threads;
    coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator> m_allocator;
  };
}

/////////////////////////////////////
// coverdraw::RasterParams methods
coverdraw::RasterParams::
RasterParams(void)
{
  m_d = COVERDRAWnew RasterParamsPrivate();
}

copy_ctor(coverdraw::RasterParams, RasterParams, RasterParamsPrivate)

coverdraw::RasterParams::
~RasterParams()
{
  RasterParamsPrivate *d;
  d = static_cast<RasterParamsPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

assign_swap_implement(coverdraw::RasterParams)

setget_implement_require(coverdraw::RasterParams, RasterParamsPrivate, unsigned int, sub_samples,
                         v > 0, "sub_samples must be positive")
setget_implement_require(coverdraw::RasterParams, RasterParamsPrivate, float, curve_tolerance,
                         v > 0.0f, "curve_tolerance must be positive")
setget_implement(coverdraw::RasterParams, RasterParamsPrivate, bool, antialias)
setget_implement(coverdraw::RasterParams, RasterParamsPrivate, unsigned int, number_threads)
setget_implement_require(coverdraw::RasterParams, RasterParamsPrivate,
                         const coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator>&, allocator,
                         v.get() != nullptr, "allocator must not be nullptr")
