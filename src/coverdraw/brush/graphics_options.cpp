/*!
 * \file graphics_options.cpp
 * \brief file graphics_options.cpp
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

#include <coverdraw/brush/graphics_options.hpp>
#include <private/util_private.hpp>

namespace
{
  class GraphicsOptionsPrivate
  {
  public:
    GraphicsOptionsPrivate(void):
      m_blend_percentage(1.0f)
    {}

    float m_blend_percentage;
  };
}

//////////////////////////////////////
// coverdraw::GraphicsOptions methods
coverdraw::GraphicsOptions::
GraphicsOptions(void)
{
  m_d = COVERDRAWnew GraphicsOptionsPrivate();
}

copy_ctor(coverdraw::GraphicsOptions, GraphicsOptions, GraphicsOptionsPrivate)

coverdraw::GraphicsOptions::
~GraphicsOptions()
{
  GraphicsOptionsPrivate *d;
  d = static_cast<GraphicsOptionsPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

assign_swap_implement(coverdraw::GraphicsOptions)

setget_implement_require(coverdraw::GraphicsOptions, GraphicsOptionsPrivate, float, blend_percentage,
                         v >= 0.0f, "blend_percentage must be non-negative")
