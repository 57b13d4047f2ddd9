/*!
 * \file solid_brush.cpp
 * \brief file solid_brush.cpp
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

#include <coverdraw/brush/solid_brush.hpp>
#include <private/util_private.hpp>

namespace
{
  class SolidBrushApplicator:public coverdraw::BrushApplicator
  {
  public:
    SolidBrushApplicator(const coverdraw::vec4 &color,
                         const coverdraw::GraphicsOptions &options,
                         coverdraw::ImageFrame &frame,
                         const coverdraw::IRect &region,
                         const coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator> &allocator):
      coverdraw::BrushApplicator(options, frame, region, allocator),
      m_color(color)
    {}

  protected:
    virtual
    void
    colors(int x, int y, coverdraw::c_array<coverdraw::vec4> out_colors) const
    {
      COVERDRAWunused(x);
      COVERDRAWunused(y);
      for (coverdraw::vec4 &c : out_colors)
        {
          c = m_color;
        }
    }

  private:
    coverdraw::vec4 m_color;
  };
}

/////////////////////////////////
// coverdraw::SolidBrush methods
coverdraw::SolidBrush::
SolidBrush(const vec4 &color):
  m_color(color)
{}

coverdraw::reference_counted_ptr<coverdraw::BrushApplicator>
coverdraw::SolidBrush::
create_applicator(const GraphicsOptions &options, ImageFrame &frame,
                  const IRect &region,
                  const reference_counted_ptr<ScratchAllocator> &allocator) const
{
  return COVERDRAWnew SolidBrushApplicator(m_color, options, frame, region, allocator);
}
