/*!
 * \file image_frame.cpp
 * \brief file image_frame.cpp
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

#include <algorithm>
#include <vector>
#include <coverdraw/image_frame.hpp>
#include <private/util_private.hpp>

namespace
{
  class ImageFramePrivate
  {
  public:
    ImageFramePrivate(int w, int h, const coverdraw::vec4 &clear_color):
      m_width(w),
      m_height(h),
      m_pixels(static_cast<size_t>(w) * static_cast<size_t>(h), clear_color)
    {}

    int m_width, m_height;
    std::vector<coverdraw::vec4> m_pixels;
  };
}

////////////////////////////////
// coverdraw::ImageFrame methods
coverdraw::ImageFrame::
ImageFrame(int width, int height, const vec4 &clear_color)
{
  COVERDRAWrequire(width >= 0 && height >= 0, "ImageFrame dimensions must be non-negative");
  m_d = COVERDRAWnew ImageFramePrivate(width, height, clear_color);
}

coverdraw::ImageFrame::
~ImageFrame()
{
  ImageFramePrivate *d;
  d = static_cast<ImageFramePrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

get_implement(coverdraw::ImageFrame, ImageFramePrivate, int, width)
get_implement(coverdraw::ImageFrame, ImageFramePrivate, int, height)

coverdraw::IRect
coverdraw::ImageFrame::
bounds(void) const
{
  ImageFramePrivate *d;
  d = static_cast<ImageFramePrivate*>(m_d);
  return IRect(0, 0, d->m_width, d->m_height);
}

coverdraw::c_array<coverdraw::vec4>
coverdraw::ImageFrame::
row(int y)
{
  ImageFramePrivate *d;
  d = static_cast<ImageFramePrivate*>(m_d);

  COVERDRAWassert(y >= 0 && y < d->m_height);
  if (d->m_width == 0)
    {
      return c_array<vec4>();
    }
  return make_c_array(d->m_pixels).sub_array(y * d->m_width, d->m_width);
}

coverdraw::c_array<const coverdraw::vec4>
coverdraw::ImageFrame::
row(int y) const
{
  ImageFramePrivate *d;
  d = static_cast<ImageFramePrivate*>(m_d);

  COVERDRAWassert(y >= 0 && y < d->m_height);
  if (d->m_width == 0)
    {
      return c_array<const vec4>();
    }
  return make_c_array(d->m_pixels).sub_array(y * d->m_width, d->m_width);
}

coverdraw::vec4&
coverdraw::ImageFrame::
pixel(int x, int y)
{
  ImageFramePrivate *d;
  d = static_cast<ImageFramePrivate*>(m_d);

  COVERDRAWassert(x >= 0 && x < d->m_width);
  COVERDRAWassert(y >= 0 && y < d->m_height);
  return d->m_pixels[y * d->m_width + x];
}

const coverdraw::vec4&
coverdraw::ImageFrame::
pixel(int x, int y) const
{
  ImageFramePrivate *d;
  d = static_cast<ImageFramePrivate*>(m_d);

  COVERDRAWassert(x >= 0 && x < d->m_width);
  COVERDRAWassert(y >= 0 && y < d->m_height);
  return d->m_pixels[y * d->m_width + x];
}

void
coverdraw::ImageFrame::
clear(const vec4 &color)
{
  ImageFramePrivate *d;
  d = static_cast<ImageFramePrivate*>(m_d);
  std::fill(d->m_pixels.begin(), d->m_pixels.end(), color);
}
