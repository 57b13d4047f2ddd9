/*!
 * \file pen.cpp
 * \brief file pen.cpp
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

#include <vector>
#include <coverdraw/pen.hpp>
#include <private/util_private.hpp>

namespace
{
  class PenPrivate
  {
  public:
    PenPrivate(const coverdraw::reference_counted_ptr<const coverdraw::Brush> &brush, float width):
      m_brush(brush),
      m_width(width),
      m_join_style(coverdraw::RasterEnums::miter_joins),
      m_cap_style(coverdraw::RasterEnums::flat_caps),
      m_miter_limit(4.0f)
    {}

    coverdraw::reference_counted_ptr<const coverdraw::Brush> m_brush;
    float m_width;
    std::vector<float> m_dash_pattern;
    enum coverdraw::RasterEnums::join_style m_join_style;
    enum coverdraw::RasterEnums::cap_style m_cap_style;
    float m_miter_limit;
  };
}

////////////////////////////
// coverdraw::Pen methods
coverdraw::Pen::
Pen(const reference_counted_ptr<const Brush> &brush, float width)
{
  COVERDRAWrequire(width > 0.0f, "Pen width must be positive");
  m_d = COVERDRAWnew PenPrivate(brush, width);
}

copy_ctor(coverdraw::Pen, Pen, PenPrivate)

coverdraw::Pen::
~Pen()
{
  PenPrivate *d;
  d = static_cast<PenPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

assign_swap_implement(coverdraw::Pen)

get_implement(coverdraw::Pen, PenPrivate, const coverdraw::reference_counted_ptr<const coverdraw::Brush>&, brush)
get_implement(coverdraw::Pen, PenPrivate, float, width)
setget_implement(coverdraw::Pen, PenPrivate, enum coverdraw::RasterEnums::join_style, join_style)
setget_implement(coverdraw::Pen, PenPrivate, enum coverdraw::RasterEnums::cap_style, cap_style)
setget_implement_require(coverdraw::Pen, PenPrivate, float, miter_limit,
                         v > 0.0f, "miter_limit must be positive")

coverdraw::c_array<const float>
coverdraw::Pen::
dash_pattern(void) const
{
  PenPrivate *d;
  d = static_cast<PenPrivate*>(m_d);
  return make_c_array(d->m_dash_pattern);
}

coverdraw::Pen&
coverdraw::Pen::
dash_pattern(c_array<const float> v)
{
  PenPrivate *d;
  float total(0.0f);

  for (float f : v)
    {
      COVERDRAWrequire(f >= 0.0f, "dash lengths must be non-negative");
      total += f;
    }
  COVERDRAWrequire(v.empty() || total > 0.0f, "dash pattern must not be all zero");

  d = static_cast<PenPrivate*>(m_d);
  d->m_dash_pattern.assign(v.begin(), v.end());
  return *this;
}

bool
coverdraw::Pen::
dashed(void) const
{
  PenPrivate *d;
  d = static_cast<PenPrivate*>(m_d);
  return !d->m_dash_pattern.empty();
}
