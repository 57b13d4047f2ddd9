/*!
 * \file gradient_brush.cpp
 * \brief file gradient_brush.cpp
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
#include <coverdraw/brush/gradient_brush.hpp>
#include <coverdraw/util/math.hpp>
#include <private/util_private.hpp>

namespace
{
  class LinearGradientBrushPrivate
  {
  public:
    LinearGradientBrushPrivate(const coverdraw::vec2 &start_pt,
                               const coverdraw::vec2 &end_pt,
                               const coverdraw::ColorStopArray &stops,
                               enum coverdraw::LinearGradientBrush::spread_type_t spread,
                               unsigned int lookup_size);

    float
    interpolate(const coverdraw::vec2 &p) const;

    const coverdraw::vec4&
    lookup(float t) const
    {
      unsigned int I;

      I = static_cast<unsigned int>(t * m_lookup_max + 0.5f);
      return m_lookup[coverdraw::t_min(I, static_cast<unsigned int>(m_lookup.size() - 1))];
    }

    coverdraw::vec2 m_start, m_delta;
    float m_recip_length_sq;
    enum coverdraw::LinearGradientBrush::spread_type_t m_spread;
    std::vector<coverdraw::vec4> m_lookup;
    float m_lookup_max;
  };

  class LinearGradientBrushApplicator:public coverdraw::BrushApplicator
  {
  public:
    LinearGradientBrushApplicator(const LinearGradientBrushPrivate *gradient,
                                  const coverdraw::GraphicsOptions &options,
                                  coverdraw::ImageFrame &frame,
                                  const coverdraw::IRect &region,
                                  const coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator> &allocator,
                                  const coverdraw::reference_counted_ptr<const coverdraw::LinearGradientBrush> &brush):
      coverdraw::BrushApplicator(options, frame, region, allocator),
      m_gradient(gradient),
      m_brush(brush)
    {}

  protected:
    virtual
    void
    colors(int x, int y, coverdraw::c_array<coverdraw::vec4> out_colors) const
    {
      coverdraw::vec2 p(static_cast<float>(x) + 0.5f, static_cast<float>(y) + 0.5f);

      for (coverdraw::vec4 &c : out_colors)
        {
          c = m_gradient->lookup(m_gradient->interpolate(p));
          p.x() += 1.0f;
        }
    }

  private:
    const LinearGradientBrushPrivate *m_gradient;
    coverdraw::reference_counted_ptr<const coverdraw::LinearGradientBrush> m_brush;
  };
}

////////////////////////////////////////////
// LinearGradientBrushPrivate methods
LinearGradientBrushPrivate::
LinearGradientBrushPrivate(const coverdraw::vec2 &start_pt,
                           const coverdraw::vec2 &end_pt,
                           const coverdraw::ColorStopArray &stops,
                           enum coverdraw::LinearGradientBrush::spread_type_t spread,
                           unsigned int lookup_size):
  m_start(start_pt),
  m_delta(end_pt - start_pt),
  m_spread(spread),
  m_lookup(lookup_size),
  m_lookup_max(static_cast<float>(lookup_size - 1))
{
  float length_sq;

  length_sq = m_delta.magnitudeSq();
  m_recip_length_sq = (length_sq > 0.0f) ? 1.0f / length_sq : 0.0f;

  for (unsigned int i = 0; i < lookup_size; ++i)
    {
      m_lookup[i] = stops.color(static_cast<float>(i) / m_lookup_max);
    }
}

float
LinearGradientBrushPrivate::
interpolate(const coverdraw::vec2 &p) const
{
  float t;

  t = coverdraw::dot(p - m_start, m_delta) * m_recip_length_sq;
  return coverdraw::LinearGradientBrush::apply_spread(t, m_spread);
}

/////////////////////////////////////////////
// coverdraw::LinearGradientBrush methods
coverdraw::LinearGradientBrush::
LinearGradientBrush(const vec2 &start_pt, const vec2 &end_pt,
                    const ColorStopArray &stops,
                    enum spread_type_t spread,
                    unsigned int lookup_size)
{
  COVERDRAWrequire(!stops.values().empty(), "LinearGradientBrush requires at least one ColorStop");
  COVERDRAWrequire(lookup_size >= 2, "LinearGradientBrush lookup table needs at least 2 entries");
  COVERDRAWrequire(spread < number_spread_types, "invalid spread_type_t");
  m_d = COVERDRAWnew LinearGradientBrushPrivate(start_pt, end_pt, stops, spread, lookup_size);
}

coverdraw::LinearGradientBrush::
~LinearGradientBrush()
{
  LinearGradientBrushPrivate *d;
  d = static_cast<LinearGradientBrushPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

float
coverdraw::LinearGradientBrush::
apply_spread(float t, enum spread_type_t spread)
{
  switch (spread)
    {
    case spread_mirror:
      return t_min(t_abs(t), 1.0f);

    case spread_repeat:
      return t - t_floor(t);

    case spread_mirror_repeat:
      {
        float m;
        m = t - 2.0f * t_floor(0.5f * t);
        return 1.0f - t_abs(m - 1.0f);
      }

    default:
      return t_clamp(t, 0.0f, 1.0f);
    }
}

float
coverdraw::LinearGradientBrush::
interpolate(const vec2 &p) const
{
  LinearGradientBrushPrivate *d;
  d = static_cast<LinearGradientBrushPrivate*>(m_d);
  return d->interpolate(p);
}

coverdraw::vec4
coverdraw::LinearGradientBrush::
color(int x, int y) const
{
  LinearGradientBrushPrivate *d;
  d = static_cast<LinearGradientBrushPrivate*>(m_d);
  return d->lookup(d->interpolate(vec2(static_cast<float>(x) + 0.5f,
                                       static_cast<float>(y) + 0.5f)));
}

coverdraw::reference_counted_ptr<coverdraw::BrushApplicator>
coverdraw::LinearGradientBrush::
create_applicator(const GraphicsOptions &options, ImageFrame &frame,
                  const IRect &region,
                  const reference_counted_ptr<ScratchAllocator> &allocator) const
{
  LinearGradientBrushPrivate *d;
  d = static_cast<LinearGradientBrushPrivate*>(m_d);
  return COVERDRAWnew LinearGradientBrushApplicator(d, options, frame, region, allocator, this);
}
