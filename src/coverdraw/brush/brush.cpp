/*!
 * \file brush.cpp
 * \brief file brush.cpp
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

#include <map>
#include <thread>
#include <coverdraw/brush/brush.hpp>
#include <coverdraw/util/math.hpp>
#include <coverdraw/util/mutex.hpp>
#include <private/util_private.hpp>

namespace
{
  class ScratchRecord:coverdraw::noncopyable
  {
  public:
    ScratchRecord(const coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator> &allocator,
                  int width):
      m_amounts(allocator, width, 0.0f),
      m_overlays(allocator, width, coverdraw::vec4(0.0f))
    {}

    coverdraw::ScratchBuffer<float> m_amounts;
    coverdraw::ScratchBuffer<coverdraw::vec4> m_overlays;
  };

  class BrushApplicatorPrivate
  {
  public:
    BrushApplicatorPrivate(const coverdraw::GraphicsOptions &options,
                           coverdraw::ImageFrame &frame,
                           const coverdraw::IRect &region,
                           const coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator> &allocator):
      m_options(options),
      m_frame(frame),
      m_region(region),
      m_allocator(allocator)
    {}

    ~BrushApplicatorPrivate();

    ScratchRecord&
    scratch(void);

    coverdraw::GraphicsOptions m_options;
    coverdraw::ImageFrame &m_frame;
    coverdraw::IRect m_region;
    coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator> m_allocator;

    /* the mutex guards only lookup and insertion; a record
     * is used solely by the thread owning it.
     */
    coverdraw::Mutex m_mutex;
    std::map<std::thread::id, ScratchRecord*> m_scratch;
  };
}

///////////////////////////////////////
// BrushApplicatorPrivate methods
BrushApplicatorPrivate::
~BrushApplicatorPrivate()
{
  for (const auto &v : m_scratch)
    {
      COVERDRAWdelete(v.second);
    }
}

ScratchRecord&
BrushApplicatorPrivate::
scratch(void)
{
  coverdraw::Mutex::Guard m(m_mutex);
  std::thread::id id(std::this_thread::get_id());
  std::map<std::thread::id, ScratchRecord*>::iterator iter;

  iter = m_scratch.find(id);
  if (iter != m_scratch.end())
    {
      return *iter->second;
    }

  ScratchRecord *p;
  p = COVERDRAWnew ScratchRecord(m_allocator, m_frame.width());
  m_scratch[id] = p;
  return *p;
}

////////////////////////////////////////
// coverdraw::BrushApplicator methods
coverdraw::BrushApplicator::
BrushApplicator(const GraphicsOptions &options, ImageFrame &frame,
                const IRect &region,
                const reference_counted_ptr<ScratchAllocator> &allocator)
{
  COVERDRAWrequire(allocator.get() != nullptr, "BrushApplicator requires an allocator");
  m_d = COVERDRAWnew BrushApplicatorPrivate(options, frame, region, allocator);
}

coverdraw::BrushApplicator::
~BrushApplicator()
{
  BrushApplicatorPrivate *d;
  d = static_cast<BrushApplicatorPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

void
coverdraw::BrushApplicator::
apply(c_array<const float> coverage, int x, int y)
{
  BrushApplicatorPrivate *d;
  unsigned int n;
  float blend_percentage;

  d = static_cast<BrushApplicatorPrivate*>(m_d);
  if (y < 0 || y >= d->m_frame.height() || x >= d->m_frame.width())
    {
      return;
    }

  /* clip the run to the columns of the frame */
  if (x < 0)
    {
      size_t skip(static_cast<size_t>(-static_cast<int64_t>(x)));

      if (skip >= coverage.size())
        {
          return;
        }
      coverage = coverage.sub_array(skip);
      x = 0;
    }

  n = static_cast<unsigned int>(t_min(coverage.size(), static_cast<size_t>(d->m_frame.width() - x)));
  if (n == 0)
    {
      return;
    }

  ScratchRecord &record(d->scratch());
  c_array<float> amounts(record.m_amounts.data().sub_array(0, n));
  c_array<vec4> overlays(record.m_overlays.data().sub_array(0, n));
  c_array<vec4> dst(d->m_frame.row(y).sub_array(x, n));

  blend_percentage = d->m_options.blend_percentage();
  for (unsigned int i = 0; i < n; ++i)
    {
      amounts[i] = t_clamp(coverage[i] * blend_percentage, 0.0f, 1.0f);
    }

  colors(x, y, overlays);

  for (unsigned int i = 0; i < n; ++i)
    {
      float a;
      vec4 &p(dst[i]);

      a = amounts[i] * overlays[i].w();
      if (a <= 0.0f)
        {
          continue;
        }

      p.x() = p.x() * (1.0f - a) + overlays[i].x() * a;
      p.y() = p.y() * (1.0f - a) + overlays[i].y() * a;
      p.z() = p.z() * (1.0f - a) + overlays[i].z() * a;
      p.w() = a + p.w() * (1.0f - a);
    }
}

const coverdraw::GraphicsOptions&
coverdraw::BrushApplicator::
options(void) const
{
  BrushApplicatorPrivate *d;
  d = static_cast<BrushApplicatorPrivate*>(m_d);
  return d->m_options;
}

coverdraw::ImageFrame&
coverdraw::BrushApplicator::
frame(void) const
{
  BrushApplicatorPrivate *d;
  d = static_cast<BrushApplicatorPrivate*>(m_d);
  return d->m_frame;
}

const coverdraw::IRect&
coverdraw::BrushApplicator::
region(void) const
{
  BrushApplicatorPrivate *d;
  d = static_cast<BrushApplicatorPrivate*>(m_d);
  return d->m_region;
}

unsigned int
coverdraw::BrushApplicator::
number_scratch_records(void) const
{
  BrushApplicatorPrivate *d;
  d = static_cast<BrushApplicatorPrivate*>(m_d);

  Mutex::Guard m(d->m_mutex);
  return d->m_scratch.size();
}
