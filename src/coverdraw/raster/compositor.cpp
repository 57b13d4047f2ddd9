/*!
 * \file compositor.cpp
 * \brief file compositor.cpp
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
#include <coverdraw/raster/compositor.hpp>
#include <coverdraw/util/math.hpp>
#include <coverdraw/util/log.hpp>
#include <private/util_private.hpp>
#include <private/util_private_ostream.hpp>
#include <private/parallel_rows.hpp>

namespace
{
  class CompositorPrivate
  {
  public:
    CompositorPrivate(const coverdraw::RasterParams &params,
                      const coverdraw::GraphicsOptions &options):
      m_params(params),
      m_options(options)
    {}

    coverdraw::RasterParams m_params;
    coverdraw::GraphicsOptions m_options;
  };

  class OrderByPass
  {
  public:
    explicit
    OrderByPass(coverdraw::c_array<const coverdraw::DrawingOperation> ops):
      m_ops(ops)
    {}

    bool
    operator()(unsigned int lhs, unsigned int rhs) const
    {
      return m_ops[lhs].m_render_pass < m_ops[rhs].m_render_pass;
    }

  private:
    coverdraw::c_array<const coverdraw::DrawingOperation> m_ops;
  };
}

///////////////////////////////////
// coverdraw::Compositor methods
coverdraw::Compositor::
Compositor(const RasterParams &params, const GraphicsOptions &options)
{
  m_d = COVERDRAWnew CompositorPrivate(params, options);
}

coverdraw::Compositor::
~Compositor()
{
  CompositorPrivate *d;
  d = static_cast<CompositorPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

const coverdraw::RasterParams&
coverdraw::Compositor::
params(void) const
{
  CompositorPrivate *d;
  d = static_cast<CompositorPrivate*>(m_d);
  return d->m_params;
}

const coverdraw::GraphicsOptions&
coverdraw::Compositor::
options(void) const
{
  CompositorPrivate *d;
  d = static_cast<CompositorPrivate*>(m_d);
  return d->m_options;
}

unsigned int
coverdraw::Compositor::
composite(c_array<const DrawingOperation> operations,
          ImageFrame &frame, const IRect &region) const
{
  CompositorPrivate *d;
  std::vector<unsigned int> order(operations.size());
  unsigned int number_composited(0), number_skipped(0);
  unsigned int max_workers;
  IRect clip;

  d = static_cast<CompositorPrivate*>(m_d);
  clip = region.intersection(frame.bounds());
  max_workers = detail::effective_number_workers(d->m_params.number_threads());

  for (unsigned int i = 0; i < order.size(); ++i)
    {
      order[i] = i;
    }
  std::stable_sort(order.begin(), order.end(), OrderByPass(operations));

  for (unsigned int idx : order)
    {
      const DrawingOperation &op(operations[idx]);
      int ox, oy, w, h;
      int start_x, skip, length, row_begin, row_end;

      if (!op.m_brush || !op.m_coverage || op.m_coverage->empty() || clip.empty())
        {
          ++number_skipped;
          continue;
        }

      ox = op.m_origin.x();
      oy = op.m_origin.y();
      w = op.m_coverage->width();
      h = op.m_coverage->height();

      if (ox + w <= clip.min_x() || oy + h <= clip.min_y()
          || ox >= clip.max_x() || oy >= clip.max_y())
        {
          ++number_skipped;
          continue;
        }

      /* samples [skip, skip + length) of each coverage row
       * land on columns [start_x, start_x + length).
       */
      start_x = t_max(ox, clip.min_x());
      skip = start_x - ox;
      length = t_min(ox + w, clip.max_x()) - start_x;
      row_begin = t_max(0, clip.min_y() - oy);
      row_end = t_min(h, clip.max_y() - oy);

      COVERDRAWassert(skip >= 0 && length > 0 && row_begin < row_end);

      const CoverageMap &coverage(*op.m_coverage);
      reference_counted_ptr<BrushApplicator> applicator;
      unsigned int number_workers;

      applicator = op.m_brush->create_applicator(d->m_options, frame, clip,
                                                 d->m_params.allocator());
      number_workers = t_min(max_workers, static_cast<unsigned int>(row_end - row_begin));
      detail::run_rows(number_workers, row_begin, row_end,
                       [&](int r, unsigned int)
                       {
                         applicator->apply(coverage.row(r).sub_array(skip, length),
                                           start_x, oy + r);
                       });
      ++number_composited;
    }

  COVERDRAWlog_debug("composited " << number_composited << " of "
                     << operations.size() << " operations into " << clip
                     << ", " << number_skipped << " skipped");

  return number_composited;
}
