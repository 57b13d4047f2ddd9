/*!
 * \file coverage_rasterizer.cpp
 * \brief file coverage_rasterizer.cpp
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

#include <cmath>
#include <vector>
#include <coverdraw/raster/coverage_rasterizer.hpp>
#include <coverdraw/util/math.hpp>
#include <coverdraw/util/log.hpp>
#include <private/util_private.hpp>
#include <private/parallel_rows.hpp>
#include <private/util_private_ostream.hpp>

namespace
{
  const float snap_epsilon = 1e-4f;

  /* bounds beyond this magnitude do not convert to int pixels */
  const float max_pixel_coordinate = 1073741824.0f;

  bool
  finite_point(const coverdraw::vec2 &p)
  {
    return std::isfinite(p.x()) && std::isfinite(p.y());
  }

  bool
  representable_point(const coverdraw::vec2 &p)
  {
    return coverdraw::t_abs(p.x()) <= max_pixel_coordinate
      && coverdraw::t_abs(p.y()) <= max_pixel_coordinate;
  }

  class CoverageRasterizerPrivate
  {
  public:
    explicit
    CoverageRasterizerPrivate(const coverdraw::RasterParams &params):
      m_params(params)
    {}

    coverdraw::RasterParams m_params;
  };

  /* scratch of a single worker */
  class PerWorker
  {
  public:
    std::vector<std::vector<coverdraw::Span> > m_spans;
  };
}

void
coverdraw::
accumulate_span_coverage(c_array<const Span> spans, int x0,
                         float weight, c_array<float> row)
{
  float row_end(static_cast<float>(row.size()));

  for (const Span &S : spans)
    {
      float a, b;
      int c_begin, c_end;

      /* into the coordinates of the row */
      a = t_max(0.0f, S.m_enter - static_cast<float>(x0));
      b = t_min(row_end, S.m_exit - static_cast<float>(x0));
      if (!(a < b))
        {
          continue;
        }

      c_begin = static_cast<int>(t_floor(a));
      c_end = t_min(static_cast<int>(t_ceil(b)), static_cast<int>(row.size()));
      for (int c = c_begin; c < c_end; ++c)
        {
          float lo, hi;

          lo = t_max(a, static_cast<float>(c));
          hi = t_min(b, static_cast<float>(c + 1));
          if (lo < hi)
            {
              row[c] += weight * (hi - lo);
            }
        }
    }
}

void
coverdraw::
coverage_row(c_array<const std::vector<Span> > subsample_spans,
             unsigned int sub_samples, int x0, c_array<float> row)
{
  float weight;

  COVERDRAWassert(sub_samples > 0);
  weight = 1.0f / static_cast<float>(sub_samples);

  for (float &v : row)
    {
      v = 0.0f;
    }

  for (const std::vector<Span> &spans : subsample_spans)
    {
      accumulate_span_coverage(make_c_array(spans), x0, weight, row);
    }

  for (float &v : row)
    {
      if (v < snap_epsilon)
        {
          v = 0.0f;
        }
      else if (v > 1.0f - snap_epsilon)
        {
          v = 1.0f;
        }
    }
}

/////////////////////////////////////
// coverdraw::CoverageRasterizer methods
coverdraw::CoverageRasterizer::
CoverageRasterizer(const RasterParams &params)
{
  m_d = COVERDRAWnew CoverageRasterizerPrivate(params);
}

coverdraw::CoverageRasterizer::
~CoverageRasterizer()
{
  CoverageRasterizerPrivate *d;
  d = static_cast<CoverageRasterizerPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

const coverdraw::RasterParams&
coverdraw::CoverageRasterizer::
params(void) const
{
  CoverageRasterizerPrivate *d;
  d = static_cast<CoverageRasterizerPrivate*>(m_d);
  return d->m_params;
}

coverdraw::reference_counted_ptr<coverdraw::CoverageMap>
coverdraw::CoverageRasterizer::
rasterize(const FlattenedPath &path,
          enum RasterEnums::fill_rule_t fill_rule,
          const IRect *clip) const
{
  return rasterize(path, CustomFillRuleFunction(fill_rule), clip);
}

coverdraw::reference_counted_ptr<coverdraw::CoverageMap>
coverdraw::CoverageRasterizer::
rasterize(const FlattenedPath &path,
          const CustomFillRuleBase &fill_rule,
          const IRect *clip) const
{
  CoverageRasterizerPrivate *d;
  reference_counted_ptr<CoverageMap> return_value;
  Rect bb;
  ivec2 min_pt, max_pt;
  unsigned int number_sub_samples, number_workers;
  bool antialias;

  d = static_cast<CoverageRasterizerPrivate*>(m_d);
  if (!path.bounding_box(&bb))
    {
      return COVERDRAWnew CoverageMap(ivec2(0, 0), 0, 0, d->m_params.allocator());
    }

  if (!finite_point(bb.m_min_point) || !finite_point(bb.m_max_point))
    {
      COVERDRAWlog_warning("path with non-finite coordinates is not rasterized");
      return COVERDRAWnew CoverageMap(ivec2(0, 0), 0, 0, d->m_params.allocator());
    }

  if (clip)
    {
      bb = bb.intersection(Rect(*clip));
    }

  if (!representable_point(bb.m_min_point) || !representable_point(bb.m_max_point))
    {
      COVERDRAWlog_warning("path bounds " << bb << " exceed the pixel coordinate range"
                           << ", the path is not rasterized");
      return COVERDRAWnew CoverageMap(ivec2(0, 0), 0, 0, d->m_params.allocator());
    }

  min_pt = ivec2(static_cast<int>(t_floor(bb.min_x())), static_cast<int>(t_floor(bb.min_y())));
  max_pt = ivec2(static_cast<int>(t_ceil(bb.max_x())), static_cast<int>(t_ceil(bb.max_y())));
  return_value = COVERDRAWnew CoverageMap(min_pt, max_pt.x() - min_pt.x(),
                                          max_pt.y() - min_pt.y(),
                                          d->m_params.allocator());

  EdgeTable table(path);
  if (table.number_edges() == 0 || return_value->empty())
    {
      return return_value;
    }

  antialias = d->m_params.antialias();
  number_sub_samples = (antialias) ? d->m_params.sub_samples() : 1u;
  number_workers = detail::effective_number_workers(d->m_params.number_threads());
  number_workers = t_min(number_workers, static_cast<unsigned int>(return_value->height()));

  std::vector<PerWorker> workers(number_workers);
  for (PerWorker &W : workers)
    {
      W.m_spans.resize(number_sub_samples);
    }

  CoverageMap &map(*return_value);
  detail::run_rows(number_workers, 0, map.height(),
                   [&](int r, unsigned int worker)
                   {
                     std::vector<std::vector<Span> > &spans(workers[worker].m_spans);
                     c_array<float> row(map.row(r));
                     float y;

                     y = static_cast<float>(min_pt.y() + r);
                     for (unsigned int i = 0; i < number_sub_samples; ++i)
                       {
                         float sy;

                         sy = y + (static_cast<float>(i) + 0.5f) / static_cast<float>(number_sub_samples);
                         table.spans(sy, fill_rule, &spans[i]);
                       }

                     if (antialias)
                       {
                         coverage_row(make_c_array(spans), number_sub_samples, min_pt.x(), row);
                       }
                     else
                       {
                         /* the row is zero from construction */
                         accumulate_span_coverage(make_c_array(spans[0]), min_pt.x(), 1.0f, row);
                         for (float &v : row)
                           {
                             v = (v >= 0.5f) ? 1.0f : 0.0f;
                           }
                       }
                   });

  COVERDRAWlog_debug("rasterized " << table.number_edges() << " edges to "
                     << map.width() << "x" << map.height() << " coverage at "
                     << map.origin() << " with " << number_sub_samples
                     << " sub-samples on " << number_workers << " workers");

  return return_value;
}
