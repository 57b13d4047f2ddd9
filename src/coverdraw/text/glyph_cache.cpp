/*!
 * \file glyph_cache.cpp
 * \brief file glyph_cache.cpp
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
#include <coverdraw/text/glyph_cache.hpp>
#include <coverdraw/util/math.hpp>
#include <coverdraw/util/mutex.hpp>
#include <private/util_private.hpp>

namespace
{
  class GlyphCachePrivate
  {
  public:
    GlyphCachePrivate(void):
      m_number_hits(0),
      m_number_misses(0)
    {}

    typedef std::map<coverdraw::GlyphCache::Key,
                     coverdraw::reference_counted_ptr<const coverdraw::CoverageMap> > map;

    mutable coverdraw::Mutex m_mutex;
    map m_entries;
    unsigned int m_number_hits, m_number_misses;
  };
}

/////////////////////////////////////////
// coverdraw::GlyphCache::Key methods
bool
coverdraw::GlyphCache::Key::
operator<(const Key &rhs) const
{
  if (m_font_id != rhs.m_font_id)
    {
      return m_font_id < rhs.m_font_id;
    }

  if (m_pixel_size != rhs.m_pixel_size)
    {
      return m_pixel_size < rhs.m_pixel_size;
    }

  if (m_glyph_code != rhs.m_glyph_code)
    {
      return m_glyph_code < rhs.m_glyph_code;
    }

  if (m_sub_pixel != rhs.m_sub_pixel)
    {
      return m_sub_pixel < rhs.m_sub_pixel;
    }

  return m_variant < rhs.m_variant;
}

/////////////////////////////////////////
// coverdraw::GlyphCache methods
coverdraw::GlyphCache::
GlyphCache(void)
{
  m_d = COVERDRAWnew GlyphCachePrivate();
}

coverdraw::GlyphCache::
~GlyphCache()
{
  GlyphCachePrivate *d;
  d = static_cast<GlyphCachePrivate*>(m_d);
  COVERDRAWdelete(d);
}

void
coverdraw::GlyphCache::
split_position(const vec2 &position, ivec2 *out_pixel, ivec2 *out_sub_pixel)
{
  for (unsigned int c = 0; c < 2; ++c)
    {
      float fl(t_floor(position[c]));
      int pixel(static_cast<int>(fl));
      int bucket;

      bucket = static_cast<int>(t_floor((position[c] - fl) * float(number_sub_pixel_buckets) + 0.5f));
      if (bucket >= number_sub_pixel_buckets)
        {
          bucket -= number_sub_pixel_buckets;
          ++pixel;
        }
      (*out_pixel)[c] = pixel;
      (*out_sub_pixel)[c] = bucket;
    }
}

coverdraw::vec2
coverdraw::GlyphCache::
sub_pixel_offset(const ivec2 &sub_pixel)
{
  return vec2(sub_pixel) / float(number_sub_pixel_buckets);
}

bool
coverdraw::GlyphCache::
fetch(const Key &key, reference_counted_ptr<const CoverageMap> *out_coverage)
{
  GlyphCachePrivate *d;
  GlyphCachePrivate::map::const_iterator iter;

  d = static_cast<GlyphCachePrivate*>(m_d);
  Mutex::Guard m(d->m_mutex);

  iter = d->m_entries.find(key);
  if (iter == d->m_entries.end())
    {
      ++d->m_number_misses;
      return false;
    }

  ++d->m_number_hits;
  *out_coverage = iter->second;
  return true;
}

void
coverdraw::GlyphCache::
store(const Key &key, const reference_counted_ptr<const CoverageMap> &coverage)
{
  GlyphCachePrivate *d;

  d = static_cast<GlyphCachePrivate*>(m_d);
  Mutex::Guard m(d->m_mutex);
  d->m_entries[key] = coverage;
}

void
coverdraw::GlyphCache::
clear(void)
{
  GlyphCachePrivate *d;

  d = static_cast<GlyphCachePrivate*>(m_d);
  Mutex::Guard m(d->m_mutex);
  d->m_entries.clear();
}

unsigned int
coverdraw::GlyphCache::
size(void) const
{
  GlyphCachePrivate *d;

  d = static_cast<GlyphCachePrivate*>(m_d);
  Mutex::Guard m(d->m_mutex);
  return d->m_entries.size();
}

unsigned int
coverdraw::GlyphCache::
number_hits(void) const
{
  GlyphCachePrivate *d;

  d = static_cast<GlyphCachePrivate*>(m_d);
  Mutex::Guard m(d->m_mutex);
  return d->m_number_hits;
}

unsigned int
coverdraw::GlyphCache::
number_misses(void) const
{
  GlyphCachePrivate *d;

  d = static_cast<GlyphCachePrivate*>(m_d);
  Mutex::Guard m(d->m_mutex);
  return d->m_number_misses;
}
