/*!
 * \file glyph_source.cpp
 * \brief file glyph_source.cpp
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

#include <atomic>
#include <coverdraw/text/glyph_source.hpp>

namespace
{
  uint32_t
  next_font_id(void)
  {
    static std::atomic<uint32_t> counter(0u);
    return counter.fetch_add(1u);
  }
}

coverdraw::GlyphSource::
GlyphSource(void):
  m_font_id(next_font_id())
{}
