/*!
 * \file test_glyph_cache.cpp
 * \brief file test_glyph_cache.cpp
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
#include <stdexcept>
#include <gtest/gtest.h>
#include <coverdraw/pen.hpp>
#include <coverdraw/brush/solid_brush.hpp>
#include <coverdraw/text/glyph_cache.hpp>
#include <coverdraw/text/glyph_run.hpp>
#include <coverdraw/text/caching_glyph_renderer.hpp>
#include "square_glyph_source.hpp"

using namespace coverdraw;

namespace
{
  reference_counted_ptr<const Brush>
  brush(void)
  {
    return COVERDRAWnew SolidBrush(vec4(1.0f, 1.0f, 1.0f, 1.0f));
  }

  reference_counted_ptr<const GlyphSource>
  square_source(void)
  {
    return COVERDRAWnew coverdraw_test::SquareGlyphSource();
  }
}

TEST(GlyphCacheTest, SplitPosition)
{
  ivec2 pixel, sub_pixel;

  GlyphCache::split_position(vec2(3.3f, 2.97f), &pixel, &sub_pixel);
  EXPECT_EQ(pixel, ivec2(3, 3));
  EXPECT_EQ(sub_pixel, ivec2(2, 0));

  GlyphCache::split_position(vec2(-0.5f, 7.0f), &pixel, &sub_pixel);
  EXPECT_EQ(pixel, ivec2(-1, 7));
  EXPECT_EQ(sub_pixel, ivec2(4, 0));

  EXPECT_EQ(GlyphCache::sub_pixel_offset(ivec2(4, 2)), vec2(0.5f, 0.25f));
}

TEST(GlyphCacheTest, FetchAndStore)
{
  GlyphCache cache;
  reference_counted_ptr<const CoverageMap> map, fetched;
  GlyphCache::Key key(1, 16, 65, ivec2(0, 0));
  GlyphCache::Key variant(1, 16, 65, ivec2(0, 0), 1);
  GlyphCache::Key shifted(1, 16, 65, ivec2(3, 0));

  map = COVERDRAWnew CoverageMap(ivec2(0, -8), 8, 8);

  EXPECT_FALSE(cache.fetch(key, &fetched));
  EXPECT_TRUE(fetched.get() == nullptr);
  cache.store(key, map);
  EXPECT_EQ(cache.size(), 1u);

  EXPECT_TRUE(cache.fetch(key, &fetched));
  EXPECT_EQ(fetched.get(), map.get());
  EXPECT_FALSE(cache.fetch(variant, &fetched));
  EXPECT_FALSE(cache.fetch(shifted, &fetched));

  EXPECT_EQ(cache.number_hits(), 1u);
  EXPECT_EQ(cache.number_misses(), 3u);

  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.fetch(key, &fetched));
  EXPECT_EQ(cache.number_misses(), 4u);
}

TEST(GlyphCacheTest, KeyOrdering)
{
  GlyphCache::Key a(1, 16, 65, ivec2(0, 0));
  GlyphCache::Key b(1, 16, 66, ivec2(0, 0));
  GlyphCache::Key c(2, 8, 0, ivec2(0, 0));

  EXPECT_TRUE(a < b);
  EXPECT_FALSE(b < a);
  EXPECT_TRUE(b < c);
  EXPECT_FALSE(a < a);
}

TEST(GlyphCacheTest, FontIdentifiersAreDistinct)
{
  reference_counted_ptr<const GlyphSource> a(square_source()), b(square_source());
  EXPECT_NE(a->font_id(), b->font_id());
}

TEST(GlyphRunTest, AddText)
{
  GlyphRun run(square_source(), 16);
  vec2 pen;

  pen = run.add_text("AB", vec2(2.0f, 20.0f));
  EXPECT_EQ(pen, vec2(34.0f, 20.0f));
  ASSERT_EQ(run.number_glyphs(), 2u);
  EXPECT_EQ(run.glyph_code(0), 65u);
  EXPECT_EQ(run.glyph_code(1), 66u);
  EXPECT_EQ(run.position(1), vec2(18.0f, 20.0f));

  run.add_glyph(67, vec2(-1.0f, 0.0f));
  EXPECT_EQ(run.number_glyphs(), 3u);
  run.clear();
  EXPECT_EQ(run.number_glyphs(), 0u);

  EXPECT_THROW(GlyphRun(square_source(), 0), std::invalid_argument);
  EXPECT_THROW(GlyphRun(reference_counted_ptr<const GlyphSource>(), 16), std::invalid_argument);
}

TEST(CachingGlyphRendererTest, RepeatedGlyphsAreCached)
{
  CachingGlyphRenderer renderer;
  GlyphRun run(square_source(), 16);
  std::vector<DrawingOperation> ops;

  run.add_text("AAB", vec2(0.0f, 20.0f));
  EXPECT_EQ(renderer.render(run, brush(), nullptr, &ops), 3u);
  ASSERT_EQ(ops.size(), 3u);
  EXPECT_EQ(renderer.cache().number_misses(), 2u);
  EXPECT_EQ(renderer.cache().number_hits(), 1u);
  EXPECT_EQ(renderer.cache().size(), 2u);

  /* the square of side 8 sits on the baseline */
  EXPECT_EQ(ops[0].m_origin, ivec2(0, 12));
  EXPECT_EQ(ops[1].m_origin, ivec2(16, 12));
  EXPECT_EQ(ops[2].m_origin, ivec2(32, 12));
  EXPECT_EQ(ops[0].m_coverage.get(), ops[1].m_coverage.get());
  EXPECT_EQ(ops[0].m_coverage->width(), 8);
  EXPECT_EQ(ops[0].m_render_pass, CachingGlyphRenderer::fill_render_pass);

  EXPECT_EQ(renderer.render(run, brush(), nullptr, &ops), 3u);
  EXPECT_EQ(ops.size(), 6u);
  EXPECT_EQ(renderer.cache().number_hits(), 4u);
  EXPECT_EQ(renderer.cache().number_misses(), 2u);
}

TEST(CachingGlyphRendererTest, SubPixelPositionsAreCachedSeparately)
{
  CachingGlyphRenderer renderer;
  GlyphRun run(square_source(), 16);
  std::vector<DrawingOperation> ops;

  run.add_glyph(65, vec2(0.0f, 20.0f));
  run.add_glyph(65, vec2(10.3f, 20.0f));
  run.add_glyph(65, vec2(20.3f, 20.0f));

  EXPECT_EQ(renderer.render(run, brush(), nullptr, &ops), 3u);
  EXPECT_EQ(renderer.cache().number_misses(), 2u);
  EXPECT_EQ(renderer.cache().number_hits(), 1u);

  /* shifted by 2/8 of a pixel, the square covers 9 columns */
  EXPECT_EQ(ops[1].m_coverage->width(), 9);
  EXPECT_EQ(ops[1].m_origin, ivec2(10, 12));
  EXPECT_NEAR(ops[1].m_coverage->value(0, 0), 0.75f, 1e-4f);
  EXPECT_NEAR(ops[1].m_coverage->value(8, 0), 0.25f, 1e-4f);
  EXPECT_EQ(ops[1].m_coverage.get(), ops[2].m_coverage.get());
}

TEST(CachingGlyphRendererTest, MissingAndEmptyGlyphsProduceNoOperations)
{
  CachingGlyphRenderer renderer;
  GlyphRun run(square_source(), 16);
  std::vector<DrawingOperation> ops;

  run.add_glyph(0, vec2(0.0f, 20.0f));
  run.add_glyph(' ', vec2(16.0f, 20.0f));
  EXPECT_EQ(renderer.render(run, brush(), nullptr, &ops), 0u);
  EXPECT_TRUE(ops.empty());

  /* only the empty glyph has an entry */
  EXPECT_EQ(renderer.cache().size(), 1u);
}

TEST(CachingGlyphRendererTest, OutlinesUseTheirOwnPassAndVariant)
{
  CachingGlyphRenderer renderer;
  GlyphRun run(square_source(), 16);
  std::vector<DrawingOperation> ops;
  reference_counted_ptr<const Brush> outline_brush(COVERDRAWnew SolidBrush(vec4(1.0f, 0.0f, 0.0f, 1.0f)));
  Pen pen(outline_brush, 2.0f), wide(outline_brush, 4.0f);

  run.add_text("AA", vec2(0.0f, 20.0f));
  EXPECT_EQ(renderer.render(run, brush(), &pen, &ops), 4u);
  ASSERT_EQ(ops.size(), 4u);

  EXPECT_EQ(ops[0].m_render_pass, CachingGlyphRenderer::fill_render_pass);
  EXPECT_EQ(ops[1].m_render_pass, CachingGlyphRenderer::outline_render_pass);
  EXPECT_EQ(ops[1].m_brush.get(), outline_brush.get());

  /* the stroke straddles the outline */
  EXPECT_EQ(ops[1].m_origin, ivec2(-1, 11));
  EXPECT_EQ(ops[1].m_coverage->width(), 10);
  EXPECT_EQ(renderer.cache().size(), 2u);

  /* an equal pen reuses the outline, a different one does not */
  Pen same(pen);
  ops.clear();
  renderer.render(run, reference_counted_ptr<const Brush>(), &same, &ops);
  EXPECT_EQ(ops.size(), 2u);
  EXPECT_EQ(renderer.cache().size(), 2u);

  ops.clear();
  renderer.render(run, reference_counted_ptr<const Brush>(), &wide, &ops);
  EXPECT_EQ(ops.size(), 2u);
  EXPECT_EQ(renderer.cache().size(), 3u);
  EXPECT_EQ(ops[0].m_origin, ivec2(-2, 10));
}

TEST(CachingGlyphRendererTest, ClearForgetsStrokeStyles)
{
  CachingGlyphRenderer renderer;
  GlyphRun run(square_source(), 16);
  std::vector<DrawingOperation> ops;
  reference_counted_ptr<const Brush> outline_brush(COVERDRAWnew SolidBrush(vec4(1.0f, 0.0f, 0.0f, 1.0f)));

  run.add_text("A", vec2(0.0f, 20.0f));
  for (int i = 1; i <= 8; ++i)
    {
      Pen pen(outline_brush, static_cast<float>(i));

      renderer.render(run, reference_counted_ptr<const Brush>(), &pen, &ops);
    }
  EXPECT_EQ(renderer.number_stroke_styles(), 8u);
  EXPECT_EQ(renderer.cache().size(), 8u);
  EXPECT_EQ(ops.size(), 8u);

  renderer.clear();
  EXPECT_EQ(renderer.number_stroke_styles(), 0u);
  EXPECT_EQ(renderer.cache().size(), 0u);

  /* operations made before the clear keep their coverage */
  ASSERT_TRUE(ops[7].m_coverage.get() != nullptr);
  EXPECT_FALSE(ops[7].m_coverage->empty());

  Pen pen(outline_brush, 8.0f);
  std::vector<DrawingOperation> again;
  renderer.render(run, reference_counted_ptr<const Brush>(), &pen, &again);
  EXPECT_EQ(renderer.number_stroke_styles(), 1u);
  ASSERT_EQ(again.size(), 1u);
  EXPECT_EQ(again[0].m_origin, ops[7].m_origin);
}
