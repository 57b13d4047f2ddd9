/*!
 * \file test_font_freetype.cpp
 * \brief file test_font_freetype.cpp
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

#include <fstream>
#include <gtest/gtest.h>
#include <coverdraw/path.hpp>
#include <coverdraw/text/font_freetype.hpp>
#include <coverdraw/text/glyph_run.hpp>

using namespace coverdraw;

namespace
{
  const char *font_file = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

  bool
  font_available(void)
  {
    std::ifstream file(font_file);
    return file.good();
  }

  reference_counted_ptr<FontFreeType>
  load_font(void)
  {
    reference_counted_ptr<FreeTypeFace::GeneratorBase> gen;
    gen = COVERDRAWnew FreeTypeFace::GeneratorFile(font_file, 0);
    return COVERDRAWnew FontFreeType(gen);
  }
}

TEST(FontFreeTypeTest, LoadsOutlinesFromFile)
{
  if (!font_available())
    {
      GTEST_SKIP() << font_file << " not installed";
    }

  reference_counted_ptr<FontFreeType> font(load_font());
  uint32_t glyph;
  Path path;
  Rect bb;

  ASSERT_TRUE(font->valid());
  EXPECT_GT(font->number_glyphs(), 0u);

  glyph = font->glyph_code('A');
  EXPECT_NE(glyph, 0u);
  EXPECT_EQ(font->glyph_code(0x10FFFD), 0u);

  ASSERT_EQ(font->glyph_outline(glyph, 32, &path), routine_success);
  EXPECT_GT(path.number_contours(), 0u);
  ASSERT_TRUE(path.approximate_bounding_box(&bb));

  /* y increases downward, the glyph is above the baseline */
  EXPECT_LT(bb.m_min_point.y(), -16.0f);
  EXPECT_LE(bb.m_max_point.y(), 0.5f);
  EXPECT_GE(bb.m_min_point.x(), -1.0f);
  EXPECT_LT(bb.m_max_point.x(), 32.0f);

  /* every contour of a glyph is closed */
  for (unsigned int c = 0; c < path.number_contours(); ++c)
    {
      EXPECT_TRUE(path.contour(c)->closed());
    }
}

TEST(FontFreeTypeTest, Metrics)
{
  if (!font_available())
    {
      GTEST_SKIP() << font_file << " not installed";
    }

  reference_counted_ptr<FontFreeType> font(load_font());
  GlyphMetrics small, large;
  uint32_t glyph;

  glyph = font->glyph_code('H');
  small = font->glyph_metrics(glyph, 16);
  large = font->glyph_metrics(glyph, 32);

  EXPECT_GT(small.m_advance.x(), 0.0f);
  EXPECT_EQ(small.m_advance.y(), 0.0f);
  EXPECT_NEAR(large.m_advance.x(), 2.0f * small.m_advance.x(), 0.1f);
  EXPECT_LT(large.m_offset.y(), 0.0f);
  EXPECT_GT(large.m_size.x(), 0.0f);
  EXPECT_GT(large.m_size.y(), 0.0f);

  /* text advances along the baseline */
  GlyphRun run(font, 16);
  vec2 pen(run.add_text("HH", vec2(0.0f, 0.0f)));
  EXPECT_NEAR(pen.x(), 2.0f * small.m_advance.x(), 1e-3f);
  EXPECT_NEAR(run.position(1).x(), small.m_advance.x(), 1e-3f);
}

TEST(FontFreeTypeTest, InvalidRequestsFail)
{
  if (!font_available())
    {
      GTEST_SKIP() << font_file << " not installed";
    }

  reference_counted_ptr<FontFreeType> font(load_font());
  Path path;

  EXPECT_EQ(font->glyph_outline(font->number_glyphs() + 10, 16, &path), routine_fail);
  EXPECT_EQ(font->glyph_outline(font->glyph_code('A'), 0, &path), routine_fail);
  EXPECT_EQ(path.number_contours(), 0u);

  /* the space glyph has an empty outline */
  EXPECT_EQ(font->glyph_outline(font->glyph_code(' '), 16, &path), routine_success);
  EXPECT_EQ(path.number_contours(), 0u);
}

TEST(FontFreeTypeTest, MissingFile)
{
  reference_counted_ptr<FreeTypeFace::GeneratorBase> gen;
  reference_counted_ptr<FontFreeType> font;
  Path path;

  gen = COVERDRAWnew FreeTypeFace::GeneratorFile("/nonexistent/coverdraw/font.ttf", 0);
  EXPECT_EQ(gen->check_creation(), routine_fail);

  font = COVERDRAWnew FontFreeType(gen);
  EXPECT_FALSE(font->valid());
  EXPECT_EQ(font->number_glyphs(), 0u);
  EXPECT_EQ(font->glyph_code('A'), 0u);
  EXPECT_EQ(font->glyph_outline(36, 16, &path), routine_fail);
  EXPECT_EQ(font->glyph_metrics(36, 16).m_advance, vec2(0.0f, 0.0f));

  gen = COVERDRAWnew FreeTypeFace::GeneratorMemory("/nonexistent/coverdraw/font.ttf", 0);
  EXPECT_EQ(gen->check_creation(), routine_fail);
}

TEST(FontFreeTypeTest, MemoryGenerator)
{
  if (!font_available())
    {
      GTEST_SKIP() << font_file << " not installed";
    }

  reference_counted_ptr<FreeTypeLib> lib(COVERDRAWnew FreeTypeLib());
  reference_counted_ptr<FreeTypeFace::GeneratorBase> gen;
  reference_counted_ptr<FontFreeType> from_memory, from_file;
  Path a, b;

  gen = COVERDRAWnew FreeTypeFace::GeneratorMemory(font_file, 0);
  EXPECT_EQ(gen->check_creation(lib), routine_success);

  from_memory = COVERDRAWnew FontFreeType(gen, lib);
  from_file = load_font();
  ASSERT_TRUE(from_memory->valid());
  EXPECT_EQ(from_memory->lib().get(), lib.get());
  EXPECT_EQ(from_memory->number_glyphs(), from_file->number_glyphs());
  EXPECT_EQ(from_memory->glyph_code('g'), from_file->glyph_code('g'));
  EXPECT_NE(from_memory->font_id(), from_file->font_id());

  ASSERT_EQ(from_memory->glyph_outline(from_memory->glyph_code('g'), 24, &a), routine_success);
  ASSERT_EQ(from_file->glyph_outline(from_file->glyph_code('g'), 24, &b), routine_success);
  EXPECT_EQ(a.number_contours(), b.number_contours());
}
