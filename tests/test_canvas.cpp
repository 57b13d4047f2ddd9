/*!
 * \file test_canvas.cpp
 * \brief file test_canvas.cpp
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

#include <limits>
#include <gtest/gtest.h>
#include <coverdraw/canvas.hpp>
#include <coverdraw/brush/solid_brush.hpp>
#include <coverdraw/text/glyph_run.hpp>
#include "square_glyph_source.hpp"

using namespace coverdraw;

namespace
{
  const vec4 black(0.0f, 0.0f, 0.0f, 1.0f);
  const vec4 white(1.0f, 1.0f, 1.0f, 1.0f);
  const vec4 red(1.0f, 0.0f, 0.0f, 1.0f);
  const vec4 blue(0.0f, 0.0f, 1.0f, 1.0f);

  reference_counted_ptr<const Brush>
  solid(const vec4 &c)
  {
    return COVERDRAWnew SolidBrush(c);
  }

  void
  add_rectangle(Path &path, float x0, float y0, float x1, float y1)
  {
    path.move(vec2(x0, y0))
      .line_to(vec2(x1, y0))
      .line_to(vec2(x1, y1))
      .line_to(vec2(x0, y1))
      .close_contour();
  }

  class AtLeastTwice:public CustomFillRuleBase
  {
  public:
    virtual
    bool
    operator()(int winding_number) const
    {
      return winding_number >= 2 || winding_number <= -2;
    }
  };
}

TEST(CanvasTest, FillAndFlush)
{
  ImageFrame frame(8, 8, black);
  Canvas canvas(frame);
  Path rect;

  add_rectangle(rect, 2.0f, 2.0f, 6.0f, 6.0f);
  canvas.fill_path(rect, solid(red));
  EXPECT_EQ(canvas.number_operations(), 1u);

  /* nothing is drawn until flush */
  EXPECT_EQ(frame.pixel(3, 3), black);

  EXPECT_EQ(canvas.flush(), 1u);
  EXPECT_EQ(canvas.number_operations(), 0u);
  for (int y = 0; y < 8; ++y)
    {
      for (int x = 0; x < 8; ++x)
        {
          bool inside(x >= 2 && x < 6 && y >= 2 && y < 6);
          EXPECT_EQ(frame.pixel(x, y), inside ? red : black) << x << ", " << y;
        }
    }

  EXPECT_EQ(canvas.flush(), 0u);
  EXPECT_EQ(&canvas.frame(), &frame);
}

TEST(CanvasTest, EmptyDrawsAreNotRecorded)
{
  ImageFrame frame(8, 8, black);
  Canvas canvas(frame);
  Path rect, empty;

  add_rectangle(rect, 2.0f, 2.0f, 6.0f, 6.0f);
  canvas.fill_path(rect, reference_counted_ptr<const Brush>());
  canvas.fill_path(empty, solid(red));
  EXPECT_EQ(canvas.number_operations(), 0u);
}

TEST(CanvasTest, RenderPassesOrderOperations)
{
  ImageFrame frame(8, 8, black);
  Canvas canvas(frame);
  Path rect;

  add_rectangle(rect, 0.0f, 0.0f, 8.0f, 8.0f);
  canvas.fill_path(rect, solid(red), RasterEnums::nonzero_fill_rule, 1);
  canvas.fill_path(rect, solid(blue), RasterEnums::nonzero_fill_rule, 0);
  EXPECT_EQ(canvas.flush(), 2u);
  EXPECT_EQ(frame.pixel(4, 4), red);
}

TEST(CanvasTest, CustomFillRule)
{
  ImageFrame frame(8, 8, black);
  Canvas canvas(frame);
  Path path;

  add_rectangle(path, 0.0f, 0.0f, 6.0f, 6.0f);
  add_rectangle(path, 2.0f, 2.0f, 8.0f, 8.0f);
  canvas.fill_path(path, solid(red), AtLeastTwice());
  EXPECT_EQ(canvas.flush(), 1u);

  EXPECT_EQ(frame.pixel(1, 1), black);
  EXPECT_EQ(frame.pixel(3, 3), red);
  EXPECT_EQ(frame.pixel(5, 5), red);
  EXPECT_EQ(frame.pixel(7, 7), black);
}

TEST(CanvasTest, StrokePath)
{
  ImageFrame frame(8, 8, black);
  Canvas canvas(frame);
  Pen pen(solid(white), 2.0f);
  Path line;

  line.move(vec2(0.0f, 4.0f)).line_to(vec2(8.0f, 4.0f));
  canvas.stroke_path(line, pen);
  EXPECT_EQ(canvas.flush(), 1u);

  for (int x = 0; x < 8; ++x)
    {
      EXPECT_EQ(frame.pixel(x, 2), black);
      EXPECT_EQ(frame.pixel(x, 3), white);
      EXPECT_EQ(frame.pixel(x, 4), white);
      EXPECT_EQ(frame.pixel(x, 5), black);
    }
}

TEST(CanvasTest, DrawText)
{
  ImageFrame frame(16, 10, black);
  Canvas canvas(frame);
  GlyphRun run(COVERDRAWnew coverdraw_test::SquareGlyphSource(), 8);

  /* each glyph is a square of side 4 on the baseline */
  run.add_text("AB", vec2(0.0f, 8.0f));
  canvas.draw_text(run, solid(white));
  EXPECT_EQ(canvas.number_operations(), 2u);
  EXPECT_EQ(canvas.flush(), 2u);

  EXPECT_EQ(frame.pixel(1, 5), white);
  EXPECT_EQ(frame.pixel(3, 7), white);
  EXPECT_EQ(frame.pixel(1, 3), black);
  EXPECT_EQ(frame.pixel(5, 5), black);
  EXPECT_EQ(frame.pixel(9, 5), white);
  EXPECT_EQ(frame.pixel(13, 5), black);
}

TEST(CanvasTest, TextOutlinesDrawOverFills)
{
  ImageFrame frame(16, 12, black);
  Canvas canvas(frame);
  GlyphRun run(COVERDRAWnew coverdraw_test::SquareGlyphSource(), 8);
  Pen pen(solid(red), 2.0f);
  Path background;

  run.add_text("A", vec2(4.0f, 8.0f));
  canvas.draw_text(run, solid(white), &pen, 2);

  /* drawn after the text but in an earlier pass */
  add_rectangle(background, 0.0f, 0.0f, 16.0f, 12.0f);
  canvas.fill_path(background, solid(blue), RasterEnums::nonzero_fill_rule, 1);
  EXPECT_EQ(canvas.flush(), 3u);

  EXPECT_EQ(frame.pixel(0, 0), blue);
  EXPECT_EQ(frame.pixel(6, 6), white);

  /* the outline of the square [4, 8]x[4, 8] spans [3, 9]x[3, 9] */
  EXPECT_EQ(frame.pixel(3, 3), red);
  EXPECT_EQ(frame.pixel(4, 6), red);
  EXPECT_EQ(frame.pixel(8, 8), red);
}

TEST(CanvasTest, LargePathsAreClippedToTheFrame)
{
  ImageFrame frame(10, 10, black);
  Canvas canvas(frame);
  Path huge, outside;

  add_rectangle(huge, 0.0f, 0.0f, 200000.0f, 200000.0f);
  add_rectangle(outside, 20.0f, 20.0f, 30.0f, 30.0f);

  canvas.fill_path(huge, solid(red));
  canvas.fill_path(outside, solid(blue));
  EXPECT_EQ(canvas.number_operations(), 1u);
  EXPECT_EQ(canvas.flush(), 1u);
  for (int y = 0; y < 10; ++y)
    {
      for (int x = 0; x < 10; ++x)
        {
          EXPECT_EQ(frame.pixel(x, y), red) << x << ", " << y;
        }
    }
}

TEST(CanvasTest, LargeStrokesAreClippedToTheFrame)
{
  ImageFrame frame(10, 10, black);
  Canvas canvas(frame);
  Path line;

  line.move(vec2(-100000.0f, 5.0f)).line_to(vec2(100000.0f, 5.0f));
  canvas.stroke_path(line, Pen(solid(red), 2.0f));
  EXPECT_EQ(canvas.flush(), 1u);
  for (int x = 0; x < 10; ++x)
    {
      EXPECT_EQ(frame.pixel(x, 3), black) << x;
      EXPECT_EQ(frame.pixel(x, 4), red) << x;
      EXPECT_EQ(frame.pixel(x, 5), red) << x;
      EXPECT_EQ(frame.pixel(x, 6), black) << x;
    }
}

TEST(CanvasTest, NonFinitePathsAreSkipped)
{
  ImageFrame frame(10, 10, black);
  Canvas canvas(frame);
  Path path;
  float inf(std::numeric_limits<float>::infinity());

  add_rectangle(path, 0.0f, 0.0f, inf, 5.0f);
  canvas.fill_path(path, solid(red));
  EXPECT_EQ(canvas.number_operations(), 0u);
  EXPECT_EQ(canvas.flush(), 0u);
  EXPECT_EQ(frame.pixel(2, 2), black);
}
