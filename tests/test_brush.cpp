/*!
 * \file test_brush.cpp
 * \brief file test_brush.cpp
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

#include <thread>
#include <vector>
#include <stdexcept>
#include <gtest/gtest.h>
#include <coverdraw/image_frame.hpp>
#include <coverdraw/colorstop.hpp>
#include <coverdraw/brush/graphics_options.hpp>
#include <coverdraw/brush/solid_brush.hpp>
#include <coverdraw/brush/pattern_brush.hpp>
#include <coverdraw/brush/gradient_brush.hpp>

using namespace coverdraw;

namespace
{
  const vec4 black(0.0f, 0.0f, 0.0f, 1.0f);
  const vec4 white(1.0f, 1.0f, 1.0f, 1.0f);
  const vec4 red(1.0f, 0.0f, 0.0f, 1.0f);

  void
  expect_color(const vec4 &actual, const vec4 &expected, float tol = 1e-5f)
  {
    for (unsigned int i = 0; i < 4; ++i)
      {
        EXPECT_NEAR(actual[i], expected[i], tol) << " channel " << i;
      }
  }
}

TEST(BrushTest, SolidBrushBlendsByCoverage)
{
  ImageFrame frame(4, 1, black);
  reference_counted_ptr<const Brush> brush(COVERDRAWnew SolidBrush(red));
  reference_counted_ptr<BrushApplicator> applicator;
  std::vector<float> coverage;

  coverage.push_back(1.0f);
  coverage.push_back(0.5f);
  coverage.push_back(0.0f);

  applicator = brush->create_applicator(GraphicsOptions(), frame, frame.bounds());
  applicator->apply(make_c_array(coverage), 0, 0);

  expect_color(frame.pixel(0, 0), red);
  expect_color(frame.pixel(1, 0), vec4(0.5f, 0.0f, 0.0f, 1.0f));
  expect_color(frame.pixel(2, 0), black);
  expect_color(frame.pixel(3, 0), black);
}

TEST(BrushTest, BlendPercentageScalesCoverage)
{
  ImageFrame frame(2, 1, black);
  reference_counted_ptr<const Brush> brush(COVERDRAWnew SolidBrush(white));
  reference_counted_ptr<BrushApplicator> applicator;
  GraphicsOptions options;
  std::vector<float> coverage(2, 1.0f);

  coverage[1] = 0.8f;
  options.blend_percentage(0.5f);
  EXPECT_THROW(options.blend_percentage(-1.0f), std::invalid_argument);

  applicator = brush->create_applicator(options, frame, frame.bounds());
  applicator->apply(make_c_array(coverage), 0, 0);
  expect_color(frame.pixel(0, 0), vec4(0.5f, 0.5f, 0.5f, 1.0f));
  expect_color(frame.pixel(1, 0), vec4(0.4f, 0.4f, 0.4f, 1.0f));

  /* the blend amount is clamped to 1 */
  options.blend_percentage(3.0f);
  applicator = brush->create_applicator(options, frame, frame.bounds());
  applicator->apply(make_c_array(coverage), 0, 0);
  expect_color(frame.pixel(0, 0), white);
  expect_color(frame.pixel(1, 0), white);
}

TEST(BrushTest, SourceOverUsesBrushAlpha)
{
  ImageFrame frame(1, 1);
  reference_counted_ptr<const Brush> brush(COVERDRAWnew SolidBrush(vec4(0.0f, 1.0f, 0.0f, 0.5f)));
  std::vector<float> coverage(1, 1.0f);

  brush->create_applicator(GraphicsOptions(), frame, frame.bounds())->apply(make_c_array(coverage), 0, 0);
  expect_color(frame.pixel(0, 0), vec4(0.0f, 0.5f, 0.0f, 0.5f));

  brush->create_applicator(GraphicsOptions(), frame, frame.bounds())->apply(make_c_array(coverage), 0, 0);
  expect_color(frame.pixel(0, 0), vec4(0.0f, 0.75f, 0.0f, 0.75f));
}

TEST(BrushTest, PatternWrapsAround)
{
  std::vector<vec4> colors;

  colors.push_back(black);
  colors.push_back(white);

  reference_counted_ptr<PatternBrush> brush(COVERDRAWnew PatternBrush(1, 2, make_c_array(colors)));
  EXPECT_EQ(brush->rows(), 1);
  EXPECT_EQ(brush->columns(), 2);

  /* x = -2, -1, 0, 1, 2 */
  const float expected[] = { 0.0f, 1.0f, 0.0f, 1.0f, 0.0f };
  for (int x = -2; x <= 2; ++x)
    {
      EXPECT_EQ(brush->color(x, 0).x(), expected[x + 2]);
      EXPECT_EQ(brush->color(x, -7).x(), expected[x + 2]);
    }
}

TEST(BrushTest, PatternFromFlagsIsAppliedInFrameCoordinates)
{
  const bool flags[] =
    {
      true, false, false,
      false, true, false,
    };
  reference_counted_ptr<const Brush> brush(COVERDRAWnew PatternBrush(red, black, 2, 3, c_array<const bool>(flags, 6)));
  ImageFrame frame(6, 2, white);
  std::vector<float> coverage(5, 1.0f);
  reference_counted_ptr<BrushApplicator> applicator;

  applicator = brush->create_applicator(GraphicsOptions(), frame, frame.bounds());
  applicator->apply(make_c_array(coverage), 1, 0);
  applicator->apply(make_c_array(coverage), 1, 1);

  expect_color(frame.pixel(0, 0), white);
  expect_color(frame.pixel(1, 0), black);
  expect_color(frame.pixel(3, 0), red);
  expect_color(frame.pixel(1, 1), red);
  expect_color(frame.pixel(4, 1), red);
  expect_color(frame.pixel(5, 1), black);
}

TEST(BrushTest, PatternTileRepeatsAlongAppliedRow)
{
  std::vector<vec4> colors;

  /* row 0: black white, row 1: white black */
  colors.push_back(black);
  colors.push_back(white);
  colors.push_back(white);
  colors.push_back(black);

  reference_counted_ptr<const Brush> brush(COVERDRAWnew PatternBrush(2, 2, make_c_array(colors)));
  ImageFrame frame(5, 2, red);
  std::vector<float> coverage(5, 1.0f);
  reference_counted_ptr<BrushApplicator> applicator;

  applicator = brush->create_applicator(GraphicsOptions(), frame, frame.bounds());
  applicator->apply(make_c_array(coverage), 0, 0);
  applicator->apply(make_c_array(coverage), 0, 1);

  /* tile columns 0, 1, 0, 1, 0 */
  for (int x = 0; x < 5; ++x)
    {
      expect_color(frame.pixel(x, 0), (x % 2 == 0) ? black : white);
      expect_color(frame.pixel(x, 1), (x % 2 == 0) ? white : black);
    }
}

TEST(BrushTest, ApplySkipsPixelsOutsideTheFrame)
{
  reference_counted_ptr<const Brush> brush(COVERDRAWnew SolidBrush(red));
  ImageFrame frame(4, 2, black);
  std::vector<float> coverage(6, 1.0f);
  reference_counted_ptr<BrushApplicator> applicator;

  applicator = brush->create_applicator(GraphicsOptions(), frame, frame.bounds());

  /* columns -3..2 of row 0, then 2..7 of row 1 */
  applicator->apply(make_c_array(coverage), -3, 0);
  applicator->apply(make_c_array(coverage), 2, 1);

  /* entirely outside */
  applicator->apply(make_c_array(coverage), -6, 0);
  applicator->apply(make_c_array(coverage), 4, 0);
  applicator->apply(make_c_array(coverage), 0, -1);
  applicator->apply(make_c_array(coverage), 0, 2);

  for (int x = 0; x < 4; ++x)
    {
      expect_color(frame.pixel(x, 0), (x < 3) ? red : black);
      expect_color(frame.pixel(x, 1), (x >= 2) ? red : black);
    }
}

TEST(BrushTest, PatternRejectsBadTiles)
{
  std::vector<vec4> colors(4, black);

  EXPECT_THROW(PatternBrush(0, 4, make_c_array(colors)), std::invalid_argument);
  EXPECT_THROW(PatternBrush(2, -2, make_c_array(colors)), std::invalid_argument);
  EXPECT_THROW(PatternBrush(3, 3, make_c_array(colors)), std::invalid_argument);
}

TEST(BrushTest, PatternPresets)
{
  reference_counted_ptr<PatternBrush> horizontal(PatternBrush::horizontal(red, black));
  reference_counted_ptr<PatternBrush> vertical(PatternBrush::vertical(red, black));
  reference_counted_ptr<PatternBrush> diagonal(PatternBrush::forward_diagonal(red, black));

  /* a horizontal pattern is constant along each row */
  for (int y = 0; y < horizontal->rows(); ++y)
    {
      for (int x = 1; x < 2 * horizontal->columns(); ++x)
        {
          EXPECT_EQ(horizontal->color(x, y), horizontal->color(0, y));
        }
    }

  /* a vertical pattern is constant along each column */
  for (int x = 0; x < vertical->columns(); ++x)
    {
      for (int y = 1; y < 2 * vertical->rows(); ++y)
        {
          EXPECT_EQ(vertical->color(x, y), vertical->color(x, 0));
        }
    }

  EXPECT_GT(diagonal->rows(), 1);
  EXPECT_EQ(PatternBrush::percent10(red, black)->rows(), 4);
  EXPECT_EQ(PatternBrush::percent20(red, black)->rows(), 4);
  EXPECT_EQ(PatternBrush::backward_diagonal(red, black)->rows(), 4);
}

TEST(BrushTest, ColorStopInterpolation)
{
  ColorStopArray stops;

  stops.add(ColorStop(white, 1.0f));
  stops.add(ColorStop(black, 0.0f));
  ASSERT_EQ(stops.values().size(), 2u);
  EXPECT_EQ(stops.values()[0].m_place, 0.0f);

  expect_color(stops.color(0.5f), vec4(0.5f, 0.5f, 0.5f, 1.0f));
  expect_color(stops.color(-1.0f), black);
  expect_color(stops.color(2.0f), white);

  stops.clear();
  EXPECT_EQ(stops.values().size(), 0u);
}

TEST(BrushTest, SpreadFunctions)
{
  typedef LinearGradientBrush G;

  EXPECT_FLOAT_EQ(G::apply_spread(1.5f, G::spread_clamp), 1.0f);
  EXPECT_FLOAT_EQ(G::apply_spread(-0.5f, G::spread_clamp), 0.0f);
  EXPECT_FLOAT_EQ(G::apply_spread(-0.5f, G::spread_mirror), 0.5f);
  EXPECT_FLOAT_EQ(G::apply_spread(1.25f, G::spread_repeat), 0.25f);
  EXPECT_FLOAT_EQ(G::apply_spread(-0.25f, G::spread_repeat), 0.75f);
  EXPECT_FLOAT_EQ(G::apply_spread(1.5f, G::spread_mirror_repeat), 0.5f);
  EXPECT_FLOAT_EQ(G::apply_spread(2.25f, G::spread_mirror_repeat), 0.25f);
}

TEST(BrushTest, LinearGradient)
{
  ColorStopArray stops;

  stops.add(ColorStop(black, 0.0f));
  stops.add(ColorStop(white, 1.0f));

  reference_counted_ptr<LinearGradientBrush> brush;
  brush = COVERDRAWnew LinearGradientBrush(vec2(0.0f, 0.0f), vec2(10.0f, 0.0f), stops);

  EXPECT_FLOAT_EQ(brush->interpolate(vec2(5.0f, 3.0f)), 0.5f);
  EXPECT_FLOAT_EQ(brush->interpolate(vec2(20.0f, 0.0f)), 1.0f);

  /* the pixel center of x = 4 is at 4.5 */
  expect_color(brush->color(4, 0), vec4(0.45f, 0.45f, 0.45f, 1.0f), 1.0f / 255.0f);
  expect_color(brush->color(-3, 9), black);

  ColorStopArray empty;
  EXPECT_THROW(LinearGradientBrush(vec2(0.0f, 0.0f), vec2(1.0f, 0.0f), empty),
               std::invalid_argument);
}

TEST(BrushTest, ScratchRecordsArePerThread)
{
  ImageFrame frame(8, 2, black);
  reference_counted_ptr<const Brush> brush(COVERDRAWnew SolidBrush(red));
  reference_counted_ptr<BrushApplicator> applicator;
  std::vector<float> coverage(8, 1.0f);

  applicator = brush->create_applicator(GraphicsOptions(), frame, frame.bounds());
  EXPECT_EQ(applicator->number_scratch_records(), 0u);

  std::thread t0([&]() { applicator->apply(make_c_array(coverage), 0, 0); });
  std::thread t1([&]() { applicator->apply(make_c_array(coverage), 0, 1); });
  t0.join();
  t1.join();

  EXPECT_EQ(applicator->number_scratch_records(), 2u);
  for (int y = 0; y < 2; ++y)
    {
      for (int x = 0; x < 8; ++x)
        {
          expect_color(frame.pixel(x, y), red);
        }
    }
}
