/*!
 * \file test_pen.cpp
 * \brief file test_pen.cpp
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
#include <initializer_list>
#include <gtest/gtest.h>
#include <coverdraw/path.hpp>
#include <coverdraw/pen.hpp>
#include <coverdraw/stroked_path.hpp>
#include <coverdraw/brush/solid_brush.hpp>
#include <coverdraw/raster/coverage_rasterizer.hpp>

using namespace coverdraw;

namespace
{
  reference_counted_ptr<const Brush>
  black_brush(void)
  {
    return COVERDRAWnew SolidBrush(vec4(0.0f, 0.0f, 0.0f, 1.0f));
  }

  FlattenedPath
  polyline(std::initializer_list<vec2> pts, bool closed = false)
  {
    FlattenedPath return_value;
    std::vector<vec2> v(pts);

    return_value.add_polygon(v, closed);
    return return_value;
  }

  reference_counted_ptr<CoverageMap>
  stroke(const FlattenedPath &path, const Pen &pen)
  {
    CoverageRasterizer rasterizer;
    return rasterizer.rasterize(StrokedPath::create(path, pen),
                                RasterEnums::nonzero_fill_rule);
  }

  /* coverage at a pixel in frame coordinates */
  float
  coverage_at(const CoverageMap &map, int x, int y)
  {
    x -= map.origin().x();
    y -= map.origin().y();
    if (x < 0 || y < 0 || x >= map.width() || y >= map.height())
      {
        return 0.0f;
      }
    return map.value(x, y);
  }

  float
  signed_area(c_array<const vec2> pts)
  {
    float area(0.0f);
    for (unsigned int i = 0; i < pts.size(); ++i)
      {
        area += crossproduct(pts[i], pts[(i + 1) % pts.size()]);
      }
    return 0.5f * area;
  }
}

TEST(PenTest, Defaults)
{
  Pen pen(black_brush());

  EXPECT_EQ(pen.width(), 1.0f);
  EXPECT_EQ(pen.join_style(), RasterEnums::miter_joins);
  EXPECT_EQ(pen.cap_style(), RasterEnums::flat_caps);
  EXPECT_EQ(pen.miter_limit(), 4.0f);
  EXPECT_FALSE(pen.dashed());
  EXPECT_TRUE(pen.dash_pattern().empty());
}

TEST(PenTest, InvalidValuesAreRejected)
{
  Pen pen(black_brush(), 2.0f);
  std::vector<float> negative, zeros, valid;

  negative.push_back(1.0f);
  negative.push_back(-1.0f);
  zeros.assign(2, 0.0f);
  valid.push_back(3.0f);
  valid.push_back(0.0f);

  EXPECT_THROW(Pen(black_brush(), 0.0f), std::invalid_argument);
  EXPECT_THROW(Pen(black_brush(), -2.0f), std::invalid_argument);
  EXPECT_THROW(pen.dash_pattern(make_c_array(negative)), std::invalid_argument);
  EXPECT_THROW(pen.dash_pattern(make_c_array(zeros)), std::invalid_argument);
  EXPECT_THROW(pen.miter_limit(0.0f), std::invalid_argument);
  EXPECT_FALSE(pen.dashed());
  EXPECT_EQ(pen.miter_limit(), 4.0f);

  pen.dash_pattern(make_c_array(valid));
  EXPECT_TRUE(pen.dashed());
  ASSERT_EQ(pen.dash_pattern().size(), 2u);
  EXPECT_EQ(pen.dash_pattern()[0], 3.0f);
}

TEST(PenTest, CopiesAreIndependent)
{
  Pen a(black_brush(), 3.0f), b(black_brush());

  b = a;
  b.cap_style(RasterEnums::rounded_caps);
  EXPECT_EQ(b.width(), 3.0f);
  EXPECT_EQ(a.cap_style(), RasterEnums::flat_caps);
  EXPECT_EQ(b.cap_style(), RasterEnums::rounded_caps);
}

TEST(PenTest, HorizontalStroke)
{
  Pen pen(black_brush(), 2.0f);
  reference_counted_ptr<CoverageMap> map;

  map = stroke(polyline({vec2(0.0f, 5.0f), vec2(10.0f, 5.0f)}), pen);
  EXPECT_EQ(map->origin(), ivec2(0, 4));
  ASSERT_EQ(map->width(), 10);
  ASSERT_EQ(map->height(), 2);
  for (int r = 0; r < 2; ++r)
    {
      for (int c = 0; c < 10; ++c)
        {
          EXPECT_EQ(map->value(c, r), 1.0f) << c << ", " << r;
        }
    }
}

TEST(PenTest, SquareCapsExtendTheStroke)
{
  Pen pen(black_brush(), 2.0f);
  reference_counted_ptr<CoverageMap> map;

  pen.cap_style(RasterEnums::square_caps);
  map = stroke(polyline({vec2(0.0f, 5.0f), vec2(10.0f, 5.0f)}), pen);
  EXPECT_EQ(map->origin(), ivec2(-1, 4));
  EXPECT_EQ(map->width(), 12);
  EXPECT_EQ(coverage_at(*map, -1, 4), 1.0f);
  EXPECT_EQ(coverage_at(*map, 10, 5), 1.0f);
}

TEST(PenTest, RoundCapsAreRound)
{
  Pen pen(black_brush(), 4.0f);
  reference_counted_ptr<CoverageMap> map;

  pen.cap_style(RasterEnums::rounded_caps);
  map = stroke(polyline({vec2(10.0f, 10.0f), vec2(20.0f, 10.0f)}), pen);

  /* the corners of the square that bounds the cap are
   * only partially covered.
   */
  EXPECT_GT(coverage_at(*map, 9, 9), 0.99f);
  EXPECT_LT(coverage_at(*map, 8, 8), 0.5f);
  EXPECT_LT(coverage_at(*map, 21, 11), 0.5f);
  EXPECT_EQ(coverage_at(*map, 15, 8), 1.0f);
}

TEST(PenTest, DashedStroke)
{
  Pen pen(black_brush(), 2.0f);
  std::vector<float> dashes(2, 1.0f);
  reference_counted_ptr<CoverageMap> map;

  pen.dash_pattern(make_c_array(dashes));
  map = stroke(polyline({vec2(0.0f, 5.0f), vec2(16.0f, 5.0f)}), pen);

  /* dash lengths are in units of the pen width */
  const float expected[] = { 1.0f, 1.0f, 0.0f, 0.0f, 1.0f, 1.0f, 0.0f, 0.0f };
  for (int x = 0; x < 8; ++x)
    {
      EXPECT_EQ(coverage_at(*map, x, 4), expected[x]) << x;
      EXPECT_EQ(coverage_at(*map, x, 5), expected[x]) << x;
    }
}

TEST(PenTest, ManyDashesOnALongLine)
{
  Pen pen(black_brush(), 2.0f);
  std::vector<float> dashes(2, 0.5f);
  FlattenedPath stroked;

  /* 1000 dash elements of one pixel each, every drawn one
   * is a single quad since the caps are flat
   */
  pen.dash_pattern(make_c_array(dashes));
  stroked = StrokedPath::create(polyline({vec2(0.0f, 0.0f), vec2(1000.0f, 0.0f)}), pen);
  ASSERT_EQ(stroked.number_polygons(), 500u);
  ASSERT_EQ(stroked.polygon(499).size(), 4u);

  FlattenedPath last;
  Rect bb;

  last.add_polygon(stroked.polygon(499), true);
  ASSERT_TRUE(last.bounding_box(&bb));
  EXPECT_FLOAT_EQ(bb.m_min_point.x(), 998.0f);
  EXPECT_FLOAT_EQ(bb.m_max_point.x(), 999.0f);
}

TEST(PenTest, TooManyDashesStrokeSolid)
{
  Pen solid(black_brush(), 1.0f), dashed(black_brush(), 1.0f);
  std::vector<float> dashes(2, 1e-5f);
  FlattenedPath line(polyline({vec2(0.0f, 0.0f), vec2(1000.0f, 0.0f)}));
  FlattenedPath from_solid, from_dashed;

  dashed.dash_pattern(make_c_array(dashes));
  from_solid = StrokedPath::create(line, solid);
  from_dashed = StrokedPath::create(line, dashed);

  ASSERT_EQ(from_dashed.number_polygons(), from_solid.number_polygons());
  for (unsigned int i = 0; i < from_solid.number_polygons(); ++i)
    {
      ASSERT_EQ(from_dashed.polygon(i).size(), from_solid.polygon(i).size());
      for (unsigned int j = 0; j < from_solid.polygon(i).size(); ++j)
        {
          EXPECT_EQ(from_dashed.polygon(i)[j], from_solid.polygon(i)[j]);
        }
    }
}

TEST(PenTest, JoinStyles)
{
  FlattenedPath corner(polyline({vec2(2.0f, 2.0f), vec2(10.0f, 2.0f), vec2(10.0f, 10.0f)}));
  Pen pen(black_brush(), 4.0f);

  /* the miter of a right angle fills the square [10, 12]x[0, 2] */
  EXPECT_NEAR(coverage_at(*stroke(corner, pen), 11, 0), 1.0f, 1e-3f);

  pen.join_style(RasterEnums::bevel_joins);
  EXPECT_NEAR(coverage_at(*stroke(corner, pen), 11, 0), 0.0f, 1e-3f);
  EXPECT_NEAR(coverage_at(*stroke(corner, pen), 10, 1), 1.0f, 1e-3f);

  /* a miter longer than the limit falls back to a bevel */
  pen.join_style(RasterEnums::miter_joins);
  pen.miter_limit(1.2f);
  EXPECT_NEAR(coverage_at(*stroke(corner, pen), 11, 0), 0.0f, 1e-3f);

  pen.join_style(RasterEnums::rounded_joins);
  EXPECT_GT(coverage_at(*stroke(corner, pen), 11, 0), 0.0f);
  EXPECT_LT(coverage_at(*stroke(corner, pen), 11, 0), 1.0f);
}

TEST(PenTest, StrokePolygonsHavePositiveArea)
{
  Path path;
  Pen pen(black_brush(), 3.0f);
  std::vector<float> dashes;

  path.move(vec2(0.0f, 0.0f))
    .line_to(vec2(30.0f, 0.0f))
    .quadratic_to(vec2(40.0f, 20.0f), vec2(10.0f, 30.0f))
    .arc_to(COVERDRAW_PI * 0.5f, vec2(-5.0f, 10.0f))
    .close_contour()
    .move(vec2(50.0f, 50.0f))
    .cubic_to(vec2(60.0f, 40.0f), vec2(70.0f, 60.0f), vec2(80.0f, 50.0f));

  dashes.push_back(2.0f);
  dashes.push_back(1.5f);

  for (int join = 0; join < RasterEnums::number_join_styles; ++join)
    {
      for (int cap = 0; cap < RasterEnums::number_cap_styles; ++cap)
        {
          FlattenedPath stroked;

          pen.join_style(static_cast<enum RasterEnums::join_style>(join));
          pen.cap_style(static_cast<enum RasterEnums::cap_style>(cap));
          pen.dash_pattern(c_array<const float>());
          stroked = StrokedPath::create(path.flatten(), pen);
          ASSERT_GT(stroked.number_polygons(), 0u);
          for (unsigned int p = 0; p < stroked.number_polygons(); ++p)
            {
              EXPECT_TRUE(stroked.closed(p));
              EXPECT_GT(signed_area(stroked.polygon(p)), 0.0f);
            }

          pen.dash_pattern(make_c_array(dashes));
          stroked = StrokedPath::create(path.flatten(), pen);
          ASSERT_GT(stroked.number_polygons(), 0u);
          for (unsigned int p = 0; p < stroked.number_polygons(); ++p)
            {
              EXPECT_GT(signed_area(stroked.polygon(p)), 0.0f);
            }
        }
    }
}

TEST(PenTest, SinglePointStroke)
{
  Pen pen(black_brush(), 2.0f);

  EXPECT_EQ(StrokedPath::create(polyline({vec2(5.0f, 5.0f)}), pen).number_polygons(), 0u);

  pen.cap_style(RasterEnums::square_caps);
  EXPECT_EQ(StrokedPath::create(polyline({vec2(5.0f, 5.0f)}), pen).number_polygons(), 2u);
  EXPECT_THROW(StrokedPath::create(polyline({vec2(5.0f, 5.0f)}), pen, 0.0f),
               std::invalid_argument);
}
