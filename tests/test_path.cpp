/*!
 * \file test_path.cpp
 * \brief file test_path.cpp
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
#include <gtest/gtest.h>
#include <coverdraw/path.hpp>
#include <coverdraw/flattened_path.hpp>
#include <coverdraw/util/math.hpp>

using namespace coverdraw;

namespace
{
  float
  distance_to_segment(const vec2 &p, const vec2 &a, const vec2 &b)
  {
    vec2 ab(b - a), ap(p - a);
    float len_sq(ab.magnitudeSq()), t;

    if (len_sq <= 0.0f)
      {
        return ap.magnitude();
      }
    t = t_clamp(dot(ap, ab) / len_sq, 0.0f, 1.0f);
    return (p - (a + ab * t)).magnitude();
  }

  float
  distance_to_polyline(const vec2 &p, c_array<const vec2> pts)
  {
    float d(distance_to_segment(p, pts[0], pts[0]));
    for (unsigned int i = 0; i + 1 < pts.size(); ++i)
      {
        d = t_min(d, distance_to_segment(p, pts[i], pts[i + 1]));
      }
    return d;
  }
}

TEST(PathTest, LineContourFlattensToItsPoints)
{
  Path path;

  path << vec2(0.0f, 0.0f) << vec2(10.0f, 0.0f) << vec2(10.0f, 10.0f)
       << Path::contour_close();

  ASSERT_EQ(path.number_contours(), 1u);
  EXPECT_TRUE(path.contour(0)->closed());

  FlattenedPath flat(path.flatten());
  ASSERT_EQ(flat.number_polygons(), 1u);
  EXPECT_TRUE(flat.closed(0));

  c_array<const vec2> pts(flat.polygon(0));
  ASSERT_EQ(pts.size(), 3u);
  EXPECT_EQ(pts[0], vec2(0.0f, 0.0f));
  EXPECT_EQ(pts[1], vec2(10.0f, 0.0f));
  EXPECT_EQ(pts[2], vec2(10.0f, 10.0f));
}

TEST(PathTest, MoveStartsNewOpenContour)
{
  Path path;

  path.move(vec2(0.0f, 0.0f)).line_to(vec2(5.0f, 0.0f));
  path.move(vec2(0.0f, 5.0f)).line_to(vec2(5.0f, 5.0f)).close_contour();

  FlattenedPath flat(path.flatten());
  ASSERT_EQ(flat.number_polygons(), 2u);
  EXPECT_FALSE(flat.closed(0));
  EXPECT_TRUE(flat.closed(1));
  EXPECT_EQ(flat.number_points(), 4u);
}

TEST(PathTest, QuadraticFlatteningStaysWithinTolerance)
{
  Path path;
  const float tolerance(0.1f);

  path.move(vec2(0.0f, 0.0f));
  path.quadratic_to(vec2(50.0f, 100.0f), vec2(100.0f, 0.0f));
  path.end_contour();

  FlattenedPath flat(path.flatten(tolerance));
  ASSERT_EQ(flat.number_polygons(), 1u);

  c_array<const vec2> pts(flat.polygon(0));
  EXPECT_GT(pts.size(), 4u);
  EXPECT_EQ(pts.front(), vec2(0.0f, 0.0f));
  EXPECT_EQ(pts.back(), vec2(100.0f, 0.0f));

  for (int i = 0; i <= 200; ++i)
    {
      float t(static_cast<float>(i) / 200.0f);
      vec2 curve(100.0f * t, 200.0f * t * (1.0f - t));

      EXPECT_LE(distance_to_polyline(curve, pts), tolerance * 1.01f);
    }
}

TEST(PathTest, SmallerToleranceGivesMorePoints)
{
  Path path;

  path.move(vec2(0.0f, 0.0f));
  path.cubic_to(vec2(0.0f, 50.0f), vec2(100.0f, 50.0f), vec2(100.0f, 0.0f));
  path.end_contour();

  EXPECT_LT(path.flatten(1.0f).number_points(),
            path.flatten(0.01f).number_points());
}

TEST(PathTest, ArcPointsLieOnCircle)
{
  Path path;

  path.move(vec2(10.0f, 0.0f));
  path.arc_to(COVERDRAW_PI, vec2(-10.0f, 0.0f));
  path.end_contour();

  FlattenedPath flat(path.flatten(0.05f));
  c_array<const vec2> pts(flat.polygon(0));

  EXPECT_GT(pts.size(), 3u);
  for (const vec2 &p : pts)
    {
      EXPECT_NEAR(p.magnitude(), 10.0f, 1e-3f);
    }
}

TEST(PathTest, NonPositiveToleranceIsRejected)
{
  Path path;

  path << vec2(0.0f, 0.0f) << vec2(1.0f, 1.0f);
  EXPECT_THROW(path.flatten(0.0f), std::invalid_argument);
}

TEST(PathTest, BoundingBoxes)
{
  Path path;
  Rect bb;

  EXPECT_FALSE(path.approximate_bounding_box(&bb));

  path << vec2(1.0f, 2.0f) << vec2(5.0f, -3.0f) << vec2(2.0f, 7.0f)
       << Path::contour_close();
  ASSERT_TRUE(path.approximate_bounding_box(&bb));
  EXPECT_FLOAT_EQ(bb.min_x(), 1.0f);
  EXPECT_FLOAT_EQ(bb.min_y(), -3.0f);
  EXPECT_FLOAT_EQ(bb.max_x(), 5.0f);
  EXPECT_FLOAT_EQ(bb.max_y(), 7.0f);

  FlattenedPath flat(path.flatten());
  flat.translate(vec2(1.0f, 1.0f)).scale(2.0f);
  ASSERT_TRUE(flat.bounding_box(&bb));
  EXPECT_FLOAT_EQ(bb.min_x(), 4.0f);
  EXPECT_FLOAT_EQ(bb.min_y(), -4.0f);
  EXPECT_FLOAT_EQ(bb.max_x(), 12.0f);
  EXPECT_FLOAT_EQ(bb.max_y(), 16.0f);
}

TEST(PathTest, FlattenedPathCopiesAreIndependent)
{
  FlattenedPath a;
  std::vector<vec2> pts;

  pts.push_back(vec2(0.0f, 0.0f));
  pts.push_back(vec2(1.0f, 0.0f));
  pts.push_back(vec2(1.0f, 1.0f));
  a.add_polygon(pts);

  FlattenedPath b(a);
  b.add_polygons(b);
  EXPECT_EQ(a.number_polygons(), 1u);
  EXPECT_EQ(b.number_polygons(), 2u);

  a.clear();
  EXPECT_TRUE(a.empty());
  EXPECT_EQ(b.number_points(), 6u);
}
