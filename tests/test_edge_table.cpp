/*!
 * \file test_edge_table.cpp
 * \brief file test_edge_table.cpp
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
#include <initializer_list>
#include <stdexcept>
#include <gtest/gtest.h>
#include <coverdraw/flattened_path.hpp>
#include <coverdraw/raster/edge_table.hpp>
#include <coverdraw/raster/fill_rule.hpp>
#include <coverdraw/util/math.hpp>

using namespace coverdraw;

namespace
{
  FlattenedPath
  polygon(std::initializer_list<vec2> pts, bool closed = true)
  {
    FlattenedPath return_value;
    std::vector<vec2> v(pts);

    return_value.add_polygon(v, closed);
    return return_value;
  }

  /* flattens spans to enter, exit, enter, exit, ... */
  std::vector<float>
  span_values(const FlattenedPath &path, float y,
              enum RasterEnums::fill_rule_t rule = RasterEnums::nonzero_fill_rule)
  {
    std::vector<Span> spans;
    std::vector<float> return_value;

    compute_spans(path, rule, y, &spans);
    for (const Span &S : spans)
      {
        return_value.push_back(S.m_enter);
        return_value.push_back(S.m_exit);
      }
    return return_value;
  }

  void
  expect_values(const std::vector<float> &values, std::initializer_list<float> expected)
  {
    std::vector<float> e(expected);

    ASSERT_EQ(values.size(), e.size());
    for (unsigned int i = 0; i < e.size(); ++i)
      {
        EXPECT_NEAR(values[i], e[i], 1e-4f) << " at element " << i;
      }
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

TEST(EdgeTableTest, UnitSquare)
{
  FlattenedPath square(polygon({vec2(0, 0), vec2(10, 0), vec2(10, 10), vec2(0, 10)}));
  EdgeTable table(square);

  EXPECT_EQ(table.number_edges(), 2u);
  EXPECT_FLOAT_EQ(table.y_extent().m_begin, 0.0f);
  EXPECT_FLOAT_EQ(table.y_extent().m_end, 10.0f);

  expect_values(span_values(square, 5.0f), {0.0f, 10.0f});

  /* half-open in y: the top edge row is in, the bottom is out */
  expect_values(span_values(square, 0.0f), {0.0f, 10.0f});
  expect_values(span_values(square, 10.0f), {});
  expect_values(span_values(square, -1.0f), {});
}

TEST(EdgeTableTest, BowtieCrossingsCoincide)
{
  FlattenedPath bowtie(polygon({vec2(0, 0), vec2(10, 0), vec2(0, 10), vec2(10, 10)}));
  std::vector<Crossing> crossings;

  EdgeTable table(bowtie);
  ASSERT_EQ(table.crossings(5.0f, &crossings), 2u);
  EXPECT_FLOAT_EQ(crossings[0].m_x, 5.0f);
  EXPECT_FLOAT_EQ(crossings[1].m_x, 5.0f);

  expect_values(span_values(bowtie, 5.0f), {5.0f, 5.0f});
  expect_values(span_values(bowtie, 2.5f), {2.5f, 7.5f});
  expect_values(span_values(bowtie, 7.5f), {2.5f, 7.5f});

  expect_values(span_values(bowtie, 5.0f, RasterEnums::odd_even_fill_rule), {5.0f, 5.0f});
  expect_values(span_values(bowtie, 2.5f, RasterEnums::odd_even_fill_rule), {2.5f, 7.5f});
  expect_values(span_values(bowtie, 7.5f, RasterEnums::odd_even_fill_rule), {2.5f, 7.5f});
}

TEST(EdgeTableTest, CrossedSquare)
{
  FlattenedPath poly(polygon({vec2(0, 0), vec2(10, 10), vec2(10, 0), vec2(0, 10)}));

  expect_values(span_values(poly, 2.5f), {0.0f, 2.5f, 7.5f, 10.0f});
  expect_values(span_values(poly, 7.5f), {0.0f, 2.5f, 7.5f, 10.0f});
}

TEST(EdgeTableTest, ConcaveNotch)
{
  FlattenedPath poly(polygon({vec2(0, 0), vec2(10, 10), vec2(20, 0), vec2(20, 20), vec2(0, 20)}));

  expect_values(span_values(poly, 5.5f), {0.0f, 5.5f, 14.5f, 20.0f});
  expect_values(span_values(poly, 1.0f), {0.0f, 1.0f, 19.0f, 20.0f});

  /* the notch vertex is on the scan line; its edges end there */
  expect_values(span_values(poly, 10.0f), {0.0f, 20.0f});
  expect_values(span_values(poly, 15.0f), {0.0f, 20.0f});
}

TEST(EdgeTableTest, ConcaveSmall)
{
  FlattenedPath poly(polygon({vec2(0, 3), vec2(3, 3), vec2(3, 0), vec2(1, 2), vec2(1, 1), vec2(0, 0)}));

  expect_values(span_values(poly, 0.5f), {0.0f, 0.5f, 2.5f, 3.0f});
  expect_values(span_values(poly, 1.5f), {0.0f, 1.0f, 1.5f, 3.0f});
  expect_values(span_values(poly, 2.5f), {0.0f, 3.0f});
}

TEST(EdgeTableTest, ConcaveSteps)
{
  FlattenedPath poly(polygon({vec2(0, 0), vec2(2, 0), vec2(3, 1), vec2(3, 0), vec2(6, 0),
                              vec2(6, 2), vec2(5, 2), vec2(5, 1), vec2(4, 1), vec2(4, 2),
                              vec2(2, 2), vec2(1, 1), vec2(0, 2)}));

  expect_values(span_values(poly, 0.5f), {0.0f, 2.5f, 3.0f, 6.0f});
  expect_values(span_values(poly, 1.5f), {0.0f, 0.5f, 1.5f, 4.0f, 5.0f, 6.0f});
}

TEST(EdgeTableTest, PlusShape)
{
  FlattenedPath poly(polygon({vec2(10, 0), vec2(20, 0), vec2(20, 30), vec2(10, 30),
                              vec2(10, 20), vec2(0, 20), vec2(0, 10), vec2(10, 10)}));

  expect_values(span_values(poly, 5.0f), {10.0f, 20.0f});
  expect_values(span_values(poly, 15.0f), {0.0f, 20.0f});
  expect_values(span_values(poly, 25.0f), {10.0f, 20.0f});
}

TEST(EdgeTableTest, SelfIntersectingRulesDiffer)
{
  FlattenedPath poly(polygon({vec2(10, 30), vec2(10, 20), vec2(50, 20), vec2(50, 50),
                              vec2(20, 50), vec2(20, 10), vec2(30, 10), vec2(30, 40),
                              vec2(40, 40), vec2(40, 30), vec2(10, 30)}));

  expect_values(span_values(poly, 15.0f, RasterEnums::nonzero_fill_rule), {20.0f, 30.0f});
  expect_values(span_values(poly, 15.0f, RasterEnums::odd_even_fill_rule), {20.0f, 30.0f});

  expect_values(span_values(poly, 25.0f, RasterEnums::nonzero_fill_rule), {10.0f, 50.0f});
  expect_values(span_values(poly, 25.0f, RasterEnums::odd_even_fill_rule),
                {10.0f, 20.0f, 30.0f, 50.0f});

  expect_values(span_values(poly, 35.0f, RasterEnums::nonzero_fill_rule),
                {20.0f, 30.0f, 40.0f, 50.0f});
  expect_values(span_values(poly, 45.0f, RasterEnums::odd_even_fill_rule), {20.0f, 50.0f});
}

TEST(EdgeTableTest, CrossingsMatchEdgesContainingTheScanLine)
{
  /* the second polygon crosses itself several times */
  std::vector<std::vector<vec2> > polygons(2);

  polygons[0] = {vec2(82.142f, 63.157f), vec2(37, 85), vec2(65, 137),
                 vec2(103.792f, 79.11f), vec2(200, 150), vec2(50, 300),
                 vec2(10, 10)};
  polygons[1] = {vec2(10, 30), vec2(10, 20), vec2(50, 20), vec2(50, 50),
                 vec2(20, 50), vec2(20, 10), vec2(30, 10), vec2(30, 40),
                 vec2(40, 40), vec2(40, 30), vec2(10, 30)};

  for (const std::vector<vec2> &pts : polygons)
    {
      FlattenedPath poly;
      std::vector<Crossing> crossings;
      std::vector<Span> spans;

      poly.add_polygon(pts, true);
      EdgeTable table(poly);

      for (float y = 0.0f; y < 310.0f; y += 0.37f)
        {
          unsigned int expected(0);

          /* non-horizontal edges whose half-open range [y_min, y_max)
           * holds y, the closing edge included
           */
          for (unsigned int i = 0; i < pts.size(); ++i)
            {
              const vec2 &a(pts[i]);
              const vec2 &b(pts[(i + 1) % pts.size()]);
              float y_min(t_min(a.y(), b.y())), y_max(t_max(a.y(), b.y()));

              if (y_min != y_max && y_min <= y && y < y_max)
                {
                  ++expected;
                }
            }

          table.crossings(y, &crossings);
          EXPECT_EQ(crossings.size(), expected) << " at y = " << y;
          EXPECT_EQ(crossings.size() % 2, 0u) << " at y = " << y;
          for (unsigned int i = 1; i < crossings.size(); ++i)
            {
              EXPECT_LE(crossings[i - 1].m_x, crossings[i].m_x);
            }

          table.spans(y, RasterEnums::odd_even_fill_rule, &spans);
          for (unsigned int i = 0; i < spans.size(); ++i)
            {
              EXPECT_LE(spans[i].m_enter, spans[i].m_exit);
              if (i > 0)
                {
                  EXPECT_LE(spans[i - 1].m_exit, spans[i].m_enter);
                }
            }
        }
    }
}

TEST(EdgeTableTest, RulesAgreeOnSimplePolygon)
{
  FlattenedPath poly(polygon({vec2(0, 0), vec2(30, 5), vec2(20, 25), vec2(3, 17)}));
  EdgeTable table(poly);
  std::vector<Span> odd_even, nonzero;

  for (float y = -1.0f; y < 27.0f; y += 0.5f)
    {
      table.spans(y, RasterEnums::odd_even_fill_rule, &odd_even);
      table.spans(y, RasterEnums::nonzero_fill_rule, &nonzero);
      ASSERT_EQ(odd_even.size(), nonzero.size());
      for (unsigned int i = 0; i < odd_even.size(); ++i)
        {
          EXPECT_EQ(odd_even[i].m_enter, nonzero[i].m_enter);
          EXPECT_EQ(odd_even[i].m_exit, nonzero[i].m_exit);
        }
    }
}

TEST(EdgeTableTest, CustomFillRule)
{
  FlattenedPath poly;
  std::vector<vec2> a, b;
  std::vector<Span> spans;

  a.push_back(vec2(0, 0));
  a.push_back(vec2(10, 0));
  a.push_back(vec2(10, 10));
  a.push_back(vec2(0, 10));
  b.push_back(vec2(5, 0));
  b.push_back(vec2(15, 0));
  b.push_back(vec2(15, 10));
  b.push_back(vec2(5, 10));
  poly.add_polygon(a).add_polygon(b);

  EdgeTable table(poly);
  table.spans(5.0f, AtLeastTwice(), &spans);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_FLOAT_EQ(spans[0].m_enter, 5.0f);
  EXPECT_FLOAT_EQ(spans[0].m_exit, 10.0f);

  table.spans(5.0f, RasterEnums::nonzero_fill_rule, &spans);
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_FLOAT_EQ(spans[0].m_enter, 0.0f);
  EXPECT_FLOAT_EQ(spans[0].m_exit, 15.0f);

  table.spans(5.0f, RasterEnums::odd_even_fill_rule, &spans);
  ASSERT_EQ(spans.size(), 2u);
  EXPECT_FLOAT_EQ(spans[0].m_exit, 5.0f);
  EXPECT_FLOAT_EQ(spans[1].m_enter, 10.0f);
}

TEST(EdgeTableTest, OpenPolygons)
{
  FlattenedPath open(polygon({vec2(0, 0), vec2(10, 0), vec2(10, 10)}, false));

  EXPECT_EQ(EdgeTable(open, true).number_edges(), 2u);
  EXPECT_EQ(EdgeTable(open, false).number_edges(), 1u);

  /* closed for filling by default */
  expect_values(span_values(open, 5.0f), {5.0f, 10.0f});
}

TEST(EdgeTableTest, DegenerateInput)
{
  FlattenedPath empty;
  FlattenedPath flat_line(polygon({vec2(0, 3), vec2(10, 3)}));
  FlattenedPath single(polygon({vec2(4, 4)}));

  EXPECT_EQ(EdgeTable(empty).number_edges(), 0u);
  EXPECT_EQ(EdgeTable(flat_line).number_edges(), 0u);
  EXPECT_EQ(EdgeTable(single).number_edges(), 0u);
  expect_values(span_values(flat_line, 3.0f), {});
}

TEST(EdgeTableTest, FillRuleFunctions)
{
  CustomFillRuleFunction odd_even(RasterEnums::odd_even_fill_rule);
  CustomFillRuleFunction nonzero(RasterEnums::nonzero_fill_rule);

  EXPECT_FALSE(odd_even(0));
  EXPECT_TRUE(odd_even(1));
  EXPECT_TRUE(odd_even(-3));
  EXPECT_FALSE(odd_even(-2));
  EXPECT_FALSE(nonzero(0));
  EXPECT_TRUE(nonzero(2));
  EXPECT_TRUE(nonzero(-1));
  EXPECT_EQ(odd_even.fill_rule(), RasterEnums::odd_even_fill_rule);
  EXPECT_THROW(CustomFillRuleFunction(RasterEnums::number_fill_rule), std::invalid_argument);
}
