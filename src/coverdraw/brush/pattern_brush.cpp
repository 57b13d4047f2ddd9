/*!
 * \file pattern_brush.cpp
 * \brief file pattern_brush.cpp
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
#include <coverdraw/brush/pattern_brush.hpp>
#include <coverdraw/util/math.hpp>
#include <private/util_private.hpp>

namespace
{
  class PatternBrushPrivate
  {
  public:
    PatternBrushPrivate(int rows, int columns):
      m_rows(rows),
      m_columns(columns)
    {}

    const coverdraw::vec4&
    color(int x, int y) const
    {
      return m_colors[coverdraw::t_wrap(y, m_rows) * m_columns
                      + coverdraw::t_wrap(x, m_columns)];
    }

    int m_rows, m_columns;
    std::vector<coverdraw::vec4> m_colors;
  };

  class PatternBrushApplicator:public coverdraw::BrushApplicator
  {
  public:
    PatternBrushApplicator(const PatternBrushPrivate *tile,
                           const coverdraw::GraphicsOptions &options,
                           coverdraw::ImageFrame &frame,
                           const coverdraw::IRect &region,
                           const coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator> &allocator,
                           const coverdraw::reference_counted_ptr<const coverdraw::PatternBrush> &brush):
      coverdraw::BrushApplicator(options, frame, region, allocator),
      m_tile(tile),
      m_brush(brush)
    {}

  protected:
    virtual
    void
    colors(int x, int y, coverdraw::c_array<coverdraw::vec4> out_colors) const
    {
      int row, column;

      row = coverdraw::t_wrap(y, m_tile->m_rows) * m_tile->m_columns;
      column = coverdraw::t_wrap(x, m_tile->m_columns);
      for (coverdraw::vec4 &c : out_colors)
        {
          c = m_tile->m_colors[row + column];
          if (++column == m_tile->m_columns)
            {
              column = 0;
            }
        }
    }

  private:
    const PatternBrushPrivate *m_tile;

    /* keeps the tile alive */
    coverdraw::reference_counted_ptr<const coverdraw::PatternBrush> m_brush;
  };

  /* each string is a row of the template where '1'
   * selects the fore color.
   */
  coverdraw::reference_counted_ptr<coverdraw::PatternBrush>
  create_from_strings(const coverdraw::vec4 &fore_color,
                      const coverdraw::vec4 &back_color,
                      const char *const *rows, int number_rows)
  {
    std::vector<coverdraw::vec4> colors;
    int number_columns(0);

    for (int r = 0; r < number_rows; ++r)
      {
        int c;
        for (c = 0; rows[r][c] != 0; ++c)
          {
            colors.push_back((rows[r][c] == '1') ? fore_color : back_color);
          }
        number_columns = c;
      }

    return COVERDRAWnew coverdraw::PatternBrush(number_rows, number_columns,
                                                coverdraw::make_c_array(colors));
  }
}

///////////////////////////////////
// coverdraw::PatternBrush methods
coverdraw::PatternBrush::
PatternBrush(const vec4 &fore_color, const vec4 &back_color,
             int rows, int columns, c_array<const bool> pattern)
{
  PatternBrushPrivate *d;

  COVERDRAWrequire(rows > 0 && columns > 0, "PatternBrush tile dimensions must be positive");
  COVERDRAWrequire(pattern.size() == static_cast<unsigned int>(rows * columns),
                   "PatternBrush template must have rows * columns elements");

  d = COVERDRAWnew PatternBrushPrivate(rows, columns);
  d->m_colors.reserve(pattern.size());
  for (bool b : pattern)
    {
      d->m_colors.push_back((b) ? fore_color : back_color);
    }
  m_d = d;
}

coverdraw::PatternBrush::
PatternBrush(int rows, int columns, c_array<const vec4> colors)
{
  PatternBrushPrivate *d;

  COVERDRAWrequire(rows > 0 && columns > 0, "PatternBrush tile dimensions must be positive");
  COVERDRAWrequire(colors.size() == static_cast<unsigned int>(rows * columns),
                   "PatternBrush colors must have rows * columns elements");

  d = COVERDRAWnew PatternBrushPrivate(rows, columns);
  d->m_colors.assign(colors.begin(), colors.end());
  m_d = d;
}

coverdraw::PatternBrush::
~PatternBrush()
{
  PatternBrushPrivate *d;
  d = static_cast<PatternBrushPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

get_implement(coverdraw::PatternBrush, PatternBrushPrivate, int, rows)
get_implement(coverdraw::PatternBrush, PatternBrushPrivate, int, columns)

const coverdraw::vec4&
coverdraw::PatternBrush::
color(int x, int y) const
{
  PatternBrushPrivate *d;
  d = static_cast<PatternBrushPrivate*>(m_d);
  return d->color(x, y);
}

coverdraw::reference_counted_ptr<coverdraw::BrushApplicator>
coverdraw::PatternBrush::
create_applicator(const GraphicsOptions &options, ImageFrame &frame,
                  const IRect &region,
                  const reference_counted_ptr<ScratchAllocator> &allocator) const
{
  PatternBrushPrivate *d;
  d = static_cast<PatternBrushPrivate*>(m_d);
  return COVERDRAWnew PatternBrushApplicator(d, options, frame, region, allocator, this);
}

coverdraw::reference_counted_ptr<coverdraw::PatternBrush>
coverdraw::PatternBrush::
percent10(const vec4 &fore_color, const vec4 &back_color)
{
  static const char *const rows[] =
    {
      "1000",
      "0000",
      "0010",
      "0000",
    };
  return create_from_strings(fore_color, back_color, rows, 4);
}

coverdraw::reference_counted_ptr<coverdraw::PatternBrush>
coverdraw::PatternBrush::
percent20(const vec4 &fore_color, const vec4 &back_color)
{
  static const char *const rows[] =
    {
      "1000",
      "0010",
      "1000",
      "0010",
    };
  return create_from_strings(fore_color, back_color, rows, 4);
}

coverdraw::reference_counted_ptr<coverdraw::PatternBrush>
coverdraw::PatternBrush::
horizontal(const vec4 &fore_color, const vec4 &back_color)
{
  static const char *const rows[] =
    {
      "0",
      "1",
      "0",
      "0",
    };
  return create_from_strings(fore_color, back_color, rows, 4);
}

coverdraw::reference_counted_ptr<coverdraw::PatternBrush>
coverdraw::PatternBrush::
vertical(const vec4 &fore_color, const vec4 &back_color)
{
  static const char *const rows[] =
    {
      "0100",
    };
  return create_from_strings(fore_color, back_color, rows, 1);
}

coverdraw::reference_counted_ptr<coverdraw::PatternBrush>
coverdraw::PatternBrush::
forward_diagonal(const vec4 &fore_color, const vec4 &back_color)
{
  static const char *const rows[] =
    {
      "0001",
      "0010",
      "0100",
      "1000",
    };
  return create_from_strings(fore_color, back_color, rows, 4);
}

coverdraw::reference_counted_ptr<coverdraw::PatternBrush>
coverdraw::PatternBrush::
backward_diagonal(const vec4 &fore_color, const vec4 &back_color)
{
  static const char *const rows[] =
    {
      "1000",
      "0100",
      "0010",
      "0001",
    };
  return create_from_strings(fore_color, back_color, rows, 4);
}
