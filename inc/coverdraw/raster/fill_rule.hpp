/*!
 * \file fill_rule.hpp
 * \brief file fill_rule.hpp
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

#pragma once

#include <coverdraw/raster/raster_enums.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
  @{
 */
  /*!
    Interface deciding from a winding number whether a
    sample is inside a path. The winding number 0 is
    always outside; EdgeTable does not ask about it.
   */
  class CustomFillRuleBase
  {
  public:
    virtual
    ~CustomFillRuleBase()
    {}

    /*!
      Returns true if a sample with the given winding
      number is covered.
     */
    virtual
    bool
    operator()(int winding_number) const = 0;
  };

  /*!
    CustomFillRuleBase for one of the fill rules named
    by RasterEnums::fill_rule_t.
  */
  class CustomFillRuleFunction:public CustomFillRuleBase
  {
  public:
    /*!
      Ctor. Throws std::invalid_argument if fill_rule
      is not odd_even_fill_rule or nonzero_fill_rule.
     */
    explicit
    CustomFillRuleFunction(enum RasterEnums::fill_rule_t fill_rule);

    virtual
    bool
    operator()(int winding_number) const
    {
      return covered(m_fill_rule, winding_number);
    }

    /*!
      The fill rule applied.
     */
    enum RasterEnums::fill_rule_t
    fill_rule(void) const
    {
      return m_fill_rule;
    }

    /*!
      Applies a fill rule to a winding number, an invalid
      fill rule covers nothing.
     */
    static
    bool
    covered(enum RasterEnums::fill_rule_t fill_rule, int winding_number);

  private:
    enum RasterEnums::fill_rule_t m_fill_rule;
  };
/*! @} */
}
