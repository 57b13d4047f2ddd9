/*!
 * \file fill_rule.cpp
 * \brief file fill_rule.cpp
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

#include <coverdraw/util/util.hpp>
#include <coverdraw/raster/fill_rule.hpp>

////////////////////////////////////////////
// coverdraw::CustomFillRuleFunction methods
coverdraw::CustomFillRuleFunction::
CustomFillRuleFunction(enum RasterEnums::fill_rule_t fill_rule):
  m_fill_rule(fill_rule)
{
  COVERDRAWrequire(fill_rule == RasterEnums::odd_even_fill_rule
                   || fill_rule == RasterEnums::nonzero_fill_rule,
                   "unknown fill rule");
}

bool
coverdraw::CustomFillRuleFunction::
covered(enum RasterEnums::fill_rule_t fill_rule, int winding_number)
{
  switch(fill_rule)
    {
    case RasterEnums::odd_even_fill_rule:
      /* -3 % 2 is -1, so compare against zero */
      return (winding_number % 2) != 0;

    case RasterEnums::nonzero_fill_rule:
      return winding_number != 0;

    default:
      return false;
    }
}
