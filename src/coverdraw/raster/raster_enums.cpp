/*!
 * \file raster_enums.cpp
 * \brief file raster_enums.cpp
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

#include <coverdraw/raster/raster_enums.hpp>

#define EASY(X) case X: return #X

coverdraw::c_string
coverdraw::RasterEnums::
label(enum fill_rule_t v)
{
  switch (v)
    {
      EASY(odd_even_fill_rule);
      EASY(nonzero_fill_rule);
    default:
      return "InvalidEnum";
    }
}

coverdraw::c_string
coverdraw::RasterEnums::
label(enum cap_style v)
{
  switch (v)
    {
      EASY(flat_caps);
      EASY(square_caps);
      EASY(rounded_caps);
    default:
      return "InvalidEnum";
    }
}

coverdraw::c_string
coverdraw::RasterEnums::
label(enum join_style v)
{
  switch (v)
    {
      EASY(bevel_joins);
      EASY(miter_joins);
      EASY(rounded_joins);
    default:
      return "InvalidEnum";
    }
}
