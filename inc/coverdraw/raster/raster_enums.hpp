/*!
 * \file raster_enums.hpp
 * \brief file raster_enums.hpp
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

#include <coverdraw/util/util.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * \brief
   * Class to encapsulate enumerations used in rasterization
   * and stroking.
   */
  class RasterEnums
  {
  public:
    /*!
     * \brief
     * Enumeration specifying the fill rule used to decide
     * which regions of a path are inside.
     */
    enum fill_rule_t
      {
        odd_even_fill_rule, /*!< inside when the winding number is odd */
        nonzero_fill_rule, /*!< inside when the winding number is non-zero */

        number_fill_rule /*!< count of enums */
      };

    /*!
     * \brief
     * Enumeration to specify how to draw the ends of
     * open contours when stroking.
     */
    enum cap_style
      {
        flat_caps,      /*!< indicates to have flat (i.e. no) caps when stroking */
        square_caps,    /*!< indicates to have square caps when stroking */
        rounded_caps,   /*!< indicates to have rounded caps when stroking */

        number_cap_styles /*!< number of cap styles */
      };

    /*!
     * \brief
     * Enumeration to specify how to join consecutive
     * segments when stroking.
     */
    enum join_style
      {
        /*!
         * indicates to stroke with bevel joins
         */
        bevel_joins,

        /*!
         * indicates to stroke with miter joins where if the
         * miter distance is exceeded the join is drawn as a
         * bevel join
         */
        miter_joins,

        /*!
         * indicates to stroke with rounded joins
         */
        rounded_joins,

        number_join_styles, /*!< number of join styles */
      };

    /*!
     * Returns a \ref c_string for an enumerated value.
     * \param v value to return string of
     */
    static
    c_string
    label(enum fill_rule_t v);

    /*!
     * Returns a \ref c_string for an enumerated value.
     * \param v value to return string of
     */
    static
    c_string
    label(enum cap_style v);

    /*!
     * Returns a \ref c_string for an enumerated value.
     * \param v value to return string of
     */
    static
    c_string
    label(enum join_style v);
  };

/*! @} */
}
