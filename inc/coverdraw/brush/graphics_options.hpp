/*!
 * \file graphics_options.hpp
 * \brief file graphics_options.hpp
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
/*!\addtogroup Brushes
 * @{
 */

  /*!
   * \brief
   * GraphicsOptions specify how a brush blends
   * into the destination.
   */
  class GraphicsOptions
  {
  public:
    /*!
     * Ctor, sets blend_percentage() as 1.0.
     */
    GraphicsOptions(void);

    /*!
     * Copy ctor.
     * \param obj value from which to copy
     */
    GraphicsOptions(const GraphicsOptions &obj);

    ~GraphicsOptions();

    /*!
     * Assignment operator.
     * \param rhs value from which to copy
     */
    GraphicsOptions&
    operator=(const GraphicsOptions &rhs);

    /*!
     * Swap operation
     * \param obj object with which to swap
     */
    void
    swap(GraphicsOptions &obj);

    /*!
     * Multiplier applied to coverage before blending;
     * the product is clamped to [0, 1].
     */
    float
    blend_percentage(void) const;

    /*!
     * Set the value returned by blend_percentage(void) const,
     * must be non-negative.
     */
    GraphicsOptions&
    blend_percentage(float v);

  private:
    void *m_d;
  };

/*! @} */
}
