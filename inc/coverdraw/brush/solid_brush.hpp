/*!
 * \file solid_brush.hpp
 * \brief file solid_brush.hpp
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

#include <coverdraw/brush/brush.hpp>

namespace coverdraw
{
/*!\addtogroup Brushes
 * @{
 */

  /*!
   * \brief
   * A SolidBrush draws a single color.
   */
  class SolidBrush:public Brush
  {
  public:
    /*!
     * Ctor.
     * \param color linear RGBA color of the brush
     */
    explicit
    SolidBrush(const vec4 &color);

    /*!
     * Returns the color of the brush.
     */
    const vec4&
    color(void) const
    {
      return m_color;
    }

    virtual
    reference_counted_ptr<BrushApplicator>
    create_applicator(const GraphicsOptions &options, ImageFrame &frame,
                      const IRect &region,
                      const reference_counted_ptr<ScratchAllocator> &allocator
                      = ScratchAllocator::default_allocator()) const;

  private:
    vec4 m_color;
  };

/*! @} */
}
