/*!
 * \file freetype_lib.hpp
 * \brief file freetype_lib.hpp
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

#include <ft2build.h>
#include FT_FREETYPE_H

#include <coverdraw/util/reference_counted.hpp>
#include <coverdraw/util/mutex.hpp>

namespace coverdraw
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * Reference counted owner of an FT_Library.
   *
   * Creating and releasing FT_Face objects must be done with
   * mutex() locked; the glyph loads of one FT_Face are guarded
   * by the FreeTypeFace that owns it instead.
   */
  class FreeTypeLib:public reference_counted<FreeTypeLib>::concurrent
  {
  public:
    /*!
     * Ctor. Initializes FreeType; on failure the error is
     * logged and valid() returns false.
     */
    FreeTypeLib(void);

    ~FreeTypeLib();

    /*!
     * Returns true if FreeType was initialized.
     */
    bool
    valid(void) const;

    /*!
     * Returns the FT_Library, nullptr if !valid().
     */
    FT_Library
    lib(void);

    /*!
     * Mutex to hold while creating or releasing faces
     * from lib().
     */
    Mutex&
    mutex(void);

  private:
    void *m_d;
  };
/*! @} */
}
