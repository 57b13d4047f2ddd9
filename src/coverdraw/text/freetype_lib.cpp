/*!
 * \file freetype_lib.cpp
 * \brief file freetype_lib.cpp
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

#include <coverdraw/text/freetype_lib.hpp>
#include <coverdraw/util/log.hpp>
#include <private/util_private.hpp>

namespace
{
  class FreeTypeLibPrivate
  {
  public:
    FreeTypeLibPrivate(void):
      m_lib(nullptr)
    {
      FT_Error error_code;

      error_code = FT_Init_FreeType(&m_lib);
      if (error_code != 0)
        {
          COVERDRAWlog_warning("FreeType initialization failed, error " << error_code
                               << "; fonts will not load");
          m_lib = nullptr;
        }
      else
        {
          FT_Int major, minor, patch;

          FT_Library_Version(m_lib, &major, &minor, &patch);
          COVERDRAWlog_debug("FreeType " << major << "." << minor << "." << patch);
        }
    }

    ~FreeTypeLibPrivate()
    {
      if (m_lib)
        {
          FT_Done_FreeType(m_lib);
        }
    }

    coverdraw::Mutex m_mutex;
    FT_Library m_lib;
  };
}

/////////////////////////////////
// coverdraw::FreeTypeLib methods
coverdraw::FreeTypeLib::
FreeTypeLib(void)
{
  m_d = COVERDRAWnew FreeTypeLibPrivate();
}

coverdraw::FreeTypeLib::
~FreeTypeLib()
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  COVERDRAWdelete(d);
  m_d = nullptr;
}

bool
coverdraw::FreeTypeLib::
valid(void) const
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  return d->m_lib != nullptr;
}

FT_Library
coverdraw::FreeTypeLib::
lib(void)
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  return d->m_lib;
}

coverdraw::Mutex&
coverdraw::FreeTypeLib::
mutex(void)
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  return d->m_mutex;
}
