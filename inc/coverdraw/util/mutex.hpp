/*!
 * \file mutex.hpp
 * \brief file mutex.hpp
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

#include <mutex>
#include <coverdraw/util/util.hpp>

namespace coverdraw
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * Non-recursive mutex guarding the state coverdraw shares
   * between threads: the scratch pool of a BrushApplicator,
   * a GlyphCache and the FreeType objects.
   */
  class Mutex:noncopyable
  {
  public:
    /*!
     * \brief
     * Scoped lock, the mutex is held for the lifetime
     * of the Guard.
     */
    class Guard:noncopyable
    {
    public:
      /*!
       * Ctor, blocks until m is locked.
       * \param m mutex to lock
       */
      explicit
      Guard(Mutex &m):
        m_lock(m.m_mutex)
      {}

    private:
      std::lock_guard<std::mutex> m_lock;
    };

    Mutex(void)
    {}

  private:
    std::mutex m_mutex;
  };

/*! @} */
}
