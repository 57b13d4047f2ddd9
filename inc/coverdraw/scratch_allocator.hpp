/*!
 * \file scratch_allocator.hpp
 * \brief file scratch_allocator.hpp
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

#include <new>
#include <stddef.h>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/c_array.hpp>
#include <coverdraw/util/reference_counted.hpp>

namespace coverdraw
{
/*!\addtogroup Raster
 * @{
 */

  /*!
   * \brief
   * A ScratchAllocator provides the memory of coverage maps
   * and of the per-thread scratch buffers used when blending.
   * Implementations must be thread safe.
   */
  class ScratchAllocator:
    public reference_counted<ScratchAllocator>::concurrent
  {
  public:
    virtual
    ~ScratchAllocator()
    {}

    /*!
     * To be implemented by a derived class to allocate
     * a block of memory suitably aligned for any scalar
     * type; returns nullptr on failure.
     * \param bytes number of bytes to allocate, never 0
     */
    virtual
    void*
    allocate_bytes(size_t bytes) = 0;

    /*!
     * To be implemented by a derived class to release
     * a block returned by allocate_bytes().
     * \param p block to release
     */
    virtual
    void
    deallocate_bytes(void *p) = 0;

    /*!
     * Returns the allocator used when none is specified;
     * it allocates with \ref COVERDRAWmalloc.
     */
    static
    const reference_counted_ptr<ScratchAllocator>&
    default_allocator(void);
  };

  /*!
   * \brief
   * A ScratchBuffer is an array of values whose memory
   * comes from a ScratchAllocator. The type T must be
   * a type that does not require construction or
   * destruction, i.e. a float or a vecN of floats.
   */
  template<typename T>
  class ScratchBuffer:noncopyable
  {
  public:
    /*!
     * Ctor. Throws std::bad_alloc if the allocator fails.
     * \param allocator allocator from which to take memory
     * \param count number of elements
     * \param value value to which to set each element
     */
    ScratchBuffer(const reference_counted_ptr<ScratchAllocator> &allocator,
                  size_t count, const T &value = T()):
      m_allocator(allocator)
    {
      if (count > 0)
        {
          void *p;

          p = m_allocator->allocate_bytes(count * sizeof(T));
          if (!p)
            {
              throw std::bad_alloc();
            }
          m_data = c_array<T>(static_cast<T*>(p), count);
          for (T &v : m_data)
            {
              v = value;
            }
        }
    }

    ~ScratchBuffer()
    {
      if (m_data.c_ptr())
        {
          m_allocator->deallocate_bytes(m_data.c_ptr());
        }
    }

    /*!
     * Returns the elements of the buffer.
     */
    c_array<T>
    data(void)
    {
      return m_data;
    }

    /*!
     * Returns the elements of the buffer.
     */
    c_array<const T>
    data(void) const
    {
      return m_data;
    }

    /*!
     * Returns the number of elements.
     */
    size_t
    size(void) const
    {
      return m_data.size();
    }

  private:
    reference_counted_ptr<ScratchAllocator> m_allocator;
    c_array<T> m_data;
  };

/*! @} */
}
