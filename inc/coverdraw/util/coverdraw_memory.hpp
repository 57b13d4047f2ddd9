/*!
 * \file coverdraw_memory.hpp
 * \brief file coverdraw_memory.hpp
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

#include <cstddef>

/*!\addtogroup Utility
 * @{
 */

/*!\def COVERDRAWnew
 * Allocates an object with placement new on coverdraw's allocator.
 * When the library is built with COVERDRAW_DEBUG each allocation
 * records its file and line, and allocations never released with
 * COVERDRAWdelete are listed on std::cerr at exit. Arrays must not
 * be allocated with COVERDRAWnew.
 */
#define COVERDRAWnew \
  ::new(__FILE__, __LINE__)

/*!\def COVERDRAWdelete
 * Destroys and releases an object made with \ref COVERDRAWnew;
 * debug builds report pointers that were never allocated.
 * \param ptr pointer returned by COVERDRAWnew
 */
#define COVERDRAWdelete(ptr) \
  do {                                                                  \
    coverdraw::memory::check_object_exists(ptr, __FILE__, __LINE__);    \
    coverdraw::memory::call_dtor(ptr);                                  \
    coverdraw::memory::free_implement(ptr, __FILE__, __LINE__);         \
  } while(0)

/*!\def COVERDRAWmalloc
 * Raw allocation, tracked like \ref COVERDRAWnew; a size of
 * zero gives nullptr. Release with \ref COVERDRAWfree.
 */
#define COVERDRAWmalloc(size) \
  coverdraw::memory::malloc_implement(size, __FILE__, __LINE__)

/*!\def COVERDRAWfree
 * Releases memory from \ref COVERDRAWmalloc.
 * \param ptr pointer to release, may be nullptr
 */
#define COVERDRAWfree(ptr) \
  coverdraw::memory::free_implement(ptr, __FILE__, __LINE__)

/*! @} */

/* allocation functions behind COVERDRAWnew, throws std::bad_alloc */
void*
operator new(std::size_t n, const char *file, int line);

void
operator delete(void *ptr, const char *file, int line) throw();

namespace coverdraw
{
  /* the functions below back the allocation macros and
   * are not called directly
   */
  namespace memory
  {
    void
    check_object_exists(const void *ptr, const char *file, int line);

    template<typename T>
    void
    call_dtor(T *p)
    {
      p->~T();
    }

    void*
    malloc_implement(std::size_t size, const char *file, int line);

    void
    free_implement(void *ptr, const char *file, int line);
  }
}
