/*!
 * \file scratch_allocator.cpp
 * \brief file scratch_allocator.cpp
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

#include <coverdraw/scratch_allocator.hpp>
#include <coverdraw/util/coverdraw_memory.hpp>

namespace
{
  class MallocScratchAllocator:public coverdraw::ScratchAllocator
  {
  public:
    virtual
    void*
    allocate_bytes(size_t bytes)
    {
      return COVERDRAWmalloc(bytes);
    }

    virtual
    void
    deallocate_bytes(void *p)
    {
      COVERDRAWfree(p);
    }
  };
}

const coverdraw::reference_counted_ptr<coverdraw::ScratchAllocator>&
coverdraw::ScratchAllocator::
default_allocator(void)
{
  static reference_counted_ptr<ScratchAllocator> R(COVERDRAWnew MallocScratchAllocator());
  return R;
}
