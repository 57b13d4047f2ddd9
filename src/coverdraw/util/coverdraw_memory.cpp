/*!
 * \file coverdraw_memory.cpp
 * \brief file coverdraw_memory.cpp
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

#include <new>
#include <cstdlib>
#include <iostream>
#include <unordered_map>

#include <coverdraw/util/util.hpp>
#include <coverdraw/util/mutex.hpp>
#include <coverdraw/util/coverdraw_memory.hpp>

#ifdef COVERDRAW_DEBUG

namespace
{
  class AllocationSite
  {
  public:
    const char *m_file;
    int m_line;
    std::size_t m_size;
  };

  /* live allocations of COVERDRAWnew and COVERDRAWmalloc,
   * those still present at exit are reported as leaks
   */
  class AllocationTracker:coverdraw::noncopyable
  {
  public:
    ~AllocationTracker()
    {
      if (!m_live.empty())
        {
          std::cerr << "coverdraw: " << m_live.size() << " allocations leaked\n";
          for (const auto &v : m_live)
            {
              std::cerr << "\t" << v.first << " (" << v.second.m_size
                        << " bytes) from [" << v.second.m_file << ", "
                        << v.second.m_line << "]\n";
            }
          std::cerr << std::flush;
        }
    }

    void
    add(const void *ptr, std::size_t size, const char *file, int line)
    {
      AllocationSite site;

      site.m_file = file;
      site.m_line = line;
      site.m_size = size;

      coverdraw::Mutex::Guard m(m_mutex);
      m_live[ptr] = site;
    }

    bool
    contains(const void *ptr)
    {
      coverdraw::Mutex::Guard m(m_mutex);
      return m_live.find(ptr) != m_live.end();
    }

    bool
    remove(const void *ptr)
    {
      coverdraw::Mutex::Guard m(m_mutex);
      return m_live.erase(ptr) != 0;
    }

  private:
    coverdraw::Mutex m_mutex;
    std::unordered_map<const void*, AllocationSite> m_live;
  };

  AllocationTracker&
  tracker(void)
  {
    static AllocationTracker R;
    return R;
  }

  void
  report_untracked(const void *ptr, const char *file, int line)
  {
    std::cerr << "coverdraw: release of untracked " << ptr
              << " from [" << file << ", " << line << "]\n" << std::flush;
  }
}

#endif

//////////////////////////////////
// coverdraw::memory methods
void
coverdraw::memory::
check_object_exists(const void *ptr, const char *file, int line)
{
  #ifdef COVERDRAW_DEBUG
    {
      if (ptr && !tracker().contains(ptr))
        {
          report_untracked(ptr, file, line);
        }
    }
  #else
    {
      COVERDRAWunused(ptr);
      COVERDRAWunused(file);
      COVERDRAWunused(line);
    }
  #endif
}

void*
coverdraw::memory::
malloc_implement(std::size_t size, const char *file, int line)
{
  void *p;

  if (size == 0)
    {
      return nullptr;
    }

  p = std::malloc(size);
  #ifdef COVERDRAW_DEBUG
    {
      if (p)
        {
          tracker().add(p, size, file, line);
        }
      else
        {
          std::cerr << "coverdraw: allocation of " << size << " bytes from ["
                    << file << ", " << line << "] failed\n" << std::flush;
        }
    }
  #else
    {
      COVERDRAWunused(file);
      COVERDRAWunused(line);
    }
  #endif

  return p;
}

void
coverdraw::memory::
free_implement(void *ptr, const char *file, int line)
{
  #ifdef COVERDRAW_DEBUG
    {
      if (ptr && !tracker().remove(ptr))
        {
          report_untracked(ptr, file, line);
        }
    }
  #else
    {
      COVERDRAWunused(file);
      COVERDRAWunused(line);
    }
  #endif

  std::free(ptr);
}

void*
operator new(std::size_t n, const char *file, int line)
{
  void *p;

  p = coverdraw::memory::malloc_implement(n, file, line);
  if (!p)
    {
      throw std::bad_alloc();
    }
  return p;
}

void
operator delete(void *ptr, const char *file, int line) throw()
{
  coverdraw::memory::free_implement(ptr, file, line);
}
