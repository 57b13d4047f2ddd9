/*!
 * \file reference_counted.hpp
 * \brief file reference_counted.hpp
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

#include <atomic>
#include <utility>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/coverdraw_memory.hpp>

namespace coverdraw
{

/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * Intrusive smart pointer. T provides the static functions
   * T::add_reference(const T*) and T::remove_reference(const T*),
   * the latter deleting the object once no references remain.
   * Classes get these by deriving from reference_counted<T>::concurrent
   * or reference_counted<T>::non_concurrent.
   */
  template<typename T>
  class reference_counted_ptr
  {
  private:
    typedef void (reference_counted_ptr::*unspecified_bool_type)(void) const;

    void
    fake_function(void) const
    {}

    void
    acquire(void)
    {
      if (m_p)
        {
          T::add_reference(m_p);
        }
    }

  public:
    reference_counted_ptr(void):
      m_p(nullptr)
    {}

    /*!
     * Takes a reference to p, p may be nullptr.
     */
    reference_counted_ptr(T *p):
      m_p(p)
    {
      acquire();
    }

    reference_counted_ptr(const reference_counted_ptr &obj):
      m_p(obj.m_p)
    {
      acquire();
    }

    /*!
     * Conversion from a pointer to a type U where U*
     * converts implicitly to T*.
     */
    template<typename U>
    reference_counted_ptr(const reference_counted_ptr<U> &obj):
      m_p(obj.get())
    {
      acquire();
    }

    reference_counted_ptr(reference_counted_ptr &&obj):
      m_p(obj.m_p)
    {
      obj.m_p = nullptr;
    }

    ~reference_counted_ptr()
    {
      clear();
    }

    reference_counted_ptr&
    operator=(const reference_counted_ptr &rhs)
    {
      reference_counted_ptr(rhs).swap(*this);
      return *this;
    }

    reference_counted_ptr&
    operator=(reference_counted_ptr &&rhs)
    {
      reference_counted_ptr(std::move(rhs)).swap(*this);
      return *this;
    }

    template<typename U>
    reference_counted_ptr&
    operator=(const reference_counted_ptr<U> &rhs)
    {
      reference_counted_ptr(rhs).swap(*this);
      return *this;
    }

    T*
    get(void) const
    {
      return m_p;
    }

    T&
    operator*(void) const
    {
      COVERDRAWassert(m_p);
      return *m_p;
    }

    T*
    operator->(void) const
    {
      COVERDRAWassert(m_p);
      return m_p;
    }

    /*!
     * Exchanges the pointers, reference counts are unchanged.
     */
    void
    swap(reference_counted_ptr &rhs)
    {
      std::swap(m_p, rhs.m_p);
    }

    /*!
     * True when not nullptr.
     */
    operator unspecified_bool_type() const
    {
      return m_p ? &reference_counted_ptr::fake_function : 0;
    }

    template<typename U>
    bool
    operator==(U *rhs) const
    {
      return m_p == rhs;
    }

    template<typename U>
    bool
    operator!=(U *rhs) const
    {
      return m_p != rhs;
    }

    template<typename U>
    bool
    operator==(const reference_counted_ptr<U> &rhs) const
    {
      return m_p == rhs.get();
    }

    template<typename U>
    bool
    operator!=(const reference_counted_ptr<U> &rhs) const
    {
      return m_p != rhs.get();
    }

    /*!
     * Orders by address, for use as a key of std::map.
     */
    bool
    operator<(const reference_counted_ptr &rhs) const
    {
      return m_p < rhs.m_p;
    }

    /*!
     * Drops the reference and becomes nullptr.
     */
    void
    clear(void)
    {
      if (m_p)
        {
          T *p(m_p);
          m_p = nullptr;
          T::remove_reference(p);
        }
    }

    template<typename U>
    reference_counted_ptr<U>
    static_cast_ptr(void) const
    {
      return static_cast<U*>(m_p);
    }

    template<typename U>
    reference_counted_ptr<U>
    dynamic_cast_ptr(void) const
    {
      return dynamic_cast<U*>(m_p);
    }

  private:
    T *m_p;
  };

  template<typename T>
  inline
  void
  swap(reference_counted_ptr<T> &lhs, reference_counted_ptr<T> &rhs)
  {
    lhs.swap(rhs);
  }

  /*!
   * \brief
   * Base class providing the reference counting functions
   * reference_counted_ptr needs; the object is released
   * with \ref COVERDRAWdelete once the count drops to zero.
   * \tparam T the derived type
   * \tparam Counter provides add_reference() and a
   *                 remove_reference() returning true
   *                 when the count reaches zero
   */
  template<typename T, typename Counter>
  class reference_counted_base:noncopyable
  {
  public:
    virtual
    ~reference_counted_base()
    {}

    static
    void
    add_reference(const reference_counted_base *p)
    {
      COVERDRAWassert(p);
      p->m_counter.add_reference();
    }

    static
    void
    remove_reference(const reference_counted_base *p)
    {
      COVERDRAWassert(p);
      if (p->m_counter.remove_reference())
        {
          reference_counted_base *q;
          q = const_cast<reference_counted_base*>(p);
          COVERDRAWdelete(q);
        }
    }

  private:
    mutable Counter m_counter;
  };

  /*!
   * \brief
   * Counter for objects only referenced from one thread,
   * such as the paths and pens a Canvas user builds.
   */
  class reference_count_non_concurrent:noncopyable
  {
  public:
    reference_count_non_concurrent(void):
      m_count(0)
    {}

    void
    add_reference(void)
    {
      ++m_count;
    }

    bool
    remove_reference(void)
    {
      COVERDRAWassert(m_count > 0);
      return --m_count == 0;
    }

  private:
    int m_count;
  };

  /*!
   * \brief
   * Counter for objects shared across threads, such as
   * brushes and coverage maps read by the compositor workers.
   */
  class reference_count_atomic:noncopyable
  {
  public:
    reference_count_atomic(void):
      m_count(0)
    {}

    void
    add_reference(void)
    {
      m_count.fetch_add(1, std::memory_order_relaxed);
    }

    bool
    remove_reference(void)
    {
      if (m_count.fetch_sub(1, std::memory_order_release) == 1)
        {
          std::atomic_thread_fence(std::memory_order_acquire);
          return true;
        }
      return false;
    }

  private:
    std::atomic<int> m_count;
  };

  /*!
   * \brief
   * Names the two reference counted bases of a type T.
   */
  template<typename T>
  class reference_counted
  {
  public:
    /*! not thread safe */
    typedef reference_counted_base<T, reference_count_non_concurrent> non_concurrent;

    /*! thread safe, counts with std::atomic */
    typedef reference_counted_base<T, reference_count_atomic> concurrent;
  };

/*! @} */
} //namespace coverdraw
