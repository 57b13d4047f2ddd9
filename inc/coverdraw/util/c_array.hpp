/*!
 * \file c_array.hpp
 * \brief file c_array.hpp
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

#include <iterator>
#include <vector>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/vecN.hpp>

namespace coverdraw
{

/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * Non-owning view of a contiguous range of T, the way
 * point lists, dash patterns and pixel rows are passed
 * through the coverdraw API. Constness of the view does
 * not make the elements const; use c_array<const T> for
 * read-only access.
 */
template<typename T>
class c_array
{
public:
  typedef T value_type;
  typedef T* pointer;
  typedef T* const_pointer;
  typedef T& reference;
  typedef T& const_reference;
  typedef size_t size_type;
  typedef ptrdiff_t difference_type;
  typedef pointer iterator;
  typedef const_pointer const_iterator;

  c_array(void):
    m_size(0),
    m_ptr(nullptr)
  {}

  /*!
   * View of sz elements starting at pptr.
   */
  template<typename U>
  c_array(U *pptr, size_type sz):
    m_size(sz),
    m_ptr(pptr)
  {
    COVERDRAWstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * View of all N elements of a vecN.
   */
  template<typename U, size_type N>
  c_array(vecN<U, N> &pptr):
    m_size(N),
    m_ptr(pptr.c_ptr())
  {
    COVERDRAWstatic_assert(sizeof(U) == sizeof(T));
  }

  template<typename U, size_type N>
  c_array(const vecN<U, N> &pptr):
    m_size(N),
    m_ptr(pptr.c_ptr())
  {
    COVERDRAWstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * Conversion, typically c_array<T> to c_array<const T>.
   */
  template<typename U>
  c_array(const c_array<U> &obj):
    m_size(obj.m_size),
    m_ptr(obj.m_ptr)
  {
    COVERDRAWstatic_assert(sizeof(U) == sizeof(T));
  }

  T*
  c_ptr(void) const
  {
    return m_ptr;
  }

  /*!
   * Element access, bounds are checked by COVERDRAWassert.
   */
  reference
  operator[](size_type j) const
  {
    COVERDRAWassert(j < m_size);
    return m_ptr[j];
  }

  bool
  empty(void) const
  {
    return m_size == 0;
  }

  size_type
  size(void) const
  {
    return m_size;
  }

  iterator
  begin(void) const
  {
    return m_ptr;
  }

  iterator
  end(void) const
  {
    return m_ptr + static_cast<difference_type>(m_size);
  }

  reference
  front(void) const
  {
    return (*this)[0];
  }

  reference
  back(void) const
  {
    return (*this)[m_size - 1];
  }

  /*!
   * View of elements [pos, pos + length), the range
   * must lie within this view.
   */
  c_array
  sub_array(size_type pos, size_type length) const
  {
    COVERDRAWassert(pos + length <= m_size);
    return c_array(m_ptr + pos, length);
  }

  /*!
   * View of the elements from pos to the end.
   */
  c_array
  sub_array(size_type pos) const
  {
    COVERDRAWassert(pos <= m_size);
    return sub_array(pos, m_size - pos);
  }

private:
  template<typename>
  friend class c_array;

  size_type m_size;
  T *m_ptr;
};

/*!
 * Read-only view of the elements of a std::vector, valid
 * until the vector is resized or destroyed.
 */
template<typename T>
c_array<const T>
make_c_array(const std::vector<T> &p)
{
  return p.empty() ?
    c_array<const T>() :
    c_array<const T>(&p[0], p.size());
}

/*!
 * Writable view of the elements of a std::vector, valid
 * until the vector is resized or destroyed.
 */
template<typename T>
c_array<T>
make_c_array(std::vector<T> &p)
{
  return p.empty() ?
    c_array<T>() :
    c_array<T>(&p[0], p.size());
}

/*! @} */

} //namespace
