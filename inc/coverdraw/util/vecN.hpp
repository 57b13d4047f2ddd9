/*!
 * \file vecN.hpp
 * \brief file vecN.hpp
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

#include <coverdraw/util/util.hpp>
#include <coverdraw/util/math.hpp>

namespace coverdraw
{
/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * vecN is a simple static array class with no virtual
 * functions and no memory overhead. Supports runtim array
 * index checking and STL style iterators via pointer iterators.
 *
 * \param T typename with a constructor that takes no arguments.
 * \param N unsigned integer size of array
 */
template<typename T, size_t N>
class vecN
{
public:
  /*!
   * \brief
   * STL compliant typedef
   */
  typedef T* pointer;

  /*!
   * \brief
   * STL compliant typedef
   */
  typedef const T* const_pointer;

  /*!
   * \brief
   * STL compliant typedef
   */
  typedef T& reference;

  /*!
   * \brief
   * STL compliant typedef
   */
  typedef const T& const_reference;

  /*!
   * \brief
   * STL compliant typedef
   */
  typedef T value_type;

  /*!
   * \brief
   * STL compliant typedef
   */
  typedef size_t size_type;

  /*!
   * \brief
   * iterator typedef to pointer
   */
  typedef pointer iterator;

  /*!
   * \brief
   * iterator typedef to const_pointer
   */
  typedef const_pointer const_iterator;

  /*!
   * Ctor, no intiliaztion on POD types.
   */
  vecN(void)
  {}

  /*!
   * Ctor, sets each element to the passed value.
   * \param value value to which to set each element
   */
  explicit
  vecN(const T &value)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] = value;
      }
  }

  /*!
   * Ctor from a vecN of a different type, each
   * element is converted with a ctor T(S).
   */
  template<typename S>
  explicit
  vecN(const vecN<S, N> &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] = T(obj[i]);
      }
  }

  /*!
   * Ctor for a vecN of size 2.
   * \param px value to which to assign the return value of x().
   * \param py value to which to assign the return value of y().
   */
  vecN(const T &px, const T &py)
  {
    COVERDRAWstatic_assert(N == 2);
    m_data[0] = px;
    m_data[1] = py;
  }

  /*!
   * Ctor for a vecN of size 3.
   * \param px value to which to assign the return value of x().
   * \param py value to which to assign the return value of y().
   * \param pz value to which to assign the return value of z().
   */
  vecN(const T &px, const T &py, const T &pz)
  {
    COVERDRAWstatic_assert(N == 3);
    m_data[0] = px;
    m_data[1] = py;
    m_data[2] = pz;
  }

  /*!
   * Ctor for a vecN of size 4.
   * \param px value to which to assign the return value of x().
   * \param py value to which to assign the return value of y().
   * \param pz value to which to assign the return value of z().
   * \param pw value to which to assign the return value of w().
   */
  vecN(const T &px, const T &py, const T &pz, const T &pw)
  {
    COVERDRAWstatic_assert(N == 4);
    m_data[0] = px;
    m_data[1] = py;
    m_data[2] = pz;
    m_data[3] = pw;
  }

  /*!
   * Returns a C-style pointer to the array.
   */
  T*
  c_ptr(void) { return m_data; }

  /*!
   * Returns a constant C-style pointer to the array.
   */
  const T*
  c_ptr(void) const { return m_data; }

  /*!
   * Return a reference to an element; with COVERDRAW_DEBUG
   * the index is bounds checked.
   * \param j index of element to return.
   */
  reference
  operator[](size_type j)
  {
    COVERDRAWassert(j < N);
    return m_data[j];
  }

  /*!
   * Return a constant refernce to an element; with
   * COVERDRAW_DEBUG the index is bounds checked.
   * \param j index of element to return.
   */
  const_reference
  operator[](size_type j) const
  {
    COVERDRAWassert(j < N);
    return m_data[j];
  }

  /*!
   * Equivalent to operator[](0)
   */
  reference x(void) { return m_data[0]; }

  /*!
   * Equivalent to operator[](1)
   */
  reference y(void) { COVERDRAWstatic_assert(N >= 2); return m_data[1]; }

  /*!
   * Equivalent to operator[](2)
   */
  reference z(void) { COVERDRAWstatic_assert(N >= 3); return m_data[2]; }

  /*!
   * Equivalent to operator[](3)
   */
  reference w(void) { COVERDRAWstatic_assert(N >= 4); return m_data[3]; }

  /*!
   * Equivalent to operator[](0)
   */
  const_reference x(void) const { return m_data[0]; }

  /*!
   * Equivalent to operator[](1)
   */
  const_reference y(void) const { COVERDRAWstatic_assert(N >= 2); return m_data[1]; }

  /*!
   * Equivalent to operator[](2)
   */
  const_reference z(void) const { COVERDRAWstatic_assert(N >= 3); return m_data[2]; }

  /*!
   * Equivalent to operator[](3)
   */
  const_reference w(void) const { COVERDRAWstatic_assert(N >= 4); return m_data[3]; }

  /*!
   * Component-wise negation operator.
   */
  vecN
  operator-(void) const
  {
    vecN retval;
    for(size_type i = 0; i < N; ++i)
      {
        retval[i] = -m_data[i];
      }
    return retval;
  }

  /*!
   * Component-wise addition operator.
   */
  vecN
  operator+(const vecN &obj) const
  {
    vecN retval(*this);
    retval += obj;
    return retval;
  }

  /*!
   * Component-wise subtraction operator.
   */
  vecN
  operator-(const vecN &obj) const
  {
    vecN retval(*this);
    retval -= obj;
    return retval;
  }

  /*!
   * Component-wise multiplication operator.
   */
  vecN
  operator*(const vecN &obj) const
  {
    vecN retval(*this);
    retval *= obj;
    return retval;
  }

  /*!
   * Multiply each element by a scalar.
   */
  vecN
  operator*(const T &value) const
  {
    vecN retval(*this);
    retval *= value;
    return retval;
  }

  /*!
   * Divide each element by a scalar.
   */
  vecN
  operator/(const T &value) const
  {
    vecN retval(*this);
    retval /= value;
    return retval;
  }

  /*!
   * Component-wise addition operator.
   */
  vecN&
  operator+=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] += obj[i];
      }
    return *this;
  }

  /*!
   * Component-wise subtraction operator.
   */
  vecN&
  operator-=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] -= obj[i];
      }
    return *this;
  }

  /*!
   * Component-wise multiplication operator.
   */
  vecN&
  operator*=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] *= obj[i];
      }
    return *this;
  }

  /*!
   * Multiply each element by a scalar.
   */
  vecN&
  operator*=(const T &value)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] *= value;
      }
    return *this;
  }

  /*!
   * Divide each element by a scalar.
   */
  vecN&
  operator/=(const T &value)
  {
    for(size_type i = 0; i < N; ++i)
      {
        m_data[i] /= value;
      }
    return *this;
  }

  /*!
   * Returns true if and only if each element
   * is equal to the matching element of obj.
   */
  bool
  operator==(const vecN &obj) const
  {
    for(size_type i = 0; i < N; ++i)
      {
        if (!(m_data[i] == obj.m_data[i]))
          {
            return false;
          }
      }
    return true;
  }

  /*!
   * Equivalent to !operator==(obj).
   */
  bool
  operator!=(const vecN &obj) const
  {
    return !operator==(obj);
  }

  /*!
   * Lexographical compare, provided so that vecN
   * values can be used as keys of std::map.
   */
  bool
  operator<(const vecN &obj) const
  {
    for(size_type i = 0; i < N; ++i)
      {
        if (m_data[i] < obj.m_data[i])
          {
            return true;
          }
        if (obj.m_data[i] < m_data[i])
          {
            return false;
          }
      }
    return false;
  }

  /*!
   * Returns the dot product with another vecN.
   */
  T
  dot(const vecN &obj) const
  {
    T retval(m_data[0] * obj.m_data[0]);
    for(size_type i = 1; i < N; ++i)
      {
        retval += m_data[i] * obj.m_data[i];
      }
    return retval;
  }

  /*!
   * Returns the dot product with itself.
   */
  T
  magnitudeSq(void) const
  {
    return dot(*this);
  }

  /*!
   * Returns the square root of magnitudeSq().
   */
  T
  magnitude(void) const
  {
    return t_sqrt(magnitudeSq());
  }

  /*!
   * STL compliant size function.
   */
  static
  size_type
  size(void)
  {
    return N;
  }

  /*!
   * STL compliant iterator function.
   */
  iterator
  begin(void) { return m_data; }

  /*!
   * STL compliant iterator function.
   */
  const_iterator
  begin(void) const { return m_data; }

  /*!
   * STL compliant iterator function.
   */
  iterator
  end(void) { return m_data + N; }

  /*!
   * STL compliant iterator function.
   */
  const_iterator
  end(void) const { return m_data + N; }

private:
  T m_data[N];
};

/*!
 * Multiply each element of a vecN by a scalar.
 */
template<typename T, size_t N>
inline
vecN<T, N>
operator*(const T &value, const vecN<T, N> &obj)
{
  return obj * value;
}

/*!
 * Returns the dot product of two vecN values.
 */
template<typename T, size_t N>
inline
T
dot(const vecN<T, N> &a, const vecN<T, N> &b)
{
  return a.dot(b);
}

/*!
 * Returns the z-component of the cross product of two 2D
 * vectors, i.e. a.x() * b.y() - a.y() * b.x().
 */
template<typename T>
inline
T
crossproduct(const vecN<T, 2> &a, const vecN<T, 2> &b)
{
  return a.x() * b.y() - a.y() * b.x();
}

/*!
 * Conveniance typedef to vecN<float, 2>
 */
typedef vecN<float, 2> vec2;

/*!
 * Conveniance typedef to vecN<float, 3>
 */
typedef vecN<float, 3> vec3;

/*!
 * Conveniance typedef to vecN<float, 4>
 */
typedef vecN<float, 4> vec4;

/*!
 * Conveniance typedef to vecN<int, 2>
 */
typedef vecN<int, 2> ivec2;

/*!
 * Conveniance typedef to vecN<uint8_t, 4>
 */
typedef vecN<uint8_t, 4> u8vec4;

/*! @} */
}
