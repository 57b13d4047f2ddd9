/*!
 * \file util.hpp
 * \brief file util.hpp
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

#include <stdint.h>
#include <stddef.h>

namespace coverdraw
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * Conveniance typedef for a C-style string.
   */
  typedef const char *c_string;

  /*!
   * Enumeration for simple return codes for functions
   * for success or failure.
   */
  enum return_code
    {
      /*!
       * Routine failed
       */
      routine_fail,

      /*!
       * Routine suceeded
       */
      routine_success
    };

  /*!
   * Returns a float pack into a 32-bit unsigned integer.
   * \param f value to pack
   */
  inline
  uint32_t
  pack_float(float f)
  {
    // casting to const char* first
    // prevents from breaking stricting
    // aliasing rules
    const char *q;
    q = reinterpret_cast<const char *>(&f);
    return *reinterpret_cast<const uint32_t*>(q);
  }

  /*!
   * A class reprenting the STL range
   * [m_begin, m_end).
   */
  template<typename T>
  class range_type
  {
  public:
    /*!
     * Ctor.
     * \param b value with which to initialize m_begin
     * \param e value with which to initialize m_end
     */
    range_type(T b, T e):
      m_begin(b),
      m_end(e)
    {}

    /*!
     * Empty ctor, m_begin and m_end are uninitialized.
     */
    range_type(void)
    {}

    /*!
     * Iterator to first element
     */
    T m_begin;

    /*!
     * iterator to one past the last element
     */
    T m_end;

    /*!
     * Provided as a conveniance, equivalent to
     * \code
     * m_end - m_begin
     * \endcode
     */
    T
    difference(void) const
    {
      return m_end - m_begin;
    }
  };

  /*!
   * Class for which copy ctor and assignment operator
   * are private functions.
   */
  class noncopyable
  {
  public:
    noncopyable(void)
    {}

  private:
    noncopyable(const noncopyable &obj);

    noncopyable&
    operator=(const noncopyable &rhs);
  };

  /*!
   * Private function used by macro COVERDRAWassert, do NOT call.
   */
  void
  assert_fail(c_string str, c_string file, int line);

  /*!
   * Private function used by macro COVERDRAWrequire, do NOT call.
   * Emits the failure to coverdraw::log() and then throws
   * std::invalid_argument.
   */
  void
  precondition_fail(c_string condition, c_string message,
                    c_string file, int line);

/*! @} */
}

/*!\addtogroup Utility
 * @{
 */

/*!\def COVERDRAWassert
 * If COVERDRAW_DEBUG is defined, checks if the statement
 * is true and if it is not true prints to std::cerr and
 * then aborts. If COVERDRAW_DEBUG is not defined, then
 * macro is empty (and thus the condition is not evaluated).
 */
#ifdef COVERDRAW_DEBUG
#define COVERDRAWassert(X) do {                                  \
    if (!(X)) {                                                 \
      coverdraw::assert_fail("Assertion '" #X "' failed", __FILE__, __LINE__); \
    } } while(0)
#else
#define COVERDRAWassert(X)
#endif

/*!\def COVERDRAWrequire
 * Checks a precondition on values handed to the library;
 * the check is made in all builds. On failure the condition,
 * message, file and line are sent to coverdraw::log() and
 * std::invalid_argument is thrown.
 * \param X condition that must hold
 * \param M message (a C-string) describing the requirement
 */
#define COVERDRAWrequire(X, M) do {                              \
    if (!(X)) {                                                 \
      coverdraw::precondition_fail(#X, M, __FILE__, __LINE__);   \
    } } while(0)

/*!\def COVERDRAWstatic_assert
 * Conveniance for using static_assert where message
 * is the condition itself.
 */
#define COVERDRAWstatic_assert(X) static_assert(X, #X)

/*!\def COVERDRAWunused
 * Macro to stop the compiler from reporting
 * an argument as unused. Typically used on
 * those arguments used in assert invocation
 * but otherwise unused.
 * \param X expression of which to ignore the value
 */
#define COVERDRAWunused(X) do { (void)(X); } while(0)

/*! @} */
