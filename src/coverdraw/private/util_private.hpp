/*!
 * \file util_private.hpp
 * \brief file util_private.hpp
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

#include <algorithm>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/coverdraw_memory.hpp>

/* pimpl accessors: a setter returning *this, optionally
 * checking the value with COVERDRAWrequire first, and a
 * getter reading d->m_<member_name>
 */
#define get_implement(class_name, class_name_private, type_name, member_name) \
  type_name                                                             \
  class_name::                                                          \
  member_name(void) const                                               \
  {                                                                     \
    class_name_private *d;                                              \
    d = static_cast<class_name_private*>(m_d);                          \
    return d->m_##member_name;                                          \
  }

#define set_implement_require(class_name, class_name_private, type_name, member_name, condition, message) \
  class_name&                                                           \
  class_name::                                                          \
  member_name(type_name v)                                              \
  {                                                                     \
    class_name_private *d;                                              \
    COVERDRAWrequire(condition, message);                               \
    d = static_cast<class_name_private*>(m_d);                          \
    d->m_##member_name = v;                                             \
    return *this;                                                       \
  }

#define setget_implement(class_name, class_name_private, type_name, member_name) \
  set_implement_require(class_name, class_name_private, type_name, member_name, true, "") \
  get_implement(class_name, class_name_private, type_name, member_name)

#define setget_implement_require(class_name, class_name_private, type_name, member_name, condition, message) \
  set_implement_require(class_name, class_name_private, type_name, member_name, condition, message) \
  get_implement(class_name, class_name_private, type_name, member_name)

#define copy_ctor(class_name, unscoped_class_name, class_name_private)  \
  class_name::                                                          \
  unscoped_class_name(const unscoped_class_name &obj)                   \
  {                                                                     \
    class_name_private *d;                                              \
    d = static_cast<class_name_private*>(obj.m_d);                      \
    m_d = COVERDRAWnew class_name_private(*d);                          \
  }

#define assign_swap_implement(class_name) \
  void                                    \
  class_name::                            \
  swap(class_name &obj)                   \
  {                                       \
    std::swap(m_d, obj.m_d);              \
  }                                       \
  class_name&                             \
  class_name::                            \
  operator=(const class_name &rhs)        \
  {                                       \
    if (this != &rhs)                     \
      {                                   \
        class_name v(rhs);                \
        swap(v);                          \
      }                                   \
    return *this;                         \
  }
