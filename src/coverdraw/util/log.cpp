/*!
 * \file log.cpp
 * \brief file log.cpp
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

#include <list>
#include <mutex>
#include <string>
#include <ostream>
#include <coverdraw/util/log.hpp>

namespace
{
  class LogCallbackSetPrivate;
  class CallBackPrivate;
  typedef std::list<coverdraw::LogCallbackSet::CallBack*> CallBackList;

  class LogCallbackSetPrivate:public coverdraw::noncopyable
  {
  public:
    explicit
    LogCallbackSetPrivate(coverdraw::c_string label):
      m_label(label ? label : ""),
      m_in_callback_sequence(false)
    {}

    CallBackList::iterator
    insert(coverdraw::LogCallbackSet::CallBack *q);

    void
    erase(CallBackList::iterator iter);

    bool
    has_callbacks(void);

    void
    message(enum coverdraw::LogCallbackSet::level_t level,
            coverdraw::c_string message,
            coverdraw::c_string src_file, int src_line);

    std::string m_label;

  private:
    std::recursive_mutex m_mutex;
    bool m_in_callback_sequence;
    CallBackList m_list;
  };

  class CallBackPrivate:public coverdraw::noncopyable
  {
  public:
    explicit
    CallBackPrivate(LogCallbackSetPrivate *s):
      m_parent(s),
      m_active(true)
    {
      COVERDRAWassert(m_parent);
    }

    CallBackList::iterator m_location;
    LogCallbackSetPrivate *m_parent;
    bool m_active;
  };

  class StreamLoggerPrivate
  {
  public:
    StreamLoggerPrivate(std::ostream &ostr,
                        enum coverdraw::LogCallbackSet::level_t minimum_level):
      m_ostr(ostr),
      m_minimum_level(minimum_level)
    {}

    std::ostream &m_ostr;
    enum coverdraw::LogCallbackSet::level_t m_minimum_level;
  };
}

///////////////////////////////////////
// LogCallbackSetPrivate methods
CallBackList::iterator
LogCallbackSetPrivate::
insert(coverdraw::LogCallbackSet::CallBack *q)
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_list.insert(m_list.end(), q);
}

void
LogCallbackSetPrivate::
erase(CallBackList::iterator iter)
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  m_list.erase(iter);
}

bool
LogCallbackSetPrivate::
has_callbacks(void)
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return !m_list.empty();
}

void
LogCallbackSetPrivate::
message(enum coverdraw::LogCallbackSet::level_t level,
        coverdraw::c_string message,
        coverdraw::c_string src_file, int src_line)
{
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  /* a callback that itself logs would otherwise recurse */
  if (!m_in_callback_sequence)
    {
      m_in_callback_sequence = true;
      for(auto iter = m_list.begin(); iter != m_list.end(); ++iter)
        {
          (*iter)->message(level, message, src_file, src_line);
        }
      m_in_callback_sequence = false;
    }
}

/////////////////////////////////////////////////
// coverdraw::LogCallbackSet::CallBack methods
coverdraw::LogCallbackSet::CallBack::
CallBack(LogCallbackSet *parent)
{
  CallBackPrivate *d;
  LogCallbackSetPrivate *dp;

  COVERDRAWassert(parent);
  dp = static_cast<LogCallbackSetPrivate*>(parent->m_d);

  d = COVERDRAWnew CallBackPrivate(dp);
  d->m_location = dp->insert(this);

  m_d = d;
}

coverdraw::LogCallbackSet::CallBack::
~CallBack()
{
  CallBackPrivate *d;

  d = static_cast<CallBackPrivate*>(m_d);
  if (d->m_active)
    {
      d->m_parent->erase(d->m_location);
    }
  COVERDRAWdelete(d);
}

bool
coverdraw::LogCallbackSet::CallBack::
active(void) const
{
  CallBackPrivate *d;
  d = static_cast<CallBackPrivate*>(m_d);
  return d->m_active;
}

void
coverdraw::LogCallbackSet::CallBack::
active(bool b)
{
  CallBackPrivate *d;
  d = static_cast<CallBackPrivate*>(m_d);

  if (d->m_active == b)
    {
      return;
    }

  d->m_active = b;
  if (b)
    {
      d->m_location = d->m_parent->insert(this);
    }
  else
    {
      d->m_parent->erase(d->m_location);
    }
}

//////////////////////////////////////////////
// coverdraw::LogCallbackSet methods
coverdraw::LogCallbackSet::
LogCallbackSet(c_string label)
{
  m_d = COVERDRAWnew LogCallbackSetPrivate(label);
}

coverdraw::LogCallbackSet::
~LogCallbackSet()
{
  LogCallbackSetPrivate *d;
  d = static_cast<LogCallbackSetPrivate*>(m_d);
  COVERDRAWdelete(d);
}

coverdraw::c_string
coverdraw::LogCallbackSet::
label(void) const
{
  LogCallbackSetPrivate *d;
  d = static_cast<LogCallbackSetPrivate*>(m_d);
  return d->m_label.c_str();
}

bool
coverdraw::LogCallbackSet::
has_callbacks(void) const
{
  LogCallbackSetPrivate *d;
  d = static_cast<LogCallbackSetPrivate*>(m_d);
  return d->has_callbacks();
}

void
coverdraw::LogCallbackSet::
message(enum level_t level, c_string message,
        c_string src_file, int src_line)
{
  LogCallbackSetPrivate *d;
  d = static_cast<LogCallbackSetPrivate*>(m_d);
  d->message(level, message, src_file, src_line);
}

coverdraw::c_string
coverdraw::LogCallbackSet::
label(enum level_t level)
{
#define EASY(X) case X: return #X

  switch(level)
    {
      EASY(debug_level);
      EASY(info_level);
      EASY(warning_level);
      EASY(error_level);
    }

#undef EASY

  return "unknown_level";
}

/////////////////////////////////////////////
// coverdraw::StreamLogger methods
coverdraw::StreamLogger::
StreamLogger(std::ostream &ostr,
             enum LogCallbackSet::level_t minimum_level,
             LogCallbackSet *parent):
  LogCallbackSet::CallBack(parent ? parent : &log())
{
  m_d = COVERDRAWnew StreamLoggerPrivate(ostr, minimum_level);
}

coverdraw::StreamLogger::
~StreamLogger()
{
  StreamLoggerPrivate *d;
  d = static_cast<StreamLoggerPrivate*>(m_d);
  COVERDRAWdelete(d);
}

void
coverdraw::StreamLogger::
message(enum LogCallbackSet::level_t level, c_string message,
        c_string src_file, int src_line)
{
  StreamLoggerPrivate *d;
  d = static_cast<StreamLoggerPrivate*>(m_d);

  if (level < d->m_minimum_level)
    {
      return;
    }

  d->m_ostr << "[" << LogCallbackSet::label(level) << "]["
            << src_file << "," << src_line << "]: "
            << message << "\n";
}

//////////////////////////////////////
// coverdraw::log() implementation
coverdraw::LogCallbackSet&
coverdraw::
log(void)
{
  static LogCallbackSet R("coverdraw");
  return R;
}
