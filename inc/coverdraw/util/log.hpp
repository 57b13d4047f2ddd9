/*!
 * \file log.hpp
 * \brief file log.hpp
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

#include <iosfwd>
#include <sstream>
#include <coverdraw/util/util.hpp>
#include <coverdraw/util/reference_counted.hpp>

namespace coverdraw
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * A LogCallbackSet represents a collection of functors
   * to which messages are sent. The library emits its
   * diagnostics to the set returned by coverdraw::log();
   * when no CallBack is attached to a set, messages sent
   * to it are dropped.
   */
  class LogCallbackSet:noncopyable
  {
  public:
    /*!
     * Enumeration to specify the severity of a message.
     */
    enum level_t
      {
        debug_level,
        info_level,
        warning_level,
        error_level,
      };

    /*!
     * A CallBack is a functor to be called on each message
     * sent to the LogCallbackSet to which it is attached.
     */
    class CallBack:public reference_counted<CallBack>::concurrent
    {
    public:
      /*!
       * Ctor; the CallBack is attached to the parent
       * and is active.
       * \param parent LogCallbackSet on which to attach the object
       */
      explicit
      CallBack(LogCallbackSet *parent);

      virtual
      ~CallBack();

      /*!
       * Set if the CallBack is active.
       */
      void
      active(bool b);

      /*!
       * Returns true if and only if the CallBack is active
       */
      bool
      active(void) const;

      /*!
       * To be implemented by a derived class; called when a message
       * is emitted.
       * \param level severity of the message
       * \param message message emitted.
       * \param src_file file of orignating message
       * \param src_line line number of orignating message
       */
      virtual
      void
      message(enum level_t level, c_string message,
              c_string src_file, int src_line) = 0;

    private:
      void *m_d;
    };

    /*!
     * Ctor.
     * \param label label with which to identify the LogCallbackSet,
     *              string is copied.
     */
    explicit
    LogCallbackSet(c_string label);

    ~LogCallbackSet();

    /*!
     * Return the label passed in the ctor.
     */
    c_string
    label(void) const;

    /*!
     * Returns true if atleast one active CallBack
     * is attached.
     */
    bool
    has_callbacks(void) const;

    /*!
     * Emit a message to each of the active callbacks.
     */
    void
    message(enum level_t level, c_string message,
            c_string src_file, int src_line);

    /*!
     * Returns a string for a level_t value.
     */
    static
    c_string
    label(enum level_t level);

  private:
    void *m_d;
  };

  /*!
   * A StreamLogger is a LogCallbackSet::CallBack that writes
   * each message at or above a severity to a std::ostream.
   */
  class StreamLogger:public LogCallbackSet::CallBack
  {
  public:
    /*!
     * Ctor.
     * \param ostr stream to which to write; the stream must
     *             stay alive for the lifetime of the StreamLogger
     * \param minimum_level messages of lower severity are ignored
     * \param parent LogCallbackSet to which to attach
     */
    explicit
    StreamLogger(std::ostream &ostr,
                 enum LogCallbackSet::level_t minimum_level = LogCallbackSet::info_level,
                 LogCallbackSet *parent = nullptr);

    ~StreamLogger();

    virtual
    void
    message(enum LogCallbackSet::level_t level, c_string message,
            c_string src_file, int src_line);

  private:
    void *m_d;
  };

  /*!
   * Returns the LogCallbackSet to which coverdraw
   * emits its diagnostics.
   */
  LogCallbackSet&
  log(void);

/*! @} */
}

/*!\addtogroup Utility
 * @{
 */

/*!\def COVERDRAWlog
 * Emit a message to coverdraw::log(); the message is formed
 * by streaming X into a std::ostringstream and the stream
 * is only formed if a callback is attached.
 * \param L severity, a value of LogCallbackSet::level_t
 * \param X values to stream, i.e. "count = " << count
 */
#define COVERDRAWlog(L, X) do {                                          \
    if (coverdraw::log().has_callbacks()) {                             \
      std::ostringstream coverdraw_log_str;                             \
      coverdraw_log_str << X;                                           \
      coverdraw::log().message(L, coverdraw_log_str.str().c_str(),      \
                               __FILE__, __LINE__);                     \
    } } while(0)

/*!\def COVERDRAWlog_debug
 * Equivalent to COVERDRAWlog(coverdraw::LogCallbackSet::debug_level, X)
 */
#define COVERDRAWlog_debug(X) COVERDRAWlog(coverdraw::LogCallbackSet::debug_level, X)

/*!\def COVERDRAWlog_info
 * Equivalent to COVERDRAWlog(coverdraw::LogCallbackSet::info_level, X)
 */
#define COVERDRAWlog_info(X) COVERDRAWlog(coverdraw::LogCallbackSet::info_level, X)

/*!\def COVERDRAWlog_warning
 * Equivalent to COVERDRAWlog(coverdraw::LogCallbackSet::warning_level, X)
 */
#define COVERDRAWlog_warning(X) COVERDRAWlog(coverdraw::LogCallbackSet::warning_level, X)

/*! @} */
