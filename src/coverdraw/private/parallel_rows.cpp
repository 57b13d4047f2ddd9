/*!
 * \file parallel_rows.cpp
 * \brief file parallel_rows.cpp
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

#include <atomic>
#include <thread>
#include <vector>
#include <exception>
#include <system_error>

#include <coverdraw/util/math.hpp>
#include <coverdraw/util/log.hpp>
#include <private/parallel_rows.hpp>

namespace
{
  class RowQueue:coverdraw::noncopyable
  {
  public:
    RowQueue(int begin_row, int end_row,
             const std::function<void (int, unsigned int)> &f):
      m_next_row(begin_row),
      m_end_row(end_row),
      m_f(f)
    {}

    void
    work(unsigned int worker, std::exception_ptr *out_error);

  private:
    std::atomic<int> m_next_row;
    int m_end_row;
    const std::function<void (int, unsigned int)> &m_f;
  };
}

void
RowQueue::
work(unsigned int worker, std::exception_ptr *out_error)
{
  try
    {
      for (int row = m_next_row.fetch_add(1); row < m_end_row; row = m_next_row.fetch_add(1))
        {
          m_f(row, worker);
        }
    }
  catch (...)
    {
      /* stop handing out rows so the other workers finish
       * quickly; the exception is rethrown by run_rows().
       */
      *out_error = std::current_exception();
      m_next_row.store(m_end_row);
    }
}

unsigned int
coverdraw::detail::
effective_number_workers(unsigned int requested)
{
  if (requested == 0)
    {
      requested = t_max(1u, std::thread::hardware_concurrency());
    }
  return requested;
}

void
coverdraw::detail::
run_rows(unsigned int number_workers, int begin_row, int end_row,
         const std::function<void (int row, unsigned int worker)> &f)
{
  if (begin_row >= end_row)
    {
      return;
    }

  number_workers = t_min(effective_number_workers(number_workers),
                         static_cast<unsigned int>(end_row - begin_row));

  RowQueue queue(begin_row, end_row, f);
  std::vector<std::exception_ptr> errors(number_workers);
  std::vector<std::thread> threads;

  threads.reserve(number_workers - 1);
  for (unsigned int i = 1; i < number_workers; ++i)
    {
      try
        {
          threads.push_back(std::thread(&RowQueue::work, &queue, i, &errors[i]));
        }
      catch (const std::system_error &e)
        {
          COVERDRAWlog_warning("Unable to spawn row worker (" << e.what()
                               << "), continuing with " << threads.size() + 1
                               << " workers");
          break;
        }
    }

  // calling thread helps
  queue.work(0, &errors[0]);

  for (std::thread &t : threads)
    {
      t.join();
    }

  for (const std::exception_ptr &e : errors)
    {
      if (e)
        {
          std::rethrow_exception(e);
        }
    }
}
