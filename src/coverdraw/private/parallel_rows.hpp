/*!
 * \file parallel_rows.hpp
 * \brief file parallel_rows.hpp
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

#include <functional>
#include <coverdraw/util/util.hpp>

namespace coverdraw
{
  namespace detail
  {
    /*!
     * Returns the number of workers to use for a requested
     * thread count; a request of 0 means one worker per
     * hardware thread.
     */
    unsigned int
    effective_number_workers(unsigned int requested);

    /*!
     * Runs a functor on each row of [begin_row, end_row). Rows
     * are handed out one at a time through an atomic counter
     * to number_workers - 1 spawned threads and to the calling
     * thread; returns only once every row is processed. The
     * functor is passed the row and the index of the worker,
     * a value in [0, number_workers), so that a caller can keep
     * per-worker scratch. If a functor throws, the first
     * exception is rethrown on the calling thread after all
     * workers are joined.
     */
    void
    run_rows(unsigned int number_workers, int begin_row, int end_row,
             const std::function<void (int row, unsigned int worker)> &f);
  }
}
