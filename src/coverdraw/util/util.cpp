/*!
 * \file util.cpp
 * \brief file util.cpp
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

#include <string>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <cstdlib>
#ifdef __linux__
#include <execinfo.h>
#include <cxxabi.h>
#endif

#include <coverdraw/util/util.hpp>
#include <coverdraw/util/log.hpp>

namespace
{
#ifdef __linux__
  std::string
  demangled_function_name(const char *backtrace_string)
  {
    if (!backtrace_string)
      {
        return "";
      }

    /* backtrace gives the symbol as follows:
     *  library_name(mangled_function_name+offset) [return_address]
     */
    const char *open_paren, *plus, *end;

    end = backtrace_string + std::strlen(backtrace_string);
    open_paren = std::find(backtrace_string, end, '(');
    if (open_paren == end)
      {
        return "";
      }
    ++open_paren;
    plus = std::find(open_paren, end, '+');
    if (plus == end)
      {
        return "";
      }

    char* demangle_c_string;
    int status;
    std::string tmp(open_paren, plus);

    demangle_c_string = abi::__cxa_demangle(tmp.c_str(),
                                            nullptr,
                                            nullptr,
                                            &status);
    if (demangle_c_string == nullptr)
      {
        return "";
      }

    std::string return_value(demangle_c_string);
    std::free(demangle_c_string);
    return return_value;
  }
#endif
}

void
coverdraw::
assert_fail(c_string str, c_string file, int line)
{
  std::ostringstream ostr;

  ostr << "[" << file << "," << line << "]: " << str << "\n";

  #ifdef __linux__
    {
      #define STACK_MAX_BACKTRACE_SIZE 30
      void *backtrace_data[STACK_MAX_BACKTRACE_SIZE];
      char **backtrace_strings;
      int backtrace_size;

      ostr << "Backtrace:\n";
      backtrace_size = backtrace(backtrace_data, STACK_MAX_BACKTRACE_SIZE);
      backtrace_strings = backtrace_symbols(backtrace_data, backtrace_size);
      if (backtrace_strings)
        {
          for (int i = 0; i < backtrace_size; ++i)
            {
              ostr << "\t" << backtrace_strings[i]
                   << "{" << demangled_function_name(backtrace_strings[i])
                   << "}\n";
            }
          std::free(backtrace_strings);
        }
    }
  #endif

  std::cerr << ostr.str() << std::flush;
  log().message(LogCallbackSet::error_level, ostr.str().c_str(), file, line);

  #ifdef COVERDRAW_DEBUG
    {
      std::abort();
    }
  #endif
}

void
coverdraw::
precondition_fail(c_string condition, c_string message,
                  c_string file, int line)
{
  std::ostringstream ostr;

  ostr << message << " (requirement '" << condition << "' failed)";
  log().message(LogCallbackSet::error_level, ostr.str().c_str(), file, line);
  throw std::invalid_argument(ostr.str());
}
