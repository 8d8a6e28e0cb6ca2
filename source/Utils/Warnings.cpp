//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Warnings.h"

#include <mutex>
#include <stdarg.h>
#include <cstdio>

namespace hindsight
{
namespace Warnings
{
static std::mutex warn_mutex;

void print_warning(const char * funcname, const char * filename,
                   int line, const char * fmt, ...)
{
  std::lock_guard<std::mutex> wlock(hindsight::Warnings::warn_mutex);
  const auto wrnk = hindsight::MPIworldRank();

  char BUF[512];
  va_list args;
  va_start (args, fmt);
  vsnprintf (BUF, 512, fmt, args);
  va_end (args);

  fprintf(stderr,"Rank %u %s(%s:%d)%s %s\n",
    wrnk, funcname, filename, line, " ", BUF);
  fflush(stdout); fflush(stderr); fflush(0);
}

} // end namespace Warnings

} // end namespace hindsight
