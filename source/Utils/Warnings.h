//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Warnings_h
#define hindsight_Warnings_h

#include "MPIUtilities.h"

namespace hindsight
{
namespace Warnings
{
enum Debug_level { SILENT, WARNINGS, MEMORY, SYNC, LEARNERS };

static constexpr Debug_level level = WARNINGS;
//static constexpr Debug_level level = MEMORY;
//static constexpr Debug_level level = SYNC;

void print_warning(const char * funcname, const char * filename,
                   int line, const char * fmt, ...);

#define    die(format)      do {                                               \
  using namespace hindsight::Warnings;                                         \
  print_warning(__func__, __FILE__, __LINE__, format);                         \
  MPI_Abort(MPI_COMM_WORLD, 1); } while(0)

#define   _die(format, ...) do {                                               \
  using namespace hindsight::Warnings;                                         \
  print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);          \
  MPI_Abort(MPI_COMM_WORLD, 1); } while(0)

#define   warn(format)  do { \
  if(hindsight::Warnings::level >= hindsight::Warnings::WARNINGS) {            \
    using namespace hindsight::Warnings;                                       \
    print_warning(__func__, __FILE__, __LINE__, format);                       \
  } } while(0)

#define  _warn(format, ...)  do { \
  if(hindsight::Warnings::level >= hindsight::Warnings::WARNINGS) {            \
    using namespace hindsight::Warnings;                                       \
    print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);        \
  } } while(0)

#define debugM(format, ...)  do { \
  if(hindsight::Warnings::level == hindsight::Warnings::MEMORY) {              \
    using namespace hindsight::Warnings;                                       \
    print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);        \
  } } while(0)

#define debugS(format, ...)  do { \
  if(hindsight::Warnings::level == hindsight::Warnings::SYNC) {                \
    using namespace hindsight::Warnings;                                       \
    print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);        \
  } } while(0)

#define debugL(format, ...)  do { \
  if(hindsight::Warnings::level == hindsight::Warnings::LEARNERS) {            \
    using namespace hindsight::Warnings;                                       \
    print_warning(__func__, __FILE__, __LINE__, format, ##__VA_ARGS__);        \
  } } while(0)

} // end namespace Warnings

} // end namespace hindsight
#endif // hindsight_Warnings_h
