//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_MPIUtilities_h
#define hindsight_MPIUtilities_h

#include <mpi.h>
#include <stdexcept>

namespace hindsight
{

inline MPI_Comm MPICommDup(const MPI_Comm C) {
  if(C == MPI_COMM_NULL) return MPI_COMM_NULL;
  MPI_Comm ret;
  MPI_Comm_dup(C, &ret);
  return ret;
}
inline unsigned MPICommSize(const MPI_Comm C) {
  if(C == MPI_COMM_NULL) return 0;
  int size;
  MPI_Comm_size(C, &size);
  return (unsigned) size;
}
inline unsigned MPICommRank(const MPI_Comm C) {
  if(C == MPI_COMM_NULL) return 0;
  int rank;
  MPI_Comm_rank(C, &rank);
  return (unsigned) rank;
}
inline unsigned MPIworldRank() {
  int initialized = 0;
  MPI_Initialized(&initialized);
  return initialized ? MPICommRank(MPI_COMM_WORLD) : 0;
}

// Every collective goes through this wrapper: MPI error codes are returned
// (communicators use MPI_ERRORS_RETURN) and turned into exceptions here.
#define MPI(NAME, ...)                                   \
do {                                                     \
  const int MPIERR = MPI_ ## NAME ( __VA_ARGS__ );       \
  if(MPIERR not_eq MPI_SUCCESS) {                        \
    _warn("%s %d", #NAME, MPIERR);                       \
    throw std::runtime_error("MPI ERROR in " #NAME);     \
  }                                                      \
} while(0)

} // end namespace hindsight
#endif // hindsight_MPIUtilities_h
