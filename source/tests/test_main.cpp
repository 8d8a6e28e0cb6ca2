//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include <gtest/gtest.h>
#include <mpi.h>

// Tests run on any number of MPI processes. Collectives are exercised when
// launched with mpirun -n 2 or more.
int main(int argc, char** argv)
{
  int provided;
  MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
  MPI_Comm_set_errhandler(MPI_COMM_WORLD, MPI_ERRORS_RETURN);
  ::testing::InitGoogleTest(&argc, argv);

  int rank;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  if(rank not_eq 0) {
    ::testing::TestEventListeners& listeners =
      ::testing::UnitTest::GetInstance()->listeners();
    delete listeners.Release(listeners.default_result_printer());
  }

  const int result = RUN_ALL_TESTS();
  // a test failing on a single rank fails the run everywhere
  int globalResult = result;
  MPI_Allreduce(&result, &globalResult, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);
  MPI_Finalize();
  return globalResult;
}
