//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_RunningNormalizer_h
#define hindsight_RunningNormalizer_h

#include "../Utils/Definitions.h"
#include "../Utils/MPIUtilities.h"

#include <cstdio>

namespace hindsight
{

// Online mean and standard deviation of a vector-valued signal.
// Samples are accumulated by update() and only enter the statistics when
// recomputeStats() is called. If constructed with a communicator, the sums
// gathered by every worker since the last recomputeStats() are added
// together, so that all replicas normalize with the same statistics.
class RunningNormalizer
{
 public:
  const Uint size;
  const Real clipRange;
  const Real eps;

 private:
  const MPI_Comm comm;
  const Uint nWorkers = MPICommSize(comm);

  // gathered since last recomputeStats:
  LDvec localSum = LDvec(size, 0), localSumSq = LDvec(size, 0);
  long double localCount = 0;
  // all data that entered the statistics:
  LDvec totalSum = LDvec(size, 0), totalSumSq = LDvec(size, 0);
  long double totalCount = 0;

  Rvec mean = Rvec(size, 0);
  Rvec stdev = Rvec(size, 1);

 public:
  RunningNormalizer(const Uint dim, const Real clip, const Real varEps,
                    const MPI_Comm C = MPI_COMM_NULL);
  ~RunningNormalizer();

  RunningNormalizer(const RunningNormalizer&) = delete;
  RunningNormalizer& operator=(const RunningNormalizer&) = delete;

  // samples is a flat array of nSamples rows of `size` components
  void update(const Rvec& samples);

  // Collective if the normalizer has a communicator with more than one rank.
  void recomputeStats();

  // (x - mean) / std, clipped to [-clipRange, clipRange]. Accepts one or more
  // rows of `size` components.
  Rvec normalize(const Rvec& x) const;

  const Rvec& getMean() const { return mean; }
  const Rvec& getStd() const { return stdev; }
  long double getCount() const { return totalCount; }

  void save(FILE * const wFile) const;
  void restart(FILE * const rFile);
};

} // end namespace hindsight
#endif // hindsight_RunningNormalizer_h
