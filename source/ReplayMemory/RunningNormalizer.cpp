//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "RunningNormalizer.h"
#include "../Utils/Errors.h"
#include "../Utils/FunctionUtilties.h"
#include "../Utils/Warnings.h"

#include <algorithm>
#include <string>

namespace hindsight
{

RunningNormalizer::RunningNormalizer(const Uint dim, const Real clip,
  const Real varEps, const MPI_Comm C) : size(dim), clipRange(clip),
  eps(varEps), comm(MPICommDup(C))
{
  if(size == 0) throw InvalidConfigurationError("normalizer of size 0");
  if(eps <= 0) throw InvalidConfigurationError("normalizer eps <= 0");
  if(clipRange <= 0) throw InvalidConfigurationError("normalizer clip <= 0");
}

RunningNormalizer::~RunningNormalizer()
{
  if(comm not_eq MPI_COMM_NULL) {
    MPI_Comm tmp = comm;
    MPI_Comm_free(&tmp);
  }
}

void RunningNormalizer::update(const Rvec& samples)
{
  if(samples.size() % size not_eq 0)
    throw ShapeMismatchError("normalizer of size " + std::to_string(size)
      + " received " + std::to_string(samples.size()) + " values");
  const Uint nSamples = samples.size() / size;
  for(Uint i=0; i<nSamples; ++i)
    for(Uint j=0; j<size; ++j) {
      const long double x = samples[i*size + j];
      localSum[j] += x;
      localSumSq[j] += x*x;
    }
  localCount += nSamples;
}

void RunningNormalizer::recomputeStats()
{
  // [sum, sumsq, count] packed to reduce all with one call
  LDvec buf(2*size + 1);
  std::copy(localSum.begin(),   localSum.end(),   buf.begin());
  std::copy(localSumSq.begin(), localSumSq.end(), buf.begin() + size);
  buf[2*size] = localCount;

  if(nWorkers > 1)
    MPI(Allreduce, MPI_IN_PLACE, buf.data(), 2*size+1, MPI_LONG_DOUBLE,
        MPI_SUM, comm);

  for(Uint j=0; j<size; ++j) {
    totalSum[j] += buf[j];
    totalSumSq[j] += buf[size + j];
  }
  totalCount += buf[2*size];
  std::fill(localSum.begin(), localSum.end(), 0);
  std::fill(localSumSq.begin(), localSumSq.end(), 0);
  localCount = 0;

  if(totalCount < 1) return; // nothing seen yet: mean 0 and std 1

  for(Uint j=0; j<size; ++j) {
    const long double mu = totalSum[j] / totalCount;
    const long double var = totalSumSq[j] / totalCount - mu*mu;
    mean[j] = mu;
    stdev[j] = std::sqrt(std::max((long double) eps, var));
  }
  debugM("normalizer stats from %Lg samples: mean[0]=%f std[0]=%f",
    totalCount, mean[0], stdev[0]);
}

Rvec RunningNormalizer::normalize(const Rvec& x) const
{
  if(x.size() % size not_eq 0)
    throw ShapeMismatchError("normalizer of size " + std::to_string(size)
      + " asked to normalize " + std::to_string(x.size()) + " values");
  Rvec ret(x.size());
  for(Uint i=0; i<x.size(); ++i) {
    const Uint j = i % size;
    const Real y = (x[i] - mean[j]) / stdev[j];
    ret[i] = Utilities::clip(y, clipRange, -clipRange);
  }
  return ret;
}

void RunningNormalizer::save(FILE * const wFile) const
{
  fwrite(mean.data(),  sizeof(Real), size, wFile);
  fwrite(stdev.data(), sizeof(Real), size, wFile);
}

void RunningNormalizer::restart(FILE * const rFile)
{
  const size_t nMean = fread(mean.data(),  sizeof(Real), size, rFile);
  const size_t nStd  = fread(stdev.data(), sizeof(Real), size, rFile);
  if(nMean not_eq size or nStd not_eq size)
    throw std::runtime_error("truncated normalizer restart file");
}

} // end namespace hindsight
