//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Utils/Warnings.h"
#include "Utils/Errors.h"
#include "Settings.h"

#include <omp.h>
#include <cstdio>

namespace hindsight
{

Settings::Settings() {  }

DistributionInfo::DistributionInfo(int argc, char** argv) : bOwnsMPI(true)
{
  MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, & threadSafety);
  MPI_Comm_set_errhandler(MPI_COMM_WORLD, MPI_ERRORS_RETURN);
  if (threadSafety < MPI_THREAD_FUNNELED)
    die("The MPI implementation does not have required thread support");
  setupCommunicators(MPI_COMM_WORLD);
}

DistributionInfo::DistributionInfo(const MPI_Comm initialComm)
{
  MPI_Query_thread(& threadSafety);
  setupCommunicators(initialComm);
}

void DistributionInfo::setupCommunicators(const MPI_Comm initialComm)
{
  world_size = MPICommSize(initialComm);
  world_rank = MPICommRank(initialComm);
  learners_train_comm = MPICommDup(initialComm);
  MPI_Comm_set_errhandler(learners_train_comm, MPI_ERRORS_RETURN);
  bIsCoordinator = MPICommRank(learners_train_comm) == 0;
}

DistributionInfo::~DistributionInfo()
{
  if(MPI_COMM_NULL not_eq learners_train_comm)
          MPI_Comm_free(& learners_train_comm);
  if(bOwnsMPI) MPI_Finalize();
}

void DistributionInfo::initialzePRNG()
{
  if(nThreads<1) throw InvalidConfigurationError("nThreads<1");
  omp_set_num_threads(nThreads);
  if(randSeed == 0)
  {
    std::random_device rdev; const Uint rdSeed = rdev();
    randSeed = rdSeed % std::numeric_limits<Uint>::max();
    MPI(Bcast, &randSeed, 1, MPI_UNSIGNED, 0, learners_train_comm);
    if(bIsCoordinator) printf("Using seed %u\n", randSeed);
  }
  // replicas explore differently, networks are made identical by the learner
  generator.seed(randSeed + world_rank);
}

void Settings::check()
{
  if(replayStrategy not_eq "future" and replayStrategy not_eq "final" and
     replayStrategy not_eq "none")
    throw InvalidConfigurationError("unknown replayStrategy " + replayStrategy);
  if(replayK<0)            throw InvalidConfigurationError("replayK<0");
  if(maxTimesteps<1)       throw InvalidConfigurationError("maxTimesteps<1");
  if(bufferSize<maxTimesteps)
    throw InvalidConfigurationError("bufferSize smaller than one episode");
  if(goalDim<1)            throw InvalidConfigurationError("goalDim<1");
  if(distThreshold<=0)     throw InvalidConfigurationError("distThreshold<=0");
  if(batchSize<1)          throw InvalidConfigurationError("batchSize<1");
  if(nRolloutsPerWorker<1) throw InvalidConfigurationError("nRolloutsPerWorker<1");
  if(gamma<0 or gamma>=1)  throw InvalidConfigurationError("gamma not in [0,1)");
  if(polyak<0 or polyak>1) throw InvalidConfigurationError("polyak not in [0,1]");
  if(learnrateActor<0)     throw InvalidConfigurationError("learnrateActor<0");
  if(learnrateCritic<0)    throw InvalidConfigurationError("learnrateCritic<0");
  if(actionL2<0)           throw InvalidConfigurationError("actionL2<0");
  if(noiseEps<0)           throw InvalidConfigurationError("noiseEps<0");
  if(randomEps<0 or randomEps>1)
    throw InvalidConfigurationError("randomEps not in [0,1]");
  if(clipObs<=0)           throw InvalidConfigurationError("clipObs<=0");
  if(clipRange<=0)         throw InvalidConfigurationError("clipRange<=0");
  if(normEps<=0)           throw InvalidConfigurationError("normEps<=0");
  for(const Uint size : nnLayerSizes)
    if(size<1) throw InvalidConfigurationError("empty layer in nnLayerSizes");

  if(bufferSize % maxTimesteps not_eq 0)
    _warn("bufferSize %u is not a multiple of maxTimesteps %u: the last "
      "%u transitions are never used.", bufferSize, maxTimesteps,
      bufferSize % maxTimesteps);
}

} // end namespace hindsight
