//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Settings_h
#define hindsight_Settings_h

#include "Utils/Definitions.h"
#include "Utils/MPIUtilities.h"

#include <random>
#include <string>

namespace CLI { class App; }

namespace hindsight
{

struct DistributionInfo
{
  // Initializes MPI and owns it: MPI_Finalize is called by the destructor.
  DistributionInfo(int argc, char** argv);
  // Joins an already initialized MPI process group (used by tests).
  DistributionInfo(const MPI_Comm initialComm);
  ~DistributionInfo();

  DistributionInfo(const DistributionInfo&) = delete;
  DistributionInfo& operator=(const DistributionInfo&) = delete;

  void initializeOpts(CLI::App & parser);
  void initialzePRNG();

  Uint world_rank;
  Uint world_size;

  int threadSafety = -1;
  bool bOwnsMPI = false;

  // communicator shared by all the workers that train replicas of the same
  // networks. Every collective of the learner happens on a dup of this comm.
  MPI_Comm learners_train_comm = MPI_COMM_NULL;

  // Assigned once, when the process group is formed: rank 0 of the training
  // communicator. Components receive it explicitly.
  bool bIsCoordinator = false;

  // each worker is a single-threaded process and owns one generator
  mutable std::mt19937 generator;

#define COMMENT_nThreads "Number of OpenMP threads used for element-wise \
parameter updates on each worker."
#define DEFAULT_nThreads 1
  Uint nThreads = DEFAULT_nThreads;

#define COMMENT_randSeed "Random seed. Each worker seeds its generator with \
randSeed + rank. If 0, a seed is drawn from the random device of rank 0."
#define DEFAULT_randSeed 123
  Uint randSeed = DEFAULT_randSeed;

 private:
  void setupCommunicators(const MPI_Comm initialComm);
};

struct Settings
{
  Settings();
  void check();
  void initializeOpts(CLI::App & parser);

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO ENVIRONMENT
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_envName "Goal-conditioned environment. Only 'Reach' (point \
mass moving towards a target position) is built in."
#define DEFAULT_envName "Reach"
  std::string envName = DEFAULT_envName;

#define COMMENT_goalDim "Dimensionality of goal space of the environment."
#define DEFAULT_goalDim 2
  Uint goalDim = DEFAULT_goalDim;

#define COMMENT_distThreshold "Distance between achieved and desired goal \
below which the goal is considered reached."
#define DEFAULT_distThreshold 0.05
  Real distThreshold = DEFAULT_distThreshold;

#define COMMENT_maxTimesteps "Number of actions per episode (T)."
#define DEFAULT_maxTimesteps 50
  Uint maxTimesteps = DEFAULT_maxTimesteps;

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO TRAINING LOOP
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_nEpochs "Number of training epochs. Each epoch ends with an \
evaluation and a checkpoint."
#define DEFAULT_nEpochs 50
  Uint nEpochs = DEFAULT_nEpochs;

#define COMMENT_nCycles "Number of collect-and-train cycles per epoch."
#define DEFAULT_nCycles 50
  Uint nCycles = DEFAULT_nCycles;

#define COMMENT_nBatches "Number of network updates per cycle."
#define DEFAULT_nBatches 40
  Uint nBatches = DEFAULT_nBatches;

#define COMMENT_nRolloutsPerWorker "Number of episodes collected by each \
worker per cycle."
#define DEFAULT_nRolloutsPerWorker 2
  Uint nRolloutsPerWorker = DEFAULT_nRolloutsPerWorker;

#define COMMENT_nTestRollouts "Number of deterministic episodes per worker \
used to estimate the success rate."
#define DEFAULT_nTestRollouts 10
  Uint nTestRollouts = DEFAULT_nTestRollouts;

#define COMMENT_saveDir "Directory where the coordinator writes checkpoints."
#define DEFAULT_saveDir "saved_models"
  std::string saveDir = DEFAULT_saveDir;

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO REPLAY MEMORY
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_bufferSize "Capacity of the replay buffer in transitions. \
The buffer holds bufferSize/maxTimesteps episodes."
#define DEFAULT_bufferSize 1000000
  Uint bufferSize = DEFAULT_bufferSize;

#define COMMENT_replayStrategy "Hindsight goal relabeling strategy. \
Options: 'future', 'final', 'none'."
#define DEFAULT_replayStrategy "future"
  std::string replayStrategy = DEFAULT_replayStrategy;

#define COMMENT_replayK "Ratio between relabeled and original goals. The \
probability of relabeling a sampled transition is 1 - 1/(1+replayK)."
#define DEFAULT_replayK 4
  Real replayK = DEFAULT_replayK;

#define COMMENT_clipObs "Observations and goals are clipped to \
[-clipObs, clipObs] before normalization."
#define DEFAULT_clipObs 200
  Real clipObs = DEFAULT_clipObs;

#define COMMENT_clipRange "Normalized observations and goals are clipped to \
[-clipRange, clipRange]."
#define DEFAULT_clipRange 5
  Real clipRange = DEFAULT_clipRange;

#define COMMENT_normEps "Lower bound of the variance estimated by the \
running normalizers."
#define DEFAULT_normEps 1e-4
  Real normEps = DEFAULT_normEps;

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO LEARNING ALGORITHM
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_batchSize "Network training batch size."
#define DEFAULT_batchSize 256
  Uint batchSize = DEFAULT_batchSize;

#define COMMENT_gamma "Discount factor."
#define DEFAULT_gamma 0.98
  Real gamma = DEFAULT_gamma;

#define COMMENT_polyak "Weight of the old target parameters in the soft \
update: tgt = polyak * tgt + (1 - polyak) * net."
#define DEFAULT_polyak 0.95
  Real polyak = DEFAULT_polyak;

#define COMMENT_learnrateActor "Adam learning rate of the policy network."
#define DEFAULT_learnrateActor 1e-3
  Real learnrateActor = DEFAULT_learnrateActor;

#define COMMENT_learnrateCritic "Adam learning rate of the value network."
#define DEFAULT_learnrateCritic 1e-3
  Real learnrateCritic = DEFAULT_learnrateCritic;

#define COMMENT_actionL2 "Penalization coefficient of the squared scaled \
action in the policy loss."
#define DEFAULT_actionL2 1
  Real actionL2 = DEFAULT_actionL2;

#define COMMENT_noiseEps "Stdev of the Gaussian exploration noise, relative \
to the action bound."
#define DEFAULT_noiseEps 0.2
  Real noiseEps = DEFAULT_noiseEps;

#define COMMENT_randomEps "Probability of replacing the policy action with \
a uniformly random action during data collection."
#define DEFAULT_randomEps 0.3
  Real randomEps = DEFAULT_randomEps;

///////////////////////////////////////////////////////////////////////////////
//SETTINGS PERTAINING TO NETWORK
///////////////////////////////////////////////////////////////////////////////
#define COMMENT_nnLayerSizes "Sizes of hidden layers of both the policy and \
the value networks. E.g. '256 256 256'."
#define DEFAULT_nnLayerSizes std::vector<Uint>({256, 256, 256})
  std::vector<Uint> nnLayerSizes = DEFAULT_nnLayerSizes;

#define COMMENT_nnFunc "Activation function of hidden layers."
#define DEFAULT_nnFunc "Relu"
  std::string nnFunc = DEFAULT_nnFunc;
};

} // end namespace hindsight
#endif // hindsight_Settings_h
