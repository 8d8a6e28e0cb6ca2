//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Settings.h"
#include "CLI/CLI.hpp"

namespace hindsight
{

void DistributionInfo::initializeOpts(CLI::App & parser)
{
  parser.add_option("--nThreads",           nThreads,           COMMENT_nThreads);
  parser.add_option("--randSeed",           randSeed,           COMMENT_randSeed);
}

void Settings::initializeOpts(CLI::App & parser)
{
  // environment
  parser.add_option("--envName",            envName,            COMMENT_envName);
  parser.add_option("--goalDim",            goalDim,            COMMENT_goalDim);
  parser.add_option("--distThreshold",      distThreshold,      COMMENT_distThreshold);
  parser.add_option("--maxTimesteps",       maxTimesteps,       COMMENT_maxTimesteps);

  // training loop
  parser.add_option("--nEpochs",            nEpochs,            COMMENT_nEpochs);
  parser.add_option("--nCycles",            nCycles,            COMMENT_nCycles);
  parser.add_option("--nBatches",           nBatches,           COMMENT_nBatches);
  parser.add_option("--nRolloutsPerWorker", nRolloutsPerWorker, COMMENT_nRolloutsPerWorker);
  parser.add_option("--nTestRollouts",      nTestRollouts,      COMMENT_nTestRollouts);
  parser.add_option("--saveDir",            saveDir,            COMMENT_saveDir);

  // replay memory
  parser.add_option("--bufferSize",         bufferSize,         COMMENT_bufferSize);
  parser.add_option("--replayStrategy",     replayStrategy,     COMMENT_replayStrategy);
  parser.add_option("--replayK",            replayK,            COMMENT_replayK);
  parser.add_option("--clipObs",            clipObs,            COMMENT_clipObs);
  parser.add_option("--clipRange",          clipRange,          COMMENT_clipRange);
  parser.add_option("--normEps",            normEps,            COMMENT_normEps);

  // learning algorithm
  parser.add_option("--batchSize",          batchSize,          COMMENT_batchSize);
  parser.add_option("--gamma",              gamma,              COMMENT_gamma);
  parser.add_option("--polyak",             polyak,             COMMENT_polyak);
  parser.add_option("--learnrateActor",     learnrateActor,     COMMENT_learnrateActor);
  parser.add_option("--learnrateCritic",    learnrateCritic,    COMMENT_learnrateCritic);
  parser.add_option("--actionL2",           actionL2,           COMMENT_actionL2);
  parser.add_option("--noiseEps",           noiseEps,           COMMENT_noiseEps);
  parser.add_option("--randomEps",          randomEps,          COMMENT_randomEps);

  // network
  parser.add_option("--nnLayerSizes",       nnLayerSizes,       COMMENT_nnLayerSizes);
  parser.add_option("--nnFunc",             nnFunc,             COMMENT_nnFunc);
}

} // end namespace hindsight
