//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Engine.h"
#include "../Settings.h"
#include "../Environments/Environment.h"
#include "../Learners/DDPG_HER.h"
#include "CLI/CLI.hpp"

namespace hindsight
{

Engine::Engine(int argc, char** argv) :
  distrib(new DistributionInfo(argc, argv)), settings(new Settings()) { }

Engine::~Engine()
{
  delete settings;
  delete distrib;
}

int Engine::parse(int argc, char** argv)
{
  CLI::App parser("hindsight : distributed DDPG with hindsight experience replay");
  settings->initializeOpts(parser);
  distrib->initializeOpts(parser);
  try {
    parser.parse(argc, argv);
  }
  catch (const CLI::ParseError &e) {
    // prints the help message or the parse error
    if(distrib->world_rank == 0) parser.exit(e);
    return 1;
  }
  return 0;
}

void Engine::init()
{
  settings->check();
  distrib->initialzePRNG();
  MPI_Barrier(distrib->learners_train_comm);
}

void Engine::run()
{
  init();

  const std::unique_ptr<Environment> env = createEnvironment(*settings);
  DDPG_HER learner(env.get(), *settings, *distrib);
  learner.train();

  MPI_Barrier(distrib->learners_train_comm);
}

void Engine::setNthreads(const Uint nThreads)
{
  distrib->nThreads = nThreads;
}

void Engine::setRandSeed(const Uint randSeed)
{
  distrib->randSeed = randSeed;
}

} // end namespace hindsight
