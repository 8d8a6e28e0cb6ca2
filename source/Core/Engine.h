//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Engine_h
#define hindsight_Engine_h

#include "../Utils/Definitions.h"

namespace hindsight
{

struct DistributionInfo;
struct Settings;

class Engine
{
  DistributionInfo * const distrib;
  Settings * const settings;

  void init();

public:
  Engine(int argc, char** argv);

  ~Engine();

  // non-zero if the program should exit: help requested or parse error
  int parse(int argc, char** argv);

  void run();

  void setNthreads(const Uint nThreads);

  void setRandSeed(const Uint randSeed);
};

} // end namespace hindsight
#endif // hindsight_Engine_h
