//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Environment_h
#define hindsight_Environment_h

#include "../StateAction.h"

#include <memory>
#include <random>

namespace hindsight
{

struct Settings;

struct Observation
{
  Rvec observation, achievedGoal, desiredGoal;
};

struct StepInfo
{
  bool isSuccess = false;
};

struct StepResult
{
  Observation obs;
  Real reward = 0;
  bool done = false;
  StepInfo info;
};

// Goal-conditioned simulator. Episodes last MDP.maxTimesteps steps.
class Environment
{
 public:
  const MDPdescriptor MDP;

  Environment(const MDPdescriptor& M_) : MDP(M_) {}
  virtual ~Environment() {}

  const MDPdescriptor& getDescriptor() const { return MDP; }

  virtual Observation reset(std::mt19937& gen) = 0;
  virtual StepResult step(const Rvec& action) = 0;
  // Must depend only on its arguments: rewards are recomputed for relabeled
  // goals when transitions are sampled.
  virtual Real computeReward(const Rvec& achieved, const Rvec& desired) const = 0;
};

// Throws InvalidConfigurationError if envName is not known.
std::unique_ptr<Environment> createEnvironment(const Settings& S);

} // end namespace hindsight
#endif // hindsight_Environment_h
