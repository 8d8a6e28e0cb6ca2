//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "ReachEnvironment.h"
#include "../Settings.h"
#include "../Utils/Errors.h"
#include "../Utils/FunctionUtilties.h"

namespace hindsight
{

MDPdescriptor ReachEnvironment::makeDescriptor(const Uint dim, const Uint T)
{
  MDPdescriptor ret;
  ret.dimObs = 2 * dim; // position and velocity
  ret.dimGoal = dim;
  ret.dimAction = dim;
  ret.actionBound = 1;
  ret.maxTimesteps = T;
  return ret;
}

ReachEnvironment::ReachEnvironment(const Uint _dim, const Real threshold,
  const Uint T) : Environment(makeDescriptor(_dim, T)), dim(_dim),
  distThreshold(threshold)
{
  if(dim == 0) throw InvalidConfigurationError("Reach environment of dim 0");
}

Observation ReachEnvironment::reset(std::mt19937& gen)
{
  std::uniform_real_distribution<Real> distGoal(-goalRange, goalRange);
  std::uniform_real_distribution<Real> distStart(-0.1, 0.1);
  for(Uint i=0; i<dim; ++i) {
    pos[i] = distStart(gen);
    vel[i] = 0;
    target[i] = distGoal(gen);
  }
  nSteps = 0;
  return getObservation();
}

StepResult ReachEnvironment::step(const Rvec& action)
{
  if(action.size() not_eq dim)
    throw ShapeMismatchError("Reach environment received action of size "
      + std::to_string(action.size()));
  for(Uint i=0; i<dim; ++i) {
    const Real F = Utilities::clip(action[i], MDP.actionBound, -MDP.actionBound);
    vel[i] = damping * vel[i] + F;
    pos[i] += dt * vel[i];
    // inelastic walls
    if(pos[i] >  1) { pos[i] =  1; vel[i] = 0; }
    if(pos[i] < -1) { pos[i] = -1; vel[i] = 0; }
  }
  nSteps++;

  StepResult ret;
  ret.obs = getObservation();
  ret.reward = computeReward(pos, target);
  ret.info.isSuccess = distance(pos, target) <= distThreshold;
  ret.done = nSteps >= MDP.maxTimesteps;
  return ret;
}

Real ReachEnvironment::distance(const Rvec& achieved, const Rvec& desired) const
{
  Real dist2 = 0;
  for(Uint i=0; i<dim; ++i)
    dist2 += (achieved[i] - desired[i]) * (achieved[i] - desired[i]);
  return std::sqrt(dist2);
}

Real ReachEnvironment::computeReward(const Rvec& achieved,
  const Rvec& desired) const
{
  if(achieved.size() not_eq dim or desired.size() not_eq dim)
    throw ShapeMismatchError("Reach reward expects goals of size "
      + std::to_string(dim));
  return distance(achieved, desired) > distThreshold ? -1 : 0;
}

Observation ReachEnvironment::getObservation() const
{
  Observation ret;
  ret.observation = pos;
  ret.observation.insert(ret.observation.end(), vel.begin(), vel.end());
  ret.achievedGoal = pos;
  ret.desiredGoal = target;
  return ret;
}

std::unique_ptr<Environment> createEnvironment(const Settings& S)
{
  if(S.envName == "Reach")
    return std::make_unique<ReachEnvironment>(S.goalDim, S.distThreshold,
                                              S.maxTimesteps);
  throw InvalidConfigurationError("unknown environment " + S.envName);
}

} // end namespace hindsight
