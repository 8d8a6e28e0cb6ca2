//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_ReachEnvironment_h
#define hindsight_ReachEnvironment_h

#include "Environment.h"

namespace hindsight
{

// Point mass in the box [-1,1]^dim pushed by a bounded force towards a random
// target position. Observation: position and velocity. Achieved goal: the
// position. Sparse reward: -1 until the target is within distThreshold.
class ReachEnvironment : public Environment
{
  const Uint dim;
  const Real distThreshold;
  const Real dt = 0.1, damping = 0.5, goalRange = 0.8;
  Rvec pos = Rvec(dim, 0), vel = Rvec(dim, 0), target = Rvec(dim, 0);
  Uint nSteps = 0;

  static MDPdescriptor makeDescriptor(const Uint dim, const Uint T);
  Observation getObservation() const;
  Real distance(const Rvec& achieved, const Rvec& desired) const;

 public:
  ReachEnvironment(const Uint _dim, const Real threshold, const Uint T);

  Observation reset(std::mt19937& gen) override;
  StepResult step(const Rvec& action) override;
  Real computeReward(const Rvec& achieved, const Rvec& desired) const override;
};

} // end namespace hindsight
#endif // hindsight_ReachEnvironment_h
