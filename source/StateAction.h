//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_StateAction_h
#define hindsight_StateAction_h

#include "Utils/Definitions.h"

namespace hindsight
{

struct MDPdescriptor
{
  // This struct contains all information to fully define the goal-conditioned
  // problem seen by the learner: the observation, the goal and the action
  // spaces together with the fixed episode length.

  ///////////////////////////// STATE DESCRIPTION /////////////////////////////
  // Number of observation components (positions, velocities, ...):
  Uint dimObs = 0;
  // Number of components of both the achieved and the desired goal:
  Uint dimGoal = 0;

  ///////////////////////////// ACTION DESCRIPTION /////////////////////////////
  Uint dimAction = 0;
  // actions are bounded in [-actionBound, actionBound] in every component:
  Real actionBound = 1;

  // number of actions per episode (T). Episodes hold T+1 observations:
  Uint maxTimesteps = 0;

  // network input is the concatenation of normalized observation and goal:
  Uint dimInput() const { return dimObs + dimGoal; }
};

} // end namespace hindsight
#endif // hindsight_StateAction_h
