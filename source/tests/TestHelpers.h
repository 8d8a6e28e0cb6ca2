//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_TestHelpers_h
#define hindsight_TestHelpers_h

#include "../ReplayMemory/Episode.h"

#include <cmath>

namespace hindsight
{
namespace test
{

inline MDPdescriptor makeMDP(const Uint dimObs, const Uint dimGoal,
  const Uint dimAction, const Uint T)
{
  MDPdescriptor ret;
  ret.dimObs = dimObs;
  ret.dimGoal = dimGoal;
  ret.dimAction = dimAction;
  ret.maxTimesteps = T;
  return ret;
}

// Episode whose entries encode where they come from:
// observation t   = {id, t, 0, ...}
// achieved goal t = {100 * id + t, ...}
// desired goal    = {-1, ...}
// action t        = {t / 1000, ...}
inline Episode makeEpisode(const MDPdescriptor& MDP, const Uint id,
  const Uint nActions)
{
  Episode ret(nActions);
  for(Uint t=0; t<=nActions; ++t) {
    Rvec obs(MDP.dimObs, 0);
    obs[0] = id;
    if(MDP.dimObs > 1) obs[1] = t;
    ret.observations.push_back(obs);
    ret.achievedGoals.push_back(Rvec(MDP.dimGoal, 100.0 * id + t));
  }
  for(Uint t=0; t<nActions; ++t) {
    ret.desiredGoals.push_back(Rvec(MDP.dimGoal, -1));
    ret.actions.push_back(Rvec(MDP.dimAction, t / 1000.0));
  }
  return ret;
}

// sparse reward of a goal reached within 0.5 in every component
inline Real sparseReward(const Rvec& achieved, const Rvec& desired)
{
  for(Uint i=0; i<achieved.size(); ++i)
    if(std::fabs(achieved[i] - desired[i]) > 0.5) return -1;
  return 0;
}

} // end namespace test
} // end namespace hindsight
#endif // hindsight_TestHelpers_h
