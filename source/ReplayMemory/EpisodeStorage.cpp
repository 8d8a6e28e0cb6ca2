//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "EpisodeStorage.h"
#include "../Utils/Errors.h"
#include "../Utils/Warnings.h"

#include <algorithm>
#include <string>

namespace hindsight
{

static void checkTrajectory(const std::vector<Rvec>& traj, const Uint length,
  const Uint dim, const char * const name)
{
  if(traj.size() not_eq length)
    throw ShapeMismatchError(std::string(name) + " has " +
      std::to_string(traj.size()) + " entries, expected " +
      std::to_string(length));
  for(const Rvec& entry : traj)
    if(entry.size() not_eq dim)
      throw ShapeMismatchError(std::string(name) + " entry of size " +
        std::to_string(entry.size()) + ", expected " + std::to_string(dim));
}

void checkEpisodeShape(const Episode& EP, const MDPdescriptor& MDP)
{
  const Uint nActions = EP.ndata();
  if(nActions < 1 or nActions > MDP.maxTimesteps)
    throw ShapeMismatchError("episode with " + std::to_string(nActions) +
      " actions, expected between 1 and " + std::to_string(MDP.maxTimesteps));
  checkTrajectory(EP.observations,  nActions+1, MDP.dimObs,    "observations");
  checkTrajectory(EP.achievedGoals, nActions+1, MDP.dimGoal,   "achieved goals");
  checkTrajectory(EP.desiredGoals,  nActions,   MDP.dimGoal,   "desired goals");
  checkTrajectory(EP.actions,       nActions,   MDP.dimAction, "actions");
}

EpisodeStorage::EpisodeStorage(const MDPdescriptor& M_, const Uint capacity) :
  MDP(M_), nSlots(capacity),
  obsData (capacity * (MDP.maxTimesteps+1) * MDP.dimObs,    0),
  agData  (capacity * (MDP.maxTimesteps+1) * MDP.dimGoal,   0),
  goalData(capacity *  MDP.maxTimesteps    * MDP.dimGoal,   0),
  actData (capacity *  MDP.maxTimesteps    * MDP.dimAction, 0),
  lengths(capacity, 0)
{
  debugM("Allocated %u episode slots of %u steps", nSlots, T);
}

void EpisodeStorage::write(const Uint slot, const Episode& EP)
{
  const Uint len = EP.ndata();
  memReal * const O = obsData.data()  + slot*(T+1) * MDP.dimObs;
  memReal * const A = agData.data()   + slot*(T+1) * MDP.dimGoal;
  memReal * const G = goalData.data() + slot*T     * MDP.dimGoal;
  memReal * const U = actData.data()  + slot*T     * MDP.dimAction;
  for(Uint t=0; t<=len; ++t) {
    std::copy(EP.observations[t].begin(), EP.observations[t].end(),
              O + t*MDP.dimObs);
    std::copy(EP.achievedGoals[t].begin(), EP.achievedGoals[t].end(),
              A + t*MDP.dimGoal);
  }
  for(Uint t=0; t<len; ++t) {
    std::copy(EP.desiredGoals[t].begin(), EP.desiredGoals[t].end(),
              G + t*MDP.dimGoal);
    std::copy(EP.actions[t].begin(), EP.actions[t].end(),
              U + t*MDP.dimAction);
  }
  lengths[slot] = len;
}

Episode EpisodeStorage::read(const Uint slot) const
{
  const Uint len = lengths[slot];
  Episode ret(len);
  for(Uint t=0; t<=len; ++t) {
    ret.observations.emplace_back(obs(slot, t), obs(slot, t) + MDP.dimObs);
    ret.achievedGoals.emplace_back(achieved(slot, t),
                                   achieved(slot, t) + MDP.dimGoal);
  }
  for(Uint t=0; t<len; ++t) {
    ret.desiredGoals.emplace_back(goal(slot, t), goal(slot, t) + MDP.dimGoal);
    ret.actions.emplace_back(action(slot, t), action(slot, t) + MDP.dimAction);
  }
  return ret;
}

void EpisodeStorage::setNumberOfEpisodes(const Uint N)
{
  nValid = std::min(N, nSlots);
}

} // end namespace hindsight
