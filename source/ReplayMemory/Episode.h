//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Episode_h
#define hindsight_Episode_h

#include "../StateAction.h"

namespace hindsight
{

struct Episode
{
  Episode() {}
  Episode(const Uint nActions)
  {
    observations.reserve(nActions+1);
    achievedGoals.reserve(nActions+1);
    desiredGoals.reserve(nActions);
    actions.reserve(nActions);
  }

  // observations and achieved goals hold one more entry than the actions:
  // the state reached after the last action.
  std::vector<Rvec> observations;
  std::vector<Rvec> achievedGoals;
  std::vector<Rvec> desiredGoals;
  std::vector<Rvec> actions;

  Uint ndata() const // how many transitions can be sampled from the episode
  {
    return actions.size();
  }

  void clear()
  {
    observations.clear(); achievedGoals.clear();
    desiredGoals.clear(); actions.clear();
  }
};

typedef std::vector<Episode> EpisodeBatch;

// Throws ShapeMismatchError if the four trajectories are not consistent with
// each other and with the dimensions described by MDP.
void checkEpisodeShape(const Episode& EP, const MDPdescriptor& MDP);

} // end namespace hindsight
#endif // hindsight_Episode_h
