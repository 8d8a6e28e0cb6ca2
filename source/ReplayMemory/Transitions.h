//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Transitions_h
#define hindsight_Transitions_h

#include "../StateAction.h"

namespace hindsight
{

// Minibatch of transitions. Every field is a flat row-major array with one
// row per transition, so rows can be fed directly to the networks.
struct Transitions
{
  const Uint size, dimObs, dimGoal, dimAction;

  Rvec obs     = Rvec(size * dimObs, 0);
  Rvec obsNext = Rvec(size * dimObs, 0);
  Rvec ag      = Rvec(size * dimGoal, 0);
  Rvec agNext  = Rvec(size * dimGoal, 0);
  Rvec g       = Rvec(size * dimGoal, 0);
  Rvec actions = Rvec(size * dimAction, 0);
  Rvec r       = Rvec(size, 0);

  // where each transition comes from and whether its goal was substituted:
  std::vector<Uint> episodeIdx = std::vector<Uint>(size, 0);
  std::vector<Uint> timestepIdx = std::vector<Uint>(size, 0);
  std::vector<char> relabeled = std::vector<char>(size, 0);

  Transitions(const Uint N, const MDPdescriptor& MDP) : size(N),
    dimObs(MDP.dimObs), dimGoal(MDP.dimGoal), dimAction(MDP.dimAction) {}

  Real* obsRow(const Uint i)     { return obs.data()     + i*dimObs; }
  Real* obsNextRow(const Uint i) { return obsNext.data() + i*dimObs; }
  Real* agRow(const Uint i)      { return ag.data()      + i*dimGoal; }
  Real* agNextRow(const Uint i)  { return agNext.data()  + i*dimGoal; }
  Real* goalRow(const Uint i)    { return g.data()       + i*dimGoal; }
  Real* actionRow(const Uint i)  { return actions.data() + i*dimAction; }

  Rvec achievedNext(const Uint i) const {
    return Rvec(agNext.begin() + i*dimGoal, agNext.begin() + (i+1)*dimGoal);
  }
  Rvec goal(const Uint i) const {
    return Rvec(g.begin() + i*dimGoal, g.begin() + (i+1)*dimGoal);
  }
};

} // end namespace hindsight
#endif // hindsight_Transitions_h
