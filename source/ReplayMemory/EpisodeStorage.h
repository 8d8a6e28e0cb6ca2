//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_EpisodeStorage_h
#define hindsight_EpisodeStorage_h

#include "Episode.h"

namespace hindsight
{

// Fixed number of preallocated episode slots. Each slot has room for
// maxTimesteps actions. Slots [0, nEpisodes()) hold valid data.
class EpisodeStorage
{
  const MDPdescriptor MDP;
  const Uint T = MDP.maxTimesteps;
  const Uint nSlots;
  Mvec obsData, agData, goalData, actData;
  std::vector<Uint> lengths;
  Uint nValid = 0;

 public:
  EpisodeStorage(const MDPdescriptor& M_, const Uint capacity);

  // Copies EP into slot. EP is expected to have passed checkEpisodeShape.
  void write(const Uint slot, const Episode& EP);
  Episode read(const Uint slot) const;

  void setNumberOfEpisodes(const Uint N);
  Uint nEpisodes() const { return nValid; }
  Uint capacity() const { return nSlots; }
  Uint length(const Uint slot) const { return lengths[slot]; }
  const MDPdescriptor& getMDP() const { return MDP; }

  const memReal* obs(const Uint slot, const Uint t) const {
    return obsData.data() + (slot*(T+1) + t) * MDP.dimObs;
  }
  const memReal* achieved(const Uint slot, const Uint t) const {
    return agData.data() + (slot*(T+1) + t) * MDP.dimGoal;
  }
  const memReal* goal(const Uint slot, const Uint t) const {
    return goalData.data() + (slot*T + t) * MDP.dimGoal;
  }
  const memReal* action(const Uint slot, const Uint t) const {
    return actData.data() + (slot*T + t) * MDP.dimAction;
  }
};

} // end namespace hindsight
#endif // hindsight_EpisodeStorage_h
