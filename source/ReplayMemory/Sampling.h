//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Sampling_h
#define hindsight_Sampling_h

#include "EpisodeStorage.h"
#include "Transitions.h"

#include <functional>
#include <memory>
#include <random>
#include <string>

namespace hindsight
{

// reward of reaching `achieved` when pursuing `desired`
using rewardFunction_t = std::function<Real(const Rvec& achieved,
                                            const Rvec& desired)>;

// Draws transitions uniformly from the episodes of the storage and, with
// probability futureP, replaces the desired goal with a goal achieved later
// in the same episode. Rewards are always recomputed after relabeling.
class HERsampler
{
 protected:
  const rewardFunction_t computeReward;

  // index in [t+1, len] of the achieved goal substituted to the goal at t
  virtual Uint relabelIndex(const Uint t, const Uint len,
                            std::mt19937& gen) const = 0;

 public:
  const Real replayK;
  const Real futureP;

  HERsampler(const Real replay_k, const Real relabelProb,
             const rewardFunction_t& reward);
  virtual ~HERsampler() {}

  Transitions sample(const EpisodeStorage& episodes, const Uint batchSize,
                     std::mt19937& gen) const;

  static std::unique_ptr<HERsampler> prepare(const std::string& strategy,
    const Real replay_k, const rewardFunction_t& reward);
};

class HERsample_future : public HERsampler
{
  Uint relabelIndex(const Uint t, const Uint len,
                    std::mt19937& gen) const override;
 public:
  HERsample_future(const Real replay_k, const rewardFunction_t& reward);
};

class HERsample_final : public HERsampler
{
  Uint relabelIndex(const Uint t, const Uint len,
                    std::mt19937& gen) const override;
 public:
  HERsample_final(const Real replay_k, const rewardFunction_t& reward);
};

class HERsample_none : public HERsampler
{
  Uint relabelIndex(const Uint t, const Uint len,
                    std::mt19937& gen) const override;
 public:
  HERsample_none(const Real replay_k, const rewardFunction_t& reward);
};

} // end namespace hindsight
#endif // hindsight_Sampling_h
