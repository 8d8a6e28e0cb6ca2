//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Sampling.h"
#include "../Utils/Errors.h"
#include "../Utils/Warnings.h"

#include <algorithm>

namespace hindsight
{

static Real relabelProbability(const Real replay_k)
{
  return replay_k < 0 ? 0 : 1 - 1/(1+replay_k);
}

HERsampler::HERsampler(const Real replay_k, const Real relabelProb,
  const rewardFunction_t& reward) : computeReward(reward),
  replayK(replay_k), futureP(relabelProb)
{
  if(replayK < 0) throw InvalidConfigurationError("replay_k < 0");
  if(not computeReward)
    throw InvalidConfigurationError("HER sampler needs a reward function");
}

Transitions HERsampler::sample(const EpisodeStorage& episodes,
  const Uint batchSize, std::mt19937& gen) const
{
  const Uint nEpisodes = episodes.nEpisodes();
  if(nEpisodes == 0)
    throw EmptyBufferError("cannot sample transitions: no episode stored");

  const MDPdescriptor& MDP = episodes.getMDP();
  const Uint dO = MDP.dimObs, dG = MDP.dimGoal, dA = MDP.dimAction;
  Transitions ret(batchSize, MDP);

  std::uniform_int_distribution<Uint> distEpisode(0, nEpisodes-1);
  std::uniform_real_distribution<Real> distU(0, 1);

  for(Uint i=0; i<batchSize; ++i)
  {
    const Uint ep = distEpisode(gen), len = episodes.length(ep);
    const Uint t = std::uniform_int_distribution<Uint>(0, len-1)(gen);
    ret.episodeIdx[i] = ep;
    ret.timestepIdx[i] = t;

    std::copy(episodes.obs(ep, t),        episodes.obs(ep, t) + dO,
              ret.obsRow(i));
    std::copy(episodes.obs(ep, t+1),      episodes.obs(ep, t+1) + dO,
              ret.obsNextRow(i));
    std::copy(episodes.achieved(ep, t),   episodes.achieved(ep, t) + dG,
              ret.agRow(i));
    std::copy(episodes.achieved(ep, t+1), episodes.achieved(ep, t+1) + dG,
              ret.agNextRow(i));
    std::copy(episodes.action(ep, t),     episodes.action(ep, t) + dA,
              ret.actionRow(i));

    if(distU(gen) < futureP) {
      const Uint tGoal = relabelIndex(t, len, gen);
      std::copy(episodes.achieved(ep, tGoal),
                episodes.achieved(ep, tGoal) + dG, ret.goalRow(i));
      ret.relabeled[i] = 1;
    } else {
      std::copy(episodes.goal(ep, t), episodes.goal(ep, t) + dG,
                ret.goalRow(i));
    }

    ret.r[i] = computeReward(ret.achievedNext(i), ret.goal(i));
  }
  return ret;
}

std::unique_ptr<HERsampler> HERsampler::prepare(const std::string& strategy,
  const Real replay_k, const rewardFunction_t& reward)
{
  std::unique_ptr<HERsampler> ret = nullptr;

  if(strategy == "future")
    ret = std::make_unique<HERsample_future>(replay_k, reward);

  if(strategy == "final")
    ret = std::make_unique<HERsample_final>(replay_k, reward);

  if(strategy == "none")
    ret = std::make_unique<HERsample_none>(replay_k, reward);

  if(ret == nullptr)
    throw InvalidConfigurationError("unknown replay strategy " + strategy);
  debugM("Relabeling strategy %s with probability %f",
    strategy.c_str(), ret->futureP);
  return ret;
}

HERsample_future::HERsample_future(const Real replay_k,
  const rewardFunction_t& reward) :
  HERsampler(replay_k, relabelProbability(replay_k), reward) {}

Uint HERsample_future::relabelIndex(const Uint t, const Uint len,
  std::mt19937& gen) const
{
  // achieved goals are stored for t = 0 ... len, window is never empty
  return std::uniform_int_distribution<Uint>(t+1, len)(gen);
}

HERsample_final::HERsample_final(const Real replay_k,
  const rewardFunction_t& reward) :
  HERsampler(replay_k, relabelProbability(replay_k), reward) {}

Uint HERsample_final::relabelIndex(const Uint t, const Uint len,
  std::mt19937& gen) const
{
  return len;
}

HERsample_none::HERsample_none(const Real replay_k,
  const rewardFunction_t& reward) :
  HERsampler(replay_k, 0, reward) {}

Uint HERsample_none::relabelIndex(const Uint t, const Uint len,
  std::mt19937& gen) const
{
  // relabeling probability is zero: desired goals are never substituted
  return t+1;
}

} // end namespace hindsight
