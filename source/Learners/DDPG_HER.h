//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_DDPG_HER_h
#define hindsight_DDPG_HER_h

#include "../Settings.h"
#include "../Core/DistributedSync.h"
#include "../Environments/Environment.h"
#include "../Network/Optimizer.h"
#include "../ReplayMemory/EpisodicReplayBuffer.h"
#include "../ReplayMemory/RunningNormalizer.h"
#include "../ReplayMemory/Sampling.h"

namespace hindsight
{

// Deterministic policy gradient with hindsight goal relabeling. Every worker
// owns an environment, a replay buffer and replicas of the networks. Replicas
// start from the coordinator's weights and stay identical because gradients
// are averaged across workers before every optimizer step.
class DDPG_HER
{
 protected:
  const Settings & settings;
  const DistributionInfo & distrib;
  Environment * const env;

 public:
  const MDPdescriptor MDP = env->getDescriptor();
  const Uint dimObs = MDP.dimObs, dimGoal = MDP.dimGoal, nA = MDP.dimAction;
  const Uint dimInp = MDP.dimInput(), T = MDP.maxTimesteps;
  const Real actionBound = MDP.actionBound;
  const Real gamma = settings.gamma;
  const Real clipReturn = 1 / (1 - gamma);

 protected:
  std::mt19937& generator = distrib.generator;
  DistributedSync sync;

  // policy: (obs, goal) -> action / actionBound
  Network actor;
  // value: (obs, goal, action / actionBound) -> Q
  Network critic;
  // gradient of the policy loss wrt. value params is not used:
  const std::unique_ptr<Parameters> criticScratchGrad;
  AdamOptimizer actorOpt;
  AdamOptimizer criticOpt;

  const std::unique_ptr<HERsampler> sampler;
  EpisodicReplayBuffer buffer;
  RunningNormalizer obsNorm;
  RunningNormalizer goalNorm;

  // running sums for the epoch log line
  long double sumCriticLoss = 0, sumActorLoss = 0, sumQ = 0;
  long nUpdates = 0;

  // rows of [normalized obs, normalized goal]:
  NNvec prepareInput(const Rvec& obs, const Rvec& goal, const bool bClip) const;
  // appends nA columns (actions scaled by actionBound) to rows of dimInp
  NNvec appendActions(const NNvec& inputs, const NNvec& scaledAct,
                      const Uint batchSize) const;
  Rvec selectAction(const Rvec& obs, const Rvec& goal, const bool bExplore);

 public:
  DDPG_HER(Environment* const _env, const Settings& S,
           const DistributionInfo& D);

  // epochs x cycles x (collect, store, normalize, nBatches updates, targets),
  // each epoch followed by evaluation and checkpoint
  void train();

  // plays one episode, returns it and whether the final step succeeded
  Episode collectEpisode(const bool bExplore, bool& bSuccess);
  EpisodeBatch collectEpisodes(const Uint nEpisodes);

  // relabeled pass over the newly collected episodes
  void updateNormalizers(const EpisodeBatch& batch);
  // one minibatch: policy step then value step, gradients synced
  void updateNetworks();
  void updateTargetNetworks();

  // average across workers of the fraction of successful test episodes
  Real evaluate();
  // coordinator only: normalizer stats and policy parameters
  void save(const std::string& path) const;

  const Network& getActor() const { return actor; }
  const Network& getCritic() const { return critic; }
  EpisodicReplayBuffer& getBuffer() { return buffer; }
  const RunningNormalizer& getObsNormalizer() const { return obsNorm; }
  const RunningNormalizer& getGoalNormalizer() const { return goalNorm; }
  DistributedSync& getSync() { return sync; }
};

} // end namespace hindsight
#endif // hindsight_DDPG_HER_h
