//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "DDPG_HER.h"
#include "../Utils/FunctionUtilties.h"
#include "../Utils/Warnings.h"

#include <sys/stat.h>
#include <cerrno>
#include <algorithm>
#include <cstdio>

namespace hindsight
{

static void makeDirectory(const std::string& dir)
{
  if(mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) not_eq 0
     and errno not_eq EEXIST)
    _warn("Unable to create directory %s", dir.c_str());
}

DDPG_HER::DDPG_HER(Environment* const _env, const Settings& S,
  const DistributionInfo& D) : settings(S), distrib(D), env(_env),
  sync(D.learners_train_comm, D.bIsCoordinator),
  actor(dimInp, S.nnLayerSizes, nA, S.nnFunc, "Tanh"),
  critic(dimInp + nA, S.nnLayerSizes, 1, S.nnFunc, "Linear"),
  criticScratchGrad(critic.weights->allocateEmptyAlike()),
  actorOpt(actor, S.learnrateActor), criticOpt(critic, S.learnrateCritic),
  sampler(HERsampler::prepare(S.replayStrategy, S.replayK,
    [this] (const Rvec& achieved, const Rvec& desired) {
      return env->computeReward(achieved, desired);
    })),
  buffer(MDP, S.bufferSize,
    [this] (const EpisodeStorage& episodes, const Uint N, std::mt19937& gen) {
      return sampler->sample(episodes, N, gen);
    }, generator),
  obsNorm(dimObs, S.clipRange, S.normEps, D.learners_train_comm),
  goalNorm(dimGoal, S.clipRange, S.normEps, D.learners_train_comm)
{
  actor.initialize(generator);
  critic.initialize(generator);
  // all replicas start from the coordinator's networks
  sync.syncNetworks(actor);
  sync.syncNetworks(critic);
  actor.copyWeightsToTarget();
  critic.copyWeightsToTarget();

  if(distrib.bIsCoordinator)
    printf("DDPG+HER: %u workers, obs:%u goal:%u action:%u T:%u, buffer of "
      "%u episodes, %s relabeling with probability %.3f\n",
      sync.getNWorkers(), dimObs, dimGoal, nA, T, buffer.capacity,
      settings.replayStrategy.c_str(), sampler->futureP);
}

NNvec DDPG_HER::prepareInput(const Rvec& obs, const Rvec& goal,
  const bool bClip) const
{
  const Uint nRows = obs.size() / dimObs;
  if(goal.size() not_eq nRows * dimGoal)
    throw ShapeMismatchError("observations and goals of different batch size");
  Rvec O = obs, G = goal;
  if(bClip) {
    const Real C = settings.clipObs;
    for(Real& o : O) o = Utilities::clip(o, C, -C);
    for(Real& g : G) g = Utilities::clip(g, C, -C);
  }
  const Rvec normO = obsNorm.normalize(O), normG = goalNorm.normalize(G);
  NNvec ret(nRows * dimInp);
  for(Uint b=0; b<nRows; ++b) {
    std::copy(normO.begin() + b*dimObs, normO.begin() + (b+1)*dimObs,
              ret.begin() + b*dimInp);
    std::copy(normG.begin() + b*dimGoal, normG.begin() + (b+1)*dimGoal,
              ret.begin() + b*dimInp + dimObs);
  }
  return ret;
}

NNvec DDPG_HER::appendActions(const NNvec& inputs, const NNvec& scaledAct,
  const Uint batchSize) const
{
  const Uint dimQ = dimInp + nA;
  NNvec ret(batchSize * dimQ);
  for(Uint b=0; b<batchSize; ++b) {
    std::copy(inputs.begin() + b*dimInp, inputs.begin() + (b+1)*dimInp,
              ret.begin() + b*dimQ);
    std::copy(scaledAct.begin() + b*nA, scaledAct.begin() + (b+1)*nA,
              ret.begin() + b*dimQ + dimInp);
  }
  return ret;
}

Rvec DDPG_HER::selectAction(const Rvec& obs, const Rvec& goal,
  const bool bExplore)
{
  const Activation act = actor.forward(prepareInput(obs, goal, false), 1);
  Rvec pi(nA);
  for(Uint i=0; i<nA; ++i) pi[i] = actionBound * act.output()[i];
  if(not bExplore) return pi;

  std::normal_distribution<Real> noise(0, settings.noiseEps * actionBound);
  for(Uint i=0; i<nA; ++i)
    pi[i] = Utilities::clip(pi[i] + noise(generator), actionBound, -actionBound);

  std::uniform_real_distribution<Real> uniform(-actionBound, actionBound);
  std::bernoulli_distribution bRandom(settings.randomEps);
  if(bRandom(generator))
    for(Uint i=0; i<nA; ++i) pi[i] = uniform(generator);
  return pi;
}

Episode DDPG_HER::collectEpisode(const bool bExplore, bool& bSuccess)
{
  Episode EP(T);
  Observation curr = env->reset(generator);
  bSuccess = false;
  for(Uint t=0; t<T; ++t)
  {
    const Rvec action = selectAction(curr.observation, curr.desiredGoal,
                                     bExplore);
    StepResult next = env->step(action);
    EP.observations.push_back(curr.observation);
    EP.achievedGoals.push_back(curr.achievedGoal);
    EP.desiredGoals.push_back(curr.desiredGoal);
    EP.actions.push_back(action);
    bSuccess = next.info.isSuccess;
    curr = std::move(next.obs);
  }
  EP.observations.push_back(curr.observation);
  EP.achievedGoals.push_back(curr.achievedGoal);
  return EP;
}

EpisodeBatch DDPG_HER::collectEpisodes(const Uint nEpisodes)
{
  EpisodeBatch ret;
  ret.reserve(nEpisodes);
  bool bSuccess;
  for(Uint i=0; i<nEpisodes; ++i)
    ret.push_back(collectEpisode(true, bSuccess));
  return ret;
}

void DDPG_HER::updateNormalizers(const EpisodeBatch& batch)
{
  EpisodeStorage episodes(MDP, batch.size());
  for(Uint i=0; i<batch.size(); ++i) {
    checkEpisodeShape(batch[i], MDP);
    episodes.write(i, batch[i]);
  }
  episodes.setNumberOfEpisodes(batch.size());

  Transitions TR = sampler->sample(episodes, batch.size() * T, generator);
  const Real C = settings.clipObs;
  for(Real& o : TR.obs) o = Utilities::clip(o, C, -C);
  for(Real& g : TR.g)   g = Utilities::clip(g, C, -C);

  obsNorm.update(TR.obs);
  goalNorm.update(TR.g);
  obsNorm.recomputeStats();
  goalNorm.recomputeStats();
}

void DDPG_HER::updateNetworks()
{
  const Uint B = settings.batchSize;
  const Transitions TR = buffer.sample(B);
  const NNvec inputs = prepareInput(TR.obs, TR.g, true);
  const NNvec inputsNext = prepareInput(TR.obsNext, TR.g, true);

  // target values from the target networks
  const Activation polNext = actor.forward(inputsNext, B,
                                           actor.tgt_weights.get());
  const Activation valNext = critic.forward(
    appendActions(inputsNext, polNext.output(), B), B,
    critic.tgt_weights.get());

  NNvec scaledAct(B * nA);
  for(Uint i=0; i<B*nA; ++i) scaledAct[i] = TR.actions[i] / actionBound;
  const Activation val = critic.forward(appendActions(inputs, scaledAct, B), B);

  NNvec valueGrad(B);
  Real criticLoss = 0, meanQ = 0;
  for(Uint b=0; b<B; ++b) {
    const Real target = Utilities::clip(
      TR.r[b] + gamma * valNext.output()[b], (Real) 0, -clipReturn);
    const Real err = val.output()[b] - target;
    criticLoss += err * err / B;
    meanQ += val.output()[b] / B;
    valueGrad[b] = 2 * err / B;
  }

  // policy loss: -Q(s, pi(s)) + actionL2 * (pi / actionBound)^2
  const Activation pol = actor.forward(inputs, B);
  const NNvec& mu = pol.output();
  const Activation valPol = critic.forward(appendActions(inputs, mu, B), B);
  Real actorLoss = 0;
  for(Uint b=0; b<B; ++b) actorLoss -= valPol.output()[b] / B;

  criticScratchGrad->clear();
  const NNvec dQdInput = critic.backProp(valPol, NNvec(B, - (nnReal) 1 / B),
                                         criticScratchGrad.get());
  const Real L2fac = settings.actionL2 / (B * nA);
  NNvec policyGrad(B * nA);
  for(Uint b=0; b<B; ++b)
    for(Uint i=0; i<nA; ++i) {
      const nnReal m = mu[b*nA + i];
      policyGrad[b*nA + i] = dQdInput[b*(dimInp+nA) + dimInp + i] + 2*L2fac*m;
      actorLoss += L2fac * m * m;
    }

  actor.backProp(pol, policyGrad);
  sync.syncGrads(actor);
  actorOpt.apply_update();

  critic.backProp(val, valueGrad);
  sync.syncGrads(critic);
  criticOpt.apply_update();

  if(not Utilities::isValidValue(criticLoss) or
     not Utilities::isValidValue(actorLoss))
    _warn("non-finite loss at update %ld: value %e policy %e",
      nUpdates, criticLoss, actorLoss);

  sumCriticLoss += criticLoss;
  sumActorLoss += actorLoss;
  sumQ += meanQ;
  nUpdates++;
  debugL("update %ld: value loss %e policy loss %e Q %e |W| %Le", nUpdates,
    criticLoss, actorLoss, meanQ, actor.weights->compute_weight_norm());
}

void DDPG_HER::updateTargetNetworks()
{
  actor.updateTargetNetwork(settings.polyak);
  critic.updateTargetNetwork(settings.polyak);
}

Real DDPG_HER::evaluate()
{
  Real nSuccess = 0;
  bool bSuccess;
  for(Uint i=0; i<settings.nTestRollouts; ++i) {
    collectEpisode(false, bSuccess);
    if(bSuccess) nSuccess += 1;
  }
  const Real local = settings.nTestRollouts > 0 ?
                     nSuccess / settings.nTestRollouts : 0;
  return sync.allreduceScalar(local, DistributedSync::SUM) / sync.getNWorkers();
}

void DDPG_HER::save(const std::string& path) const
{
  FILE * wFile = fopen(path.c_str(), "wb");
  if(wFile == NULL) {
    _warn("Unable to open checkpoint file %s", path.c_str());
    return;
  }
  obsNorm.save(wFile);
  goalNorm.save(wFile);
  actor.weights->save(wFile);
  fflush(wFile);
  fclose(wFile);
}

void DDPG_HER::train()
{
  const std::string modelDir = settings.saveDir + "/" + settings.envName;
  if(distrib.bIsCoordinator) {
    makeDirectory(settings.saveDir);
    makeDirectory(modelDir);
  }

  for(Uint epoch=0; epoch<settings.nEpochs; ++epoch)
  {
    for(Uint cycle=0; cycle<settings.nCycles; ++cycle)
    {
      const EpisodeBatch batch = collectEpisodes(settings.nRolloutsPerWorker);
      buffer.storeEpisode(batch);
      updateNormalizers(batch);
      for(Uint b=0; b<settings.nBatches; ++b) updateNetworks();
      updateTargetNetworks();
    }

    const Real successRate = evaluate();
    const Real nUp = std::max((Real) 1, (Real) nUpdates);
    const Uint nW = sync.getNWorkers();
    const Real criticLoss = sync.allreduceScalar(sumCriticLoss / nUp) / nW;
    const Real actorLoss = sync.allreduceScalar(sumActorLoss / nUp) / nW;
    const Real avgQ = sync.allreduceScalar(sumQ / nUp) / nW;
    sumCriticLoss = 0; sumActorLoss = 0; sumQ = 0; nUpdates = 0;

    if(distrib.bIsCoordinator) {
      printf("epoch %u: eval success rate %.3f, value loss %.3e, "
        "policy loss %.3e, Q %.3e, buffer %u/%u episodes\n", epoch,
        successRate, criticLoss, actorLoss, avgQ, buffer.currentSize(),
        buffer.capacity);
      fflush(stdout);
      save(modelDir + "/model.raw");
    }
  }
}

} // end namespace hindsight
