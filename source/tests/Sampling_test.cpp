//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "TestHelpers.h"
#include "../ReplayMemory/Sampling.h"
#include "../Utils/Errors.h"

#include <gtest/gtest.h>

namespace hindsight
{
namespace test
{

class HERsamplerTest : public ::testing::Test
{
 protected:
  const MDPdescriptor MDP = makeMDP(2, 1, 1, 50);
  std::mt19937 gen{1234};
  EpisodeStorage episodes{MDP, 4};

  void SetUp() override
  {
    // episodes of different lengths: the final goal depends on the length
    const Uint lengths[4] = {50, 20, 50, 7};
    for(Uint i=0; i<4; ++i) episodes.write(i, makeEpisode(MDP, i, lengths[i]));
    episodes.setNumberOfEpisodes(4);
  }
};

TEST_F(HERsamplerTest, RelabelingProbability)
{
  EXPECT_DOUBLE_EQ(HERsampler::prepare("future", 4, sparseReward)->futureP, 0.8);
  EXPECT_DOUBLE_EQ(HERsampler::prepare("future", 1, sparseReward)->futureP, 0.5);
  EXPECT_DOUBLE_EQ(HERsampler::prepare("final", 4, sparseReward)->futureP, 0.8);
  EXPECT_DOUBLE_EQ(HERsampler::prepare("future", 0, sparseReward)->futureP, 0);
  EXPECT_DOUBLE_EQ(HERsampler::prepare("none", 4, sparseReward)->futureP, 0);
}

TEST_F(HERsamplerTest, InvalidConfiguration)
{
  EXPECT_THROW(HERsampler::prepare("future", -1, sparseReward),
               InvalidConfigurationError);
  EXPECT_THROW(HERsampler::prepare("episode", 4, sparseReward),
               InvalidConfigurationError);
  EXPECT_THROW(HERsampler::prepare("future", 4, rewardFunction_t()),
               InvalidConfigurationError);
}

TEST_F(HERsamplerTest, EmptyStorageThrows)
{
  const auto sampler = HERsampler::prepare("future", 4, sparseReward);
  EpisodeStorage empty(MDP, 4);
  EXPECT_THROW(sampler->sample(empty, 8, gen), EmptyBufferError);
}

TEST_F(HERsamplerTest, GoalsUnchangedWithoutRelabeling)
{
  const auto none = HERsampler::prepare("none", 4, sparseReward);
  const auto futureK0 = HERsampler::prepare("future", 0, sparseReward);
  for(const HERsampler* S : {none.get(), futureK0.get()}) {
    const Transitions TR = S->sample(episodes, 2000, gen);
    for(Uint i=0; i<TR.size; ++i) {
      EXPECT_EQ(TR.g[i], -1);
      EXPECT_EQ(TR.relabeled[i], 0);
      EXPECT_EQ(TR.r[i], -1);
    }
  }
}

TEST_F(HERsamplerTest, FinalStrategyUsesLastAchievedGoal)
{
  const Uint lengths[4] = {50, 20, 50, 7};
  const auto sampler = HERsampler::prepare("final", 4, sparseReward);
  const Transitions TR = sampler->sample(episodes, 2000, gen);
  Uint nRelabeled = 0;
  for(Uint i=0; i<TR.size; ++i) {
    const Uint ep = TR.episodeIdx[i];
    EXPECT_LT(TR.timestepIdx[i], lengths[ep]);
    if(not TR.relabeled[i]) { EXPECT_EQ(TR.g[i], -1); continue; }
    EXPECT_EQ(TR.g[i], 100.0*ep + lengths[ep]);
    nRelabeled++;
  }
  EXPECT_GT(nRelabeled, 0u);
}

TEST_F(HERsamplerTest, FutureGoalsComeFromLaterSteps)
{
  const Uint lengths[4] = {50, 20, 50, 7};
  const auto sampler = HERsampler::prepare("future", 4, sparseReward);
  const Transitions TR = sampler->sample(episodes, 5000, gen);
  for(Uint i=0; i<TR.size; ++i) {
    if(not TR.relabeled[i]) continue;
    const Uint ep = TR.episodeIdx[i], t = TR.timestepIdx[i];
    EXPECT_GE(TR.g[i], 100.0*ep + t + 1);
    EXPECT_LE(TR.g[i], 100.0*ep + lengths[ep]);
  }
}

TEST_F(HERsamplerTest, RewardsMatchRelabeledGoals)
{
  const auto sampler = HERsampler::prepare("future", 4, sparseReward);
  const Transitions TR = sampler->sample(episodes, 5000, gen);
  Uint nReached = 0;
  for(Uint i=0; i<TR.size; ++i) {
    EXPECT_EQ(TR.r[i], sparseReward(TR.achievedNext(i), TR.goal(i)));
    if(TR.r[i] == 0) nReached++;
  }
  // goals relabeled with the next achieved goal are reached
  EXPECT_GT(nReached, 0u);
}

TEST_F(HERsamplerTest, FractionOfRelabeledTransitions)
{
  const auto sampler = HERsampler::prepare("future", 4, sparseReward);
  const Uint N = 100000;
  const Transitions TR = sampler->sample(episodes, N, gen);
  Uint nRelabeled = 0;
  for(Uint i=0; i<N; ++i) nRelabeled += TR.relabeled[i];
  EXPECT_NEAR(nRelabeled / (Real) N, 0.8, 0.01);
}

TEST_F(HERsamplerTest, LastStepRelabelsWithFinalAchievedGoal)
{
  // with one action, t = 0 = T-1 and the only future goal is the final one
  EpisodeStorage single(MDP, 1);
  single.write(0, makeEpisode(MDP, 3, 1));
  single.setNumberOfEpisodes(1);
  const auto sampler = HERsampler::prepare("future", 1e6, sparseReward);
  const Transitions TR = sampler->sample(single, 1000, gen);
  for(Uint i=0; i<TR.size; ++i) {
    EXPECT_EQ(TR.timestepIdx[i], 0u);
    if(not TR.relabeled[i]) continue;
    EXPECT_EQ(TR.g[i], 301);
    EXPECT_EQ(TR.r[i], 0);
  }
}

} // end namespace test
} // end namespace hindsight
