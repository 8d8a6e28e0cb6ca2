//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "../Network/Optimizer.h"

#include <gtest/gtest.h>
#include <cmath>
#include <memory>

namespace hindsight
{
namespace test
{

// loss = 0.5 * sum of squared outputs, so dloss/doutput = output
static nnReal halfSquaredOutput(const Network& net, const NNvec& inp,
  const Uint batchSize)
{
  const Activation act = net.forward(inp, batchSize);
  nnReal ret = 0;
  for(const nnReal y : act.output()) ret += y * y / 2;
  return ret;
}

class NetworkTest : public ::testing::Test
{
 protected:
  std::mt19937 gen{7};
  Network net{4, {6, 5}, 3, "Tanh", "Linear"};
  const Uint batchSize = 3;
  NNvec input = NNvec(batchSize * 4);

  void SetUp() override
  {
    net.initialize(gen);
    std::uniform_real_distribution<nnReal> dist(-1, 1);
    for(nnReal& x : input) x = dist(gen);
  }
};

TEST_F(NetworkTest, ForwardShapes)
{
  const Activation act = net.forward(input, batchSize);
  EXPECT_EQ(act.output().size(), batchSize * 3);
  EXPECT_THROW(net.forward(NNvec(5), 1), ShapeMismatchError);
  EXPECT_THROW(net.backProp(act, NNvec(2)), ShapeMismatchError);
  EXPECT_THROW({ Network bad(4, {6}, 3, "Swish", "Linear"); },
               InvalidConfigurationError);
}

TEST_F(NetworkTest, GradientsMatchFiniteDifferences)
{
  const Activation act = net.forward(input, batchSize);
  const NNvec inputGrad = net.backProp(act, act.output());

  const nnReal h = 1e-6;
  for(Uint l=0; l<net.nLayers; ++l)
  {
    nnReal* const W = net.weights->W(l);
    const nnReal* const G = net.gradients->W(l);
    for(Uint i=0; i<net.weights->NW(l); i += 3) {
      const nnReal orig = W[i];
      W[i] = orig + h; const nnReal Lp = halfSquaredOutput(net, input, batchSize);
      W[i] = orig - h; const nnReal Lm = halfSquaredOutput(net, input, batchSize);
      W[i] = orig;
      EXPECT_NEAR(G[i], (Lp - Lm) / (2*h), 1e-6) << "layer " << l << " w " << i;
    }
    nnReal* const B = net.weights->B(l);
    const nnReal* const GB = net.gradients->B(l);
    for(Uint i=0; i<net.weights->NB(l); ++i) {
      const nnReal orig = B[i];
      B[i] = orig + h; const nnReal Lp = halfSquaredOutput(net, input, batchSize);
      B[i] = orig - h; const nnReal Lm = halfSquaredOutput(net, input, batchSize);
      B[i] = orig;
      EXPECT_NEAR(GB[i], (Lp - Lm) / (2*h), 1e-6) << "layer " << l << " b " << i;
    }
  }

  ASSERT_EQ(inputGrad.size(), input.size());
  for(Uint i=0; i<input.size(); ++i) {
    NNvec inpP = input, inpM = input;
    inpP[i] += h; inpM[i] -= h;
    const nnReal FD = (halfSquaredOutput(net, inpP, batchSize)
                     - halfSquaredOutput(net, inpM, batchSize)) / (2*h);
    EXPECT_NEAR(inputGrad[i], FD, 1e-6) << "input " << i;
  }
}

TEST_F(NetworkTest, BackPropIntoSeparateGradient)
{
  const std::unique_ptr<Parameters> scratch(net.weights->allocateEmptyAlike());
  const Activation act = net.forward(input, batchSize);
  net.backProp(act, act.output(), scratch.get());
  EXPECT_EQ(net.gradients->compute_weight_norm(), 0);
  EXPECT_GT(scratch->compute_weight_norm(), 0);
}

TEST_F(NetworkTest, AdamStepDecreasesLoss)
{
  AdamOptimizer opt(net, 1e-3);
  const nnReal L0 = halfSquaredOutput(net, input, batchSize);
  for(Uint step=0; step<20; ++step) {
    const Activation act = net.forward(input, batchSize);
    net.backProp(act, act.output());
    opt.apply_update();
    // accumulated gradients are consumed by the step
    EXPECT_EQ(net.gradients->compute_weight_norm(), 0);
  }
  EXPECT_EQ(opt.nStep, 20u);
  EXPECT_LT(halfSquaredOutput(net, input, batchSize), L0);
}

TEST_F(NetworkTest, FirstAdamStepHasLearningRateMagnitude)
{
  AdamOptimizer opt(net, 1e-3);
  const NNvec before(net.weights->params,
                     net.weights->params + net.weights->nParams);
  const Activation act = net.forward(input, batchSize);
  net.backProp(act, act.output());
  const NNvec grad(net.gradients->params,
                   net.gradients->params + net.gradients->nParams);
  opt.apply_update();
  Uint nChecked = 0;
  for(Uint i=0; i<before.size(); ++i) {
    const nnReal delta = net.weights->params[i] - before[i];
    // small gradients are damped by the epsilon of the second moment
    if(std::fabs(grad[i]) < 0.1) continue;
    // bias-corrected first step: -eta * sign(grad)
    EXPECT_NEAR(delta, grad[i] > 0 ? -1e-3 : 1e-3, 1e-5);
    nChecked++;
  }
  EXPECT_GT(nChecked, 0u);
}

TEST_F(NetworkTest, TargetNetworkSoftUpdate)
{
  const nnReal* const W = net.weights->params;
  const nnReal* const tgt = net.tgt_weights->params;
  for(Uint i=0; i<net.weights->nParams; ++i) EXPECT_EQ(W[i], tgt[i]);

  const NNvec tgtBefore(tgt, tgt + net.weights->nParams);
  for(Uint i=0; i<net.weights->nParams; ++i) net.weights->params[i] += 1;
  net.updateTargetNetwork(0.95);
  for(Uint i=0; i<net.weights->nParams; ++i)
    EXPECT_NEAR(tgt[i], 0.95 * tgtBefore[i] + 0.05 * W[i], 1e-12);

  // target weights drive the forward pass when requested
  const Activation online = net.forward(input, batchSize);
  const Activation target = net.forward(input, batchSize, net.tgt_weights.get());
  EXPECT_NE(online.output(), target.output());
  net.copyWeightsToTarget();
  const Activation copied = net.forward(input, batchSize, net.tgt_weights.get());
  EXPECT_EQ(online.output(), copied.output());
}

} // end namespace test
} // end namespace hindsight
