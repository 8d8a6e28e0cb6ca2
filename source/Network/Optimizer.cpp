//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Optimizer.h"
#include "../Utils/Warnings.h"

namespace hindsight
{

AdamOptimizer::AdamOptimizer(const Network& net, const Real learnRate,
  const Real B1, const Real B2) : weights(net.weights.get()),
  gradients(net.gradients.get()), _1stMom(weights->allocateEmptyAlike()),
  _2ndMom(weights->allocateEmptyAlike()), beta_1(B1), beta_2(B2),
  eta(learnRate)
{
  if(eta < 0) throw InvalidConfigurationError("learning rate < 0");
}

void AdamOptimizer::apply_update()
{
  //update is deterministic: can be handled independently by each node
  const Adam algo(eta, beta_1, beta_2, beta_t_1, beta_t_2, -1);
  nnReal* const paramAry = weights->params;
  nnReal* const M1 = _1stMom->params;
  nnReal* const M2 = _2ndMom->params;
  const nnReal* const G = gradients->params;

  #pragma omp parallel for schedule(static)
  for (Uint i=0; i<weights->nParams; i++)
    paramAry[i] += algo.step(G[i], M1[i], M2[i]);

  gradients->clear();
  nStep++;
  // Needed by Adam optimization algorithm:
  beta_t_1 *= beta_1;
  if (beta_t_1<nnEPS) beta_t_1 = 0;
  beta_t_2 *= beta_2;
  if (beta_t_2<nnEPS) beta_t_2 = 0;
}

} // end namespace hindsight
