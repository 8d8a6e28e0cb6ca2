//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Optimizer_h
#define hindsight_Optimizer_h

#include "Network.h"

namespace hindsight
{

struct Adam
{
  const nnReal eta, B1, B2, fac;
  Adam(nnReal _eta, nnReal beta1, nnReal beta2, nnReal betat1,
    nnReal betat2, nnReal _fac) :
    eta(_eta*std::sqrt(1-betat2)/(1-betat1)), B1(beta1), B2(beta2), fac(_fac) {}

  inline nnReal step(const nnReal grad, nnReal&M1, nnReal&M2) const
  {
    const nnReal DW = fac * grad;
    M1 = B1 * M1 + (1-B1) * DW;
    M2 = B2 * M2 + (1-B2) * DW*DW;
    return eta * M1 / std::sqrt(nnEPS + M2);
  }
};

// Applies the gradients accumulated in the network (already reduced across
// workers) to its weights, then clears them. The update is deterministic:
// replicas that start from the same weights and moments and see the same
// gradients remain bit-identical.
class AdamOptimizer
{
 protected:
  const Parameters * const weights;
  const Parameters * const gradients;
  const std::unique_ptr<Parameters> _1stMom;
  const std::unique_ptr<Parameters> _2ndMom;
  const Real beta_1, beta_2;
  Real beta_t_1 = beta_1, beta_t_2 = beta_2;

 public:
  const Real eta;
  long unsigned nStep = 0;

  AdamOptimizer(const Network& net, const Real learnRate,
                const Real B1 = .9, const Real B2 = .999);

  // gradients are derivatives of a loss to minimize
  void apply_update();
};

} // end namespace hindsight
#endif // hindsight_Optimizer_h
