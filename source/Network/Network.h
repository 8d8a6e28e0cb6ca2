//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Network_h
#define hindsight_Network_h

#include "Functions.h"
#include "Parameters.h"

#include <memory>
#include <random>

namespace hindsight
{

// Work memory of one forward pass over a batch. Rows are samples.
struct Activation
{
  const Uint batchSize;
  // X[l]: pre-activation of layer l, Y[l]: input of layer l.
  // Y[nLayers] is the output of the network.
  std::vector<NNvec> X, Y;

  Activation(const Uint bs, const Uint nLayers) :
    batchSize(bs), X(nLayers), Y(nLayers+1) {}

  const NNvec& output() const { return Y.back(); }
};

// Fully connected network. Parameters of all layers live in one contiguous
// block (see Parameters). Alongside the weights the network owns the target
// weights and the gradient accumulator, which share the same layout.
class Network
{
 public:
  const Uint nInputs, nOutputs;
  // input size, hidden sizes, output size:
  const std::vector<Uint> layerSizes;
  const Uint nLayers = layerSizes.size() - 1;

 private:
  std::vector<std::unique_ptr<Function>> funcs;

 public:
  const std::unique_ptr<Parameters> weights;
  const std::unique_ptr<Parameters> tgt_weights;
  const std::unique_ptr<Parameters> gradients;

  Network(const Uint _nInp, const std::vector<Uint>& hiddenSizes,
          const Uint _nOut, const std::string& hiddenFunc,
          const std::string& outputFunc);

  Uint getnOutputs() const { return nOutputs; }
  Uint getnInputs()  const { return nInputs;  }
  Uint getnLayers()  const { return nLayers;  }
  const Function* getFunction(const Uint layerID) const {
    return funcs[layerID].get();
  }

  // uniform in [-initFactor, initFactor] for each layer, targets copy weights
  void initialize(std::mt19937& gen) const;

  // input holds batchSize rows of nInputs values
  Activation forward(const NNvec& input, const Uint batchSize,
                     const Parameters*const _weights = nullptr) const;

  // Accumulates into _grad (default: gradients) the gradient of a loss whose
  // derivative wrt. the network output is outputDelta. Returns the derivative
  // of the loss wrt. the network input.
  NNvec backProp(const Activation& act, const NNvec& outputDelta,
                 const Parameters*const _grad = nullptr,
                 const Parameters*const _weights = nullptr) const;

  // tgt_weights = polyak * tgt_weights + (1 - polyak) * weights
  void updateTargetNetwork(const Real polyak) const {
    tgt_weights->softUpdate(weights.get(), polyak);
  }
  void copyWeightsToTarget() const {
    tgt_weights->copy(weights.get());
  }

  ParameterBlob parameters() const { return weights->makeBlob(); }
  ParameterBlob gradientsBlob() const { return gradients->makeBlob(); }
};

} // end namespace hindsight
#endif // hindsight_Network_h
