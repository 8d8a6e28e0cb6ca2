//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Network.h"
#include "../Utils/Warnings.h"

#include <cblas.h>
#include <algorithm>
#include <utility>
#include <string>

namespace hindsight
{

static std::vector<Uint> concatSizes(const Uint nInp,
  const std::vector<Uint>& hidden, const Uint nOut)
{
  std::vector<Uint> ret(1, nInp);
  ret.insert(ret.end(), hidden.begin(), hidden.end());
  ret.push_back(nOut);
  return ret;
}

static Parameters* allocParameters(const std::vector<Uint>& sizes)
{
  std::vector<Uint> nWeight, nBiases;
  for(Uint l=0; l+1<sizes.size(); ++l) {
    nWeight.push_back(sizes[l] * sizes[l+1]);
    nBiases.push_back(sizes[l+1]);
  }
  return new Parameters(nWeight, nBiases);
}

Network::Network(const Uint _nInp, const std::vector<Uint>& hiddenSizes,
  const Uint _nOut, const std::string& hiddenFunc,
  const std::string& outputFunc) : nInputs(_nInp), nOutputs(_nOut),
  layerSizes(concatSizes(_nInp, hiddenSizes, _nOut)),
  weights(allocParameters(layerSizes)),
  tgt_weights(weights->allocateEmptyAlike()),
  gradients(weights->allocateEmptyAlike())
{
  if(nInputs == 0 or nOutputs == 0)
    throw InvalidConfigurationError("network without inputs or outputs");
  for(Uint l=0; l<nLayers; ++l) {
    const bool bOutput = l+1 == nLayers;
    funcs.emplace_back(makeFunction(bOutput? outputFunc : hiddenFunc));
    debugL("(%u) %s %sInnerProduct Layer of size:%u linked to size:%u.",
      l, funcs[l]->name().c_str(), bOutput? "output ":"",
      layerSizes[l+1], layerSizes[l]);
  }
}

void Network::initialize(std::mt19937& gen) const
{
  for(Uint l=0; l<nLayers; ++l)
  {
    const Uint nI = layerSizes[l], nO = layerSizes[l+1];
    const nnReal init = funcs[l]->initFactor(nI, nO);
    std::uniform_real_distribution<nnReal> dis(-init, init);
    nnReal* const biases = weights->B(l);
    for(Uint o=0; o<nO; o++) biases[o] = dis(gen);
    nnReal* const weight = weights->W(l);
    for(Uint i=0; i<nI; i++) for(Uint o=0; o<nO; o++)
      weight[o + nO*i] = dis(gen);
  }
  copyWeightsToTarget();
  gradients->clear();
}

Activation Network::forward(const NNvec& input, const Uint batchSize,
  const Parameters*const _weights) const
{
  const Parameters*const W = _weights == nullptr ? weights.get() : _weights;
  if(input.size() not_eq batchSize * nInputs)
    throw ShapeMismatchError("network input of size " +
      std::to_string(input.size()) + ", expected " +
      std::to_string(batchSize) + "x" + std::to_string(nInputs));

  Activation act(batchSize, nLayers);
  act.Y[0] = input;
  for(Uint l=0; l<nLayers; ++l)
  {
    const Uint nI = layerSizes[l], nO = layerSizes[l+1];
    NNvec& suminp = act.X[l]; //array that contains Y_{-1} * W + B
    suminp.resize(batchSize * nO);
    const nnReal* const bias = W->B(l);
    for(Uint b=0; b<batchSize; ++b)
      std::copy(bias, bias + nO, suminp.data() + b*nO);
    gemm(CblasRowMajor, CblasNoTrans, CblasNoTrans, batchSize, nO, nI,
      1, act.Y[l].data(), nI, W->W(l), nO, 1, suminp.data(), nO);
    act.Y[l+1].resize(batchSize * nO);
    funcs[l]->eval(suminp.data(), act.Y[l+1].data(), batchSize * nO);
  }
  return act;
}

NNvec Network::backProp(const Activation& act, const NNvec& outputDelta,
  const Parameters*const _grad, const Parameters*const _weights) const
{
  const Parameters*const W = _weights == nullptr ? weights.get() : _weights;
  const Parameters*const G = _grad == nullptr ? gradients.get() : _grad;
  const Uint batchSize = act.batchSize;
  if(outputDelta.size() not_eq batchSize * nOutputs)
    throw ShapeMismatchError("output gradient of size " +
      std::to_string(outputDelta.size()) + ", expected " +
      std::to_string(batchSize) + "x" + std::to_string(nOutputs));

  NNvec deltas = outputDelta;
  for(Uint l=nLayers; l-- > 0; )
  {
    const Uint nI = layerSizes[l], nO = layerSizes[l+1];
    const NNvec& suminp = act.X[l];
    for(Uint i=0; i<batchSize*nO; ++i)
      deltas[i] *= funcs[l]->evalDiff(suminp[i]);

    nnReal* const grad_b = G->B(l);
    for(Uint b=0; b<batchSize; ++b)
      for(Uint o=0; o<nO; ++o) grad_b[o] += deltas[b*nO + o];

    // dW += Y_{-1}^T * deltas
    gemm(CblasRowMajor, CblasTrans, CblasNoTrans, nI, nO, batchSize,
      1, act.Y[l].data(), nI, deltas.data(), nO, 1, G->W(l), nO);

    // errors of the layer below: deltas * W^T
    NNvec errors(batchSize * nI, 0);
    gemm(CblasRowMajor, CblasNoTrans, CblasTrans, batchSize, nI, nO,
      1, deltas.data(), nO, W->W(l), nO, 0, errors.data(), nI);
    deltas = std::move(errors);
  }
  return deltas;
}

} // end namespace hindsight
