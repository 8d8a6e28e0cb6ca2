//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Parameters_h
#define hindsight_Parameters_h

#include "../Utils/FunctionUtilties.h"
#include "../Utils/ParameterBlob.h"

#include <cassert>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

namespace hindsight
{

struct Parameters
{
 private:
  std::vector<Uint> indBiases, indWeights;
  const std::vector<Uint> nBiases, nWeights;

 public:
  const Uint nParams, nLayers;

  // array containing all parameters of network contiguously
  //(used by optimizer and for MPI reductions)
  nnReal*const params;

  //each layer requests a certain number of parameters, here compute contiguous
  //memory required such that each layer gets an aligned pointer to both
  //its first bias and and first weight, allowing SIMD ops on all layers
  Uint computeNParams(const std::vector<Uint>& _nWeights,
                      const std::vector<Uint>& _nBiases)
  {
    assert(_nWeights.size() == _nBiases.size());
    const Uint nL = _nWeights.size();
    Uint nTotPara = 0;
    indBiases = std::vector<Uint>(nL, 0);
    indWeights = std::vector<Uint>(nL, 0);
    for(Uint i=0; i<nL; i++) {
      indWeights[i] = nTotPara;
      nTotPara += std::ceil(_nWeights[i]*sizeof(nnReal)/32.)*32/sizeof(nnReal);
      indBiases[i] = nTotPara;
      nTotPara += std::ceil( _nBiases[i]*sizeof(nnReal)/32.)*32/sizeof(nnReal);
    }
    return nTotPara;
  }

  Parameters(const std::vector<Uint>& _nWeights,
             const std::vector<Uint>& _nBiases) :
   nBiases(_nBiases), nWeights(_nWeights),
   nParams(computeNParams(_nWeights, _nBiases)), nLayers(_nWeights.size()),
   params(Utilities::allocate_ptr(nParams))  { }

  ~Parameters() { if(params not_eq nullptr) free(params); }

  Parameters(const Parameters&) = delete;
  Parameters& operator=(const Parameters&) = delete;

  // same layout, zero-initialized (gradients, optimizer moments, targets)
  Parameters* allocateEmptyAlike() const
  {
    return new Parameters(nWeights, nBiases);
  }

  inline void copy(const Parameters* const tgt) const
  {
    assert(nParams == tgt->nParams);
    #pragma omp parallel for schedule(static)
    for (Uint j=0; j<nParams; j++) params[j] = tgt->params[j];
  }

  // this = polyak * this + (1 - polyak) * src
  inline void softUpdate(const Parameters* const src, const nnReal polyak) const
  {
    assert(nParams == src->nParams);
    nnReal* const dst = params;
    const nnReal* const net = src->params;
    #pragma omp parallel for schedule(static)
    for (Uint j=0; j<nParams; j++) dst[j] += (1-polyak) * (net[j] - dst[j]);
  }

  long double compute_weight_norm() const
  {
    long double sumWeights = 0;
    #pragma omp parallel for reduction(+:sumWeights)
    for (Uint w=0; w<nParams; w++)
      sumWeights += std::fabs(params[w]);
    return sumWeights;
  }

  inline void clear() const {
    std::memset(params, 0, nParams*sizeof(nnReal));
  }

  // per-layer weights and biases, in order, excluding alignment padding
  ParameterBlob makeBlob() const
  {
    ParameterBlob ret;
    for(Uint i=0; i<nLayers; ++i) {
      ret.add(NW(i), W(i));
      ret.add(NB(i), B(i));
    }
    return ret;
  }

  void save(FILE * const wFile) const {
    fwrite(params, sizeof(nnReal), nParams, wFile);
  }
  void restart(FILE * const rFile) const {
    const size_t wsize = fread(params, sizeof(nnReal), nParams, rFile);
    if(wsize not_eq nParams)
      throw std::runtime_error("Mismatch in restarted parameters: read " +
        std::to_string(wsize) + " expected " + std::to_string(nParams));
  }

  inline nnReal* W(const Uint layerID) const {
    assert(layerID < nLayers);
    return params + indWeights[layerID];
  }
  inline nnReal* B(const Uint layerID) const {
    assert(layerID < nLayers);
    return params + indBiases[layerID];
  }
  inline Uint NW(const Uint layerID) const {
    assert(layerID < nLayers);
    return nWeights[layerID];
  }
  inline Uint NB(const Uint layerID) const {
    assert(layerID < nLayers);
    return nBiases[layerID];
  }
};

} // end namespace hindsight
#endif // hindsight_Parameters_h
