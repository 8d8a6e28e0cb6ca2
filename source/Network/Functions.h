//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Functions_h
#define hindsight_Functions_h

#include "../Utils/Definitions.h"
#include "../Utils/Errors.h"

#include <cmath>
#include <cstring>
#include <string>

#ifndef PRELU_FAC
#define PRELU_FAC 0.01
#endif

namespace hindsight
{

typedef nnReal* __restrict__       const nnOpRet;
typedef const nnReal* __restrict__ const nnOpInp;

//List of non-linearities for neural networks
//- eval return f(in), also present as array in / array out
//- evalDiff returns f'(x)
//- initFactor: some prefer fan in fan out, some only fan-in dependency
//If adding a new function, edit function makeFunction at end of file

struct Function
{
  //weights are initialized with uniform distrib [-initFactor, initFactor]
  virtual Real initFactor(const Uint inps, const Uint outs) const = 0;

  virtual void eval(nnOpInp in, nnOpRet out, const Uint N) const = 0; // f(in)

  virtual nnReal eval(const nnReal in) const = 0;
  virtual nnReal evalDiff(const nnReal in) const = 0; // f'(in)

  virtual std::string name() const = 0;
  virtual ~Function() {}
};

struct Linear : public Function
{
  Real initFactor(const Uint inps, const Uint outs) const override {
    return std::sqrt(2./inps);
  }
  static inline nnReal _eval(const nnReal in) {
    return in;
  }
  static inline nnReal _evalDiff(const nnReal in) {
    return 1;
  }
  void eval(nnOpInp in, nnOpRet out, const Uint N) const override {
    memcpy(out, in, N*sizeof(nnReal));
  }
  nnReal eval(const nnReal in) const override {
    return in;
  }
  nnReal evalDiff(const nnReal in) const override {
    return 1;
  }
  std::string name() const override { return "Linear"; }
};

struct Tanh : public Function
{
  Real initFactor(const Uint inps, const Uint outs) const override {
    return std::sqrt(6./(inps + outs));
  }
  static inline nnReal _eval(const nnReal in) {
    if(in >   EXP_CUT) return  1;
    if(in < - EXP_CUT) return -1;
    if(in > 0) {
      const nnReal e2x = std::exp(-2*in);
      return (1-e2x)/(1+e2x);
    } else {
      const nnReal e2x = std::exp( 2*in);
      return (e2x-1)/(1+e2x);
    }
  }
  static inline nnReal _evalDiff(const nnReal in) {
    const nnReal arg = in < 0? -in : in; //symmetric
    const nnReal e2x = std::exp(-2*arg);
    if (arg > EXP_CUT) return 4*e2x;
    return 4*e2x/((1+e2x)*(1+e2x));
  }
  void eval(nnOpInp in, nnOpRet out, const Uint N) const override {
    for(Uint i=0; i<N; i++) out[i] = _eval(in[i]);
  }
  nnReal eval(const nnReal in) const override {
    return _eval(in);
  }
  nnReal evalDiff(const nnReal in) const override {
    return _evalDiff(in);
  }
  std::string name() const override { return "Tanh"; }
};

struct Sigm : public Function
{
  Real initFactor(const Uint inps, const Uint outs) const override {
    return std::sqrt(6./(inps + outs));
  }
  static inline nnReal _eval(const nnReal in) {
    if(in >  2*EXP_CUT) return 1;
    if(in < -2*EXP_CUT) return 0;
    if(in > 0) return 1/(1+std::exp(-in));
    else {
      const nnReal ex = std::exp(in);
      return ex/(1+ex);
    }
  }
  static inline nnReal _evalDiff(const nnReal in) {
    const nnReal arg = in < 0 ? -in : in;
    const nnReal ex = std::exp(-arg);
    if (arg > 2*EXP_CUT) return ex;
    return ex/((1+ex)*(1+ex));
  }
  void eval(nnOpInp in, nnOpRet out, const Uint N) const override {
    for(Uint i=0; i<N; i++) out[i] = _eval(in[i]);
  }
  nnReal eval(const nnReal in) const override {
    return _eval(in);
  }
  nnReal evalDiff(const nnReal in) const override {
    return _evalDiff(in);
  }
  std::string name() const override { return "Sigm"; }
};

struct Relu : public Function
{
  Real initFactor(const Uint inps, const Uint outs) const override {
    return std::sqrt(2./inps);
  }
  static inline nnReal _eval(const nnReal in) {
    return in>0 ? in : 0;
  }
  static inline nnReal _evalDiff(const nnReal in) {
    return in>0 ? 1 : 0;
  }
  void eval(nnOpInp in, nnOpRet out, const Uint N) const override {
    #pragma omp simd
    for (Uint i=0;i<N; i++) out[i] = in[i]>0 ? in[i] : 0;
  }
  nnReal eval(const nnReal in) const override {
    return _eval(in);
  }
  nnReal evalDiff(const nnReal in) const override {
    return _evalDiff(in);
  }
  std::string name() const override { return "Relu"; }
};

struct PRelu : public Function
{
  Real initFactor(const Uint inps, const Uint outs) const override {
    return std::sqrt(2./inps);
  }
  static inline nnReal _eval(const nnReal in) {
    return in>0 ? in : PRELU_FAC*in;
  }
  static inline nnReal _evalDiff(const nnReal in) {
    return in>0 ? 1 : PRELU_FAC;
  }
  void eval(nnOpInp in, nnOpRet out, const Uint N) const override {
    #pragma omp simd
    for (Uint i=0;i<N; i++) out[i] = in[i]>0 ? in[i] : PRELU_FAC*in[i];
  }
  nnReal eval(const nnReal in) const override {
    return _eval(in);
  }
  nnReal evalDiff(const nnReal in) const override {
    return _evalDiff(in);
  }
  std::string name() const override { return "PRelu"; }
};

inline Function* makeFunction(const std::string name) {
  if (name == "Linear") return new Linear();
  else
  if (name == "Tanh")   return new Tanh();
  else
  if (name == "Sigm")   return new Sigm();
  else
  if (name == "Relu")   return new Relu();
  else
  if (name == "PRelu")  return new PRelu();
  else
  throw InvalidConfigurationError("Activation function not recognized: "+name);
}

} // end namespace hindsight
#endif // hindsight_Functions_h
