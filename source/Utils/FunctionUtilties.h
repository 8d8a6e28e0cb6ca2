//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_FunctionUtilties_h
#define hindsight_FunctionUtilties_h

#include "Definitions.h"

#include <algorithm>
#include <cmath> // sqrt, isnan, ...
#include <cstdlib>
#include <cstring>
#include <new>

namespace hindsight
{

#define VEC_WIDTH 32
#define ARY_WIDTH (VEC_WIDTH/static_cast<Uint>(sizeof(nnReal)))

namespace Utilities
{

template <typename T>
inline bool isValidValue(const T vals) {
  return ( not std::isnan(vals) ) and ( not std::isinf(vals) );
}

template <typename T>
inline T clip(const T val, const T ub, const T lb)
{
  return std::max(std::min(val, ub), lb);
}

inline Uint roundUpSimd(const Real N)
{
  return std::ceil(N/ARY_WIDTH)*ARY_WIDTH;
}

inline nnReal* allocate_dirty(const Uint _size)
{
  void* ret = nullptr;
  const size_t nBytes = std::max(roundUpSimd(_size), ARY_WIDTH) * sizeof(nnReal);
  if(posix_memalign(&ret, VEC_WIDTH, nBytes) not_eq 0) throw std::bad_alloc();
  return static_cast<nnReal*>(ret);
}

inline nnReal* allocate_ptr(const Uint _size)
{
  nnReal* ret = allocate_dirty(_size);
  memset(ret, 0, std::max(roundUpSimd(_size), ARY_WIDTH) * sizeof(nnReal));
  return ret;
}

} // end namespace Utilities

} // end namespace hindsight
#endif // hindsight_FunctionUtilties_h
