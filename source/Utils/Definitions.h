//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Definitions_h
#define hindsight_Definitions_h

#include <vector>
#include <limits>

namespace hindsight
{

typedef unsigned Uint;
typedef long Sint;
////////////////////////////////////////////////////////////////////////////////
#if 1 // MAIN CODE PRECISION
using Real = double;
#define MPI_VALUE_TYPE MPI_DOUBLE
#else
using Real = float;
#define MPI_VALUE_TYPE MPI_FLOAT
#endif
///////////////////////////////////////////////////////////////////////////////
#ifndef SINGLE_PREC // NETWORK PRECISION
  #define gemm cblas_dgemm
  using nnReal = double;
  #define MPI_NNVALUE_TYPE MPI_DOUBLE
  #define EXP_CUT 16 //prevent under/over flow with exponentials
#else
  #define gemm cblas_sgemm
  using nnReal = float;
  #define MPI_NNVALUE_TYPE MPI_FLOAT
  #define EXP_CUT 8 //prevent under/over flow with exponentials
#endif
#define nnEPS std::numeric_limits<float>::epsilon()
////////////////////////////////////////////////////////////////////////////////
// Data format for storage in the episode buffer. Switch to float when the
// buffer grows in the order of GBs.
#ifndef SINGLE_PREC
using memReal = double;
#else
using memReal = float;
#endif

typedef std::vector<memReal> Mvec;
typedef std::vector<Real> Rvec;
typedef std::vector<nnReal> NNvec;
typedef std::vector<long double> LDvec;

} // end namespace hindsight
#endif // hindsight_Definitions_h
