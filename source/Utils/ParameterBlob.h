//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_ParameterBlob_h
#define hindsight_ParameterBlob_h

#include "Definitions.h"
#include <utility>
#include <vector>

namespace hindsight
{

// Ordered list of the tensors (size and pointer to first element) that take
// part in a collective. The order is the order of insertion and must be the
// same on every worker. Memory is owned by whoever adds it.
class ParameterBlob
{
  using dataInfo = std::pair<Uint, nnReal*>;
  std::vector<dataInfo> dataList;

 public:
  ParameterBlob() {}

  void add(const Uint size, nnReal * const data) {
    dataList.emplace_back(std::make_pair(size, data));
  }

  Uint nTensors() const { return dataList.size(); }
  Uint size(const Uint i) const { return dataList[i].first; }
  nnReal * data(const Uint i) const { return dataList[i].second; }

  Uint totalSize() const {
    Uint ret = 0;
    for(const auto& data : dataList) ret += data.first;
    return ret;
  }

  std::vector<dataInfo>::const_iterator begin() const {
    return dataList.begin();
  }
  std::vector<dataInfo>::const_iterator end() const {
    return dataList.end();
  }
};

} // end namespace hindsight
#endif // hindsight_ParameterBlob_h
