//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_Errors_h
#define hindsight_Errors_h

#include <stdexcept>
#include <string>

namespace hindsight
{

// Sampling from a replay buffer that holds no episode.
struct EmptyBufferError : public std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// Episode arrays with inconsistent lengths or feature sizes.
struct ShapeMismatchError : public std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// Workers disagree on the list of tensors taking part in a collective.
struct TopologyMismatchError : public std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// Unknown replay strategy, negative replay_k, out of range settings.
struct InvalidConfigurationError : public std::runtime_error
{
  using std::runtime_error::runtime_error;
};

} // end namespace hindsight
#endif // hindsight_Errors_h
