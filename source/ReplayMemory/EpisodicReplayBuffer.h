//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_EpisodicReplayBuffer_h
#define hindsight_EpisodicReplayBuffer_h

#include "EpisodeStorage.h"
#include "Transitions.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <random>

namespace hindsight
{

// the relabeling function injected in the buffer (see HERsampler::sample)
using sampleFunction_t = std::function<Transitions(const EpisodeStorage&,
                                                   const Uint,
                                                   std::mt19937&)>;

class EpisodicReplayBuffer
{
 public:
  const MDPdescriptor MDP;
  // number of episode slots: bufferSize / maxTimesteps
  const Uint capacity;

 private:
  const sampleFunction_t sampleFunction;
  std::mt19937& generator;

  EpisodeStorage episodes;
  mutable std::mutex dataset_mutex;

  Uint writeCursor = 0;
  std::atomic<long> nSeenEpisodes{0};
  std::atomic<long> nSeenTransitions{0};

 public:
  EpisodicReplayBuffer(const MDPdescriptor& MDP_, const Uint bufferSize,
                       const sampleFunction_t& sampler, std::mt19937& gen);

  // Writes each episode into the next circular slot, overwriting the oldest
  // once the buffer is full. If any episode has inconsistent shapes the
  // whole batch is rejected with ShapeMismatchError and nothing is stored.
  void storeEpisode(const EpisodeBatch& batch);

  // Draws batchSize transitions (with replacement) through the relabeling
  // function. Throws EmptyBufferError if no episode was ever stored.
  Transitions sample(const Uint batchSize) const;

  // copy of the episode currently held in slot
  Episode getEpisode(const Uint slot) const;

  Uint currentSize() const;
  long readNSeenEpisodes() const { return nSeenEpisodes.load(); }
  long readNSeenTransitions() const { return nSeenTransitions.load(); }
};

} // end namespace hindsight
#endif // hindsight_EpisodicReplayBuffer_h
