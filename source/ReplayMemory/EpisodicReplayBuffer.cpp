//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "EpisodicReplayBuffer.h"
#include "../Utils/Errors.h"
#include "../Utils/Warnings.h"

#include <string>

namespace hindsight
{

static Uint episodeCapacity(const MDPdescriptor& MDP, const Uint bufferSize)
{
  if(MDP.maxTimesteps == 0)
    throw InvalidConfigurationError("episode length must be positive");
  const Uint nSlots = bufferSize / MDP.maxTimesteps;
  if(nSlots == 0)
    throw InvalidConfigurationError("buffer of " + std::to_string(bufferSize)
      + " transitions cannot hold an episode of "
      + std::to_string(MDP.maxTimesteps) + " steps");
  return nSlots;
}

EpisodicReplayBuffer::EpisodicReplayBuffer(const MDPdescriptor& MDP_,
  const Uint bufferSize, const sampleFunction_t& sampler, std::mt19937& gen)
  : MDP(MDP_), capacity(episodeCapacity(MDP_, bufferSize)),
  sampleFunction(sampler), generator(gen), episodes(MDP_, capacity)
{
  if(not sampleFunction)
    throw InvalidConfigurationError("replay buffer needs a sample function");
}

void EpisodicReplayBuffer::storeEpisode(const EpisodeBatch& batch)
{
  // validate everything before touching the storage
  for(const Episode& EP : batch) checkEpisodeShape(EP, MDP);

  std::lock_guard<std::mutex> lock(dataset_mutex);
  for(const Episode& EP : batch)
  {
    episodes.write(writeCursor, EP);
    writeCursor = (writeCursor + 1) % capacity;
    episodes.setNumberOfEpisodes(episodes.nEpisodes() + 1);
    nSeenEpisodes++;
    nSeenTransitions += EP.ndata();
  }
  debugM("Stored %lu episodes, buffer holds %u of %u, next slot %u",
    batch.size(), episodes.nEpisodes(), capacity, writeCursor);
}

Transitions EpisodicReplayBuffer::sample(const Uint batchSize) const
{
  std::lock_guard<std::mutex> lock(dataset_mutex);
  if(episodes.nEpisodes() == 0)
    throw EmptyBufferError("cannot sample from an empty replay buffer");
  return sampleFunction(episodes, batchSize, generator);
}

Episode EpisodicReplayBuffer::getEpisode(const Uint slot) const
{
  std::lock_guard<std::mutex> lock(dataset_mutex);
  if(slot >= episodes.nEpisodes())
    throw std::out_of_range("episode slot " + std::to_string(slot) +
      " does not hold data");
  return episodes.read(slot);
}

Uint EpisodicReplayBuffer::currentSize() const
{
  std::lock_guard<std::mutex> lock(dataset_mutex);
  return episodes.nEpisodes();
}

} // end namespace hindsight
