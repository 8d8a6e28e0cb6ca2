//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#ifndef hindsight_DistributedSync_h
#define hindsight_DistributedSync_h

#include "../Utils/ParameterBlob.h"
#include "../Utils/MPIUtilities.h"

namespace hindsight
{

class Network;

// Keeps the replicas of the networks trained by the workers identical:
// parameters are broadcast once by the coordinator and gradients are averaged
// before every optimizer step. All methods are collectives over the
// communicator given at construction.
class DistributedSync
{
  const MPI_Comm comm;
  const Uint nWorkers = MPICommSize(comm);
  const Uint myRank = MPICommRank(comm);
  const bool bIsCoordinator;
  // rank (in comm) of the unique worker constructed with isCoordinator:
  const Uint coordinatorRank;
  NNvec gradBuffer;

  Uint findCoordinator() const;

 public:
  enum ReduceOp { SUM, MAX, MIN };

  DistributedSync(const MPI_Comm C, const bool isCoordinator);
  ~DistributedSync();

  DistributedSync(const DistributedSync&) = delete;
  DistributedSync& operator=(const DistributedSync&) = delete;

  // Throws TopologyMismatchError on every worker if any worker passes a list
  // of tensors with a different number of tensors or different sizes.
  void checkTopology(const ParameterBlob& blob) const;

  // coordinator values overwrite the tensors of every other worker
  void syncParameters(const ParameterBlob& blob) const;
  // in-place sum across workers divided by the number of workers
  void syncGradients(const ParameterBlob& blob);

  void syncNetworks(const Network& net) const;
  void syncGrads(const Network& net);

  Real allreduceScalar(const Real value, const ReduceOp op = SUM) const;

  Uint getNWorkers() const { return nWorkers; }
  Uint getRank() const { return myRank; }
  bool isCoordinator() const { return bIsCoordinator; }
};

} // end namespace hindsight
#endif // hindsight_DistributedSync_h
