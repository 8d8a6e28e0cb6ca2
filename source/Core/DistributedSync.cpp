//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "DistributedSync.h"
#include "../Network/Network.h"
#include "../Utils/Errors.h"
#include "../Utils/Warnings.h"

#include <algorithm>
#include <string>

namespace hindsight
{

DistributedSync::DistributedSync(const MPI_Comm C, const bool isCoordinator) :
  comm(MPICommDup(C)), bIsCoordinator(isCoordinator),
  coordinatorRank(findCoordinator())
{
  debugS("worker %u of %u, coordinator is rank %u",
    myRank, nWorkers, coordinatorRank);
}

DistributedSync::~DistributedSync()
{
  if(comm not_eq MPI_COMM_NULL) {
    MPI_Comm tmp = comm;
    MPI_Comm_free(&tmp);
  }
}

Uint DistributedSync::findCoordinator() const
{
  if(comm == MPI_COMM_NULL)
    throw TopologyMismatchError("synchronization layer without communicator");
  MPI_Comm_set_errhandler(comm, MPI_ERRORS_RETURN);
  unsigned flags[2] = { bIsCoordinator? 1u : 0u, bIsCoordinator? myRank : 0u };
  MPI(Allreduce, MPI_IN_PLACE, flags, 2, MPI_UNSIGNED, MPI_SUM, comm);
  if(flags[0] not_eq 1)
    throw TopologyMismatchError("expected exactly one coordinator, found "
      + std::to_string(flags[0]));
  return flags[1];
}

void DistributedSync::checkTopology(const ParameterBlob& blob) const
{
  // FNV-1a hash of the ordered tensor sizes
  unsigned long long hash = 14695981039346656037ULL;
  for(const auto& data : blob) {
    hash ^= (unsigned long long) data.first;
    hash *= 1099511628211ULL;
  }
  const unsigned long long local[3] = {
    (unsigned long long) blob.nTensors(),
    (unsigned long long) blob.totalSize(), hash
  };
  // max of x and max of ~x (i.e. ~min of x) in one reduction. All workers
  // agree on the outcome: every field must have max == min.
  unsigned long long buf[6];
  for(Uint i=0; i<3; ++i) { buf[i] = local[i]; buf[3+i] = ~local[i]; }
  MPI(Allreduce, MPI_IN_PLACE, buf, 6, MPI_UNSIGNED_LONG_LONG, MPI_MAX, comm);
  for(Uint i=0; i<3; ++i)
    if(buf[i] not_eq ~buf[3+i])
      throw TopologyMismatchError("workers disagree on tensor list: local "
        + std::to_string(blob.nTensors()) + " tensors of total size "
        + std::to_string(blob.totalSize()));
}

void DistributedSync::syncParameters(const ParameterBlob& blob) const
{
  checkTopology(blob);
  for(const auto& data : blob)
    MPI(Bcast, data.second, data.first, MPI_NNVALUE_TYPE,
        coordinatorRank, comm);
}

void DistributedSync::syncGradients(const ParameterBlob& blob)
{
  checkTopology(blob);
  const Uint totSize = blob.totalSize();
  gradBuffer.resize(totSize);
  Uint offset = 0;
  for(const auto& data : blob) {
    std::copy(data.second, data.second + data.first,
              gradBuffer.data() + offset);
    offset += data.first;
  }

  MPI(Allreduce, MPI_IN_PLACE, gradBuffer.data(), totSize, MPI_NNVALUE_TYPE,
      MPI_SUM, comm);

  const nnReal factor = nWorkers;
  offset = 0;
  for(const auto& data : blob) {
    for(Uint i=0; i<data.first; ++i)
      data.second[i] = gradBuffer[offset + i] / factor;
    offset += data.first;
  }
}

void DistributedSync::syncNetworks(const Network& net) const
{
  syncParameters(net.parameters());
}

void DistributedSync::syncGrads(const Network& net)
{
  syncGradients(net.gradientsBlob());
}

Real DistributedSync::allreduceScalar(const Real value, const ReduceOp op) const
{
  Real ret = value;
  MPI_Op mpiOp = MPI_SUM;
  if(op == MAX) mpiOp = MPI_MAX;
  if(op == MIN) mpiOp = MPI_MIN;
  MPI(Allreduce, MPI_IN_PLACE, &ret, 1, MPI_VALUE_TYPE, mpiOp, comm);
  return ret;
}

} // end namespace hindsight
