//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "../Core/DistributedSync.h"
#include "../Network/Network.h"
#include "../Utils/Errors.h"

#include <gtest/gtest.h>

namespace hindsight
{
namespace test
{

// true if every worker holds the same values in v
static bool identicalOnAllWorkers(const NNvec& v, const MPI_Comm comm)
{
  NNvec vmax = v, vmin = v;
  MPI_Allreduce(MPI_IN_PLACE, vmax.data(), v.size(), MPI_NNVALUE_TYPE,
                MPI_MAX, comm);
  MPI_Allreduce(MPI_IN_PLACE, vmin.data(), v.size(), MPI_NNVALUE_TYPE,
                MPI_MIN, comm);
  return vmax == v and vmin == v;
}

class DistributedSyncTest : public ::testing::Test
{
 protected:
  const Uint rank = MPICommRank(MPI_COMM_WORLD);
  const Uint size = MPICommSize(MPI_COMM_WORLD);
};

TEST_F(DistributedSyncTest, RequiresExactlyOneCoordinator)
{
  EXPECT_THROW({ DistributedSync none(MPI_COMM_WORLD, false); },
               TopologyMismatchError);
  if(size > 1)
    EXPECT_THROW({ DistributedSync all(MPI_COMM_WORLD, true); },
                 TopologyMismatchError);
  EXPECT_THROW({ DistributedSync noComm(MPI_COMM_NULL, true); },
               TopologyMismatchError);
}

TEST_F(DistributedSyncTest, CoordinatorValuesOverwriteReplicas)
{
  // last rank is the coordinator
  DistributedSync sync(MPI_COMM_WORLD, rank == size-1);
  EXPECT_EQ(sync.getNWorkers(), size);
  EXPECT_EQ(sync.isCoordinator(), rank == size-1);

  NNvec A(7, rank), B(3, -(nnReal) rank);
  ParameterBlob blob;
  blob.add(A.size(), A.data());
  blob.add(B.size(), B.data());
  sync.syncParameters(blob);
  EXPECT_EQ(A, NNvec(7, size-1));
  EXPECT_EQ(B, NNvec(3, -(nnReal) (size-1)));
}

TEST_F(DistributedSyncTest, GradientsAreAveraged)
{
  DistributedSync sync(MPI_COMM_WORLD, rank == 0);
  NNvec A(5, rank + 1), B(2, 2 * (rank + 1));
  ParameterBlob blob;
  blob.add(A.size(), A.data());
  blob.add(B.size(), B.data());
  sync.syncGradients(blob);
  const nnReal mean = (size + 1) / (nnReal) 2;
  for(const nnReal a : A) EXPECT_DOUBLE_EQ(a, mean);
  for(const nnReal b : B) EXPECT_DOUBLE_EQ(b, 2 * mean);
}

TEST_F(DistributedSyncTest, DetectsDifferentTensorLists)
{
  if(size < 2) GTEST_SKIP() << "needs at least two workers";
  DistributedSync sync(MPI_COMM_WORLD, rank == 0);
  NNvec A(4, 1), B(4, 1);

  // one worker has an extra tensor
  ParameterBlob extra;
  extra.add(A.size(), A.data());
  if(rank == 1) extra.add(B.size(), B.data());
  EXPECT_THROW(sync.syncGradients(extra), TopologyMismatchError);

  // same number of tensors and same total size, different shapes
  ParameterBlob reshaped;
  reshaped.add(rank == 1 ? 3 : 1, A.data());
  reshaped.add(rank == 1 ? 1 : 3, B.data());
  EXPECT_THROW(sync.syncParameters(reshaped), TopologyMismatchError);
  // nothing was reduced
  EXPECT_EQ(A, NNvec(4, 1));

  // the layer is still usable after a mismatch
  ParameterBlob same;
  same.add(A.size(), A.data());
  EXPECT_NO_THROW(sync.syncGradients(same));
}

TEST_F(DistributedSyncTest, ReducesScalars)
{
  DistributedSync sync(MPI_COMM_WORLD, rank == 0);
  EXPECT_DOUBLE_EQ(sync.allreduceScalar(1), size);
  EXPECT_DOUBLE_EQ(sync.allreduceScalar(rank, DistributedSync::MAX), size-1);
  EXPECT_DOUBLE_EQ(sync.allreduceScalar(rank, DistributedSync::MIN), 0);
}

TEST_F(DistributedSyncTest, NetworkReplicasBecomeIdentical)
{
  DistributedSync sync(MPI_COMM_WORLD, rank == 0);
  Network net(3, {8, 8}, 2, "Tanh", "Linear");
  std::mt19937 gen(17 + rank);
  net.initialize(gen);
  sync.syncNetworks(net);
  const NNvec params(net.weights->params,
                     net.weights->params + net.weights->nParams);
  EXPECT_TRUE(identicalOnAllWorkers(params, MPI_COMM_WORLD));
}

} // end namespace test
} // end namespace hindsight
