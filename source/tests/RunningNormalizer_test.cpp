//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "../ReplayMemory/RunningNormalizer.h"
#include "../Utils/Errors.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

namespace hindsight
{
namespace test
{

TEST(RunningNormalizer, IdentityBeforeStatistics)
{
  RunningNormalizer norm(2, 5, 1e-4);
  EXPECT_EQ(norm.getMean(), Rvec({0, 0}));
  EXPECT_EQ(norm.getStd(), Rvec({1, 1}));
  EXPECT_EQ(norm.normalize({0.5, -2}), Rvec({0.5, -2}));
  // recomputing with no data keeps the identity
  norm.recomputeStats();
  EXPECT_EQ(norm.getStd(), Rvec({1, 1}));
  EXPECT_EQ(norm.getCount(), 0);
}

TEST(RunningNormalizer, StatisticsChangeOnlyOnRecompute)
{
  RunningNormalizer norm(2, 5, 1e-4);
  // rows (1,10) (2,10) (3,10) (4,10)
  norm.update({1, 10, 2, 10, 3, 10, 4, 10});
  EXPECT_EQ(norm.getMean(), Rvec({0, 0}));

  norm.recomputeStats();
  EXPECT_EQ(norm.getCount(), 4);
  EXPECT_NEAR(norm.getMean()[0], 2.5, 1e-12);
  EXPECT_NEAR(norm.getStd()[0], std::sqrt(1.25), 1e-12);
  // constant component: variance is floored at eps
  EXPECT_NEAR(norm.getMean()[1], 10, 1e-12);
  EXPECT_NEAR(norm.getStd()[1], 1e-2, 1e-12);

  // no new data: recomputing changes nothing
  const Rvec mean = norm.getMean(), stdev = norm.getStd();
  norm.update(Rvec());
  norm.recomputeStats();
  EXPECT_EQ(norm.getMean(), mean);
  EXPECT_EQ(norm.getStd(), stdev);
  EXPECT_EQ(norm.getCount(), 4);

  // statistics accumulate over all recomputes
  norm.update({5, 10});
  norm.recomputeStats();
  EXPECT_EQ(norm.getCount(), 5);
  EXPECT_NEAR(norm.getMean()[0], 3, 1e-12);
  EXPECT_NEAR(norm.getStd()[0], std::sqrt(2.0), 1e-12);
}

TEST(RunningNormalizer, NormalizesAndClipsRows)
{
  RunningNormalizer norm(1, 5, 1e-4);
  norm.update({1, 3});
  norm.recomputeStats(); // mean 2, std 1

  const Rvec y = norm.normalize({2, 3, 0, 100, -100});
  ASSERT_EQ(y.size(), 5u);
  EXPECT_NEAR(y[0], 0, 1e-12);
  EXPECT_NEAR(y[1], 1, 1e-12);
  EXPECT_NEAR(y[2], -2, 1e-12);
  EXPECT_EQ(y[3], 5);
  EXPECT_EQ(y[4], -5);
}

TEST(RunningNormalizer, RejectsWrongShapes)
{
  RunningNormalizer norm(3, 5, 1e-4);
  EXPECT_THROW(norm.update({1, 2}), ShapeMismatchError);
  EXPECT_THROW(norm.normalize({1, 2, 3, 4}), ShapeMismatchError);
  EXPECT_THROW({ RunningNormalizer empty(0, 5, 1e-4); },
               InvalidConfigurationError);
}

TEST(RunningNormalizer, SumsStatisticsOfAllWorkers)
{
  const Uint rank = MPICommRank(MPI_COMM_WORLD);
  const Uint size = MPICommSize(MPI_COMM_WORLD);
  RunningNormalizer norm(1, 1e3, 1e-4, MPI_COMM_WORLD);
  // worker r contributes r+1 samples equal to r
  norm.update(Rvec(rank+1, (Real) rank));
  norm.recomputeStats();

  long double n = 0, S = 0, S2 = 0;
  for(Uint r=0; r<size; ++r) { n += r+1; S += r*(r+1.0); S2 += r*r*(r+1.0); }
  const long double mean = S / n;
  const long double var = std::max((long double) 1e-4, S2/n - mean*mean);
  EXPECT_EQ(norm.getCount(), n);
  EXPECT_NEAR(norm.getMean()[0], (Real) mean, 1e-12);
  EXPECT_NEAR(norm.getStd()[0], (Real) std::sqrt(var), 1e-12);
}

TEST(RunningNormalizer, RestartsFromFile)
{
  RunningNormalizer norm(2, 5, 1e-4), restarted(2, 5, 1e-4);
  norm.update({1, -1, 3, 5});
  norm.recomputeStats();

  FILE * tmp = tmpfile();
  ASSERT_NE(tmp, nullptr);
  norm.save(tmp);
  rewind(tmp);
  restarted.restart(tmp);
  EXPECT_EQ(restarted.getMean(), norm.getMean());
  EXPECT_EQ(restarted.getStd(), norm.getStd());
  EXPECT_THROW(restarted.restart(tmp), std::runtime_error);
  fclose(tmp);
}

} // end namespace test
} // end namespace hindsight
