// Tests for walker/kernel.h -- membership metric and clipped stamping.

#include "walker/kernel.h"

#include <gtest/gtest.h>

#include <vector>

#include "core/weighted_sampler.h"
#include "map/grid.h"

namespace cavewalk {
namespace {

// ---------------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------------

TEST(KernelTest, RadiusZeroIsSingleCell) {
  Kernel kernel(0, 0.0f);
  EXPECT_EQ(kernel.diameter(), 1u);
  EXPECT_EQ(kernel.cellCount(), 1u);
  EXPECT_TRUE(kernel.contains(0, 0));
  EXPECT_FALSE(kernel.contains(1, 0));
  EXPECT_FALSE(kernel.isEdge(0, 0));
}

TEST(KernelTest, RadiusOneDiscIsPlus) {
  Kernel kernel(1, 0.0f);
  EXPECT_EQ(kernel.cellCount(), 5u);
  EXPECT_TRUE(kernel.contains(0, -1));
  EXPECT_TRUE(kernel.contains(1, 0));
  EXPECT_FALSE(kernel.contains(1, 1));
}

TEST(KernelTest, RadiusOneSquareIsFull) {
  Kernel kernel(1, 1.0f);
  EXPECT_EQ(kernel.cellCount(), 9u);
  EXPECT_TRUE(kernel.contains(1, 1));
  EXPECT_TRUE(kernel.contains(-1, -1));
}

TEST(KernelTest, RadiusTwoDisc) {
  Kernel kernel(2, 0.0f);
  EXPECT_EQ(kernel.diameter(), 5u);
  EXPECT_EQ(kernel.cellCount(), 13u);
  EXPECT_TRUE(kernel.contains(2, 0));
  EXPECT_TRUE(kernel.contains(1, 1));
  EXPECT_FALSE(kernel.contains(2, 1));
  EXPECT_FALSE(kernel.contains(3, 0));
}

TEST(KernelTest, EdgeBandIsOuterRing) {
  Kernel kernel(2, 0.0f);
  EXPECT_TRUE(kernel.isEdge(2, 0));
  EXPECT_TRUE(kernel.isEdge(1, 1));
  EXPECT_FALSE(kernel.isEdge(1, 0));
  EXPECT_FALSE(kernel.isEdge(0, 0));
  EXPECT_FALSE(kernel.isEdge(2, 2));
}

TEST(KernelTest, CircularityIsClamped) {
  EXPECT_FLOAT_EQ(Kernel(2, 1.5f).circularity(), 1.0f);
  EXPECT_FLOAT_EQ(Kernel(2, -1.0f).circularity(), 0.0f);
  EXPECT_EQ(Kernel(2, 1.5f), Kernel(2, 1.0f));
  EXPECT_NE(Kernel(2, 0.0f), Kernel(3, 0.0f));
}

TEST(KernelTest, BlendedDistanceMixesMetrics) {
  Kernel kernel(3, 0.5f);
  // Euclid 5, Chebyshev 4.
  EXPECT_FLOAT_EQ(kernel.blendedDistance(3, 4), 4.5f);
}

TEST(KernelTest, OverwritePolicies) {
  EXPECT_TRUE(isOverwritable(CellType::Empty, OverwritePolicy::All));
  EXPECT_TRUE(isOverwritable(CellType::Freeze, OverwritePolicy::SolidOnly));
  EXPECT_FALSE(isOverwritable(CellType::Empty, OverwritePolicy::SolidOnly));
  EXPECT_FALSE(isOverwritable(CellType::Start, OverwritePolicy::SolidOnly));
  EXPECT_TRUE(isOverwritable(CellType::Hookable, OverwritePolicy::HookableOnly));
  EXPECT_FALSE(isOverwritable(CellType::Freeze, OverwritePolicy::HookableOnly));
}

// ---------------------------------------------------------------------------
// stampKernel
// ---------------------------------------------------------------------------

TEST(StampKernelTest, WritesContainedCells) {
  Grid grid(9, 9, CellType::Hookable, Position(4, 4));
  WeightedSampler sampler(42);
  StampOptions opts;
  EXPECT_EQ(stampKernel(grid, Kernel(2, 0.0f), Position(4, 4), opts, sampler), 13u);
  EXPECT_EQ(grid.count(CellType::Empty), 13u);
  EXPECT_EQ(grid.at(6, 4), CellType::Empty);
  EXPECT_EQ(grid.at(6, 5), CellType::Hookable);
}

TEST(StampKernelTest, ClipsAtGridEdge) {
  Grid grid(5, 5, CellType::Hookable, Position(0, 0));
  WeightedSampler sampler(42);
  StampOptions opts;
  EXPECT_EQ(stampKernel(grid, Kernel(1, 1.0f), Position(0, 0), opts, sampler), 4u);
  EXPECT_EQ(grid.at(1, 1), CellType::Empty);
}

TEST(StampKernelTest, SolidOnlyKeepsCarvedCells) {
  Grid grid(9, 9, CellType::Hookable, Position(4, 4));
  WeightedSampler sampler(42);
  grid.at(4, 4) = CellType::Empty;
  grid.at(5, 4) = CellType::Finish;

  StampOptions opts;
  opts.type = CellType::Freeze;
  opts.policy = OverwritePolicy::SolidOnly;
  size_t written = stampKernel(grid, Kernel(1, 1.0f), Position(4, 4), opts, sampler);
  EXPECT_EQ(written, 7u);
  EXPECT_EQ(grid.at(4, 4), CellType::Empty);
  EXPECT_EQ(grid.at(5, 4), CellType::Finish);
  EXPECT_EQ(grid.at(3, 3), CellType::Freeze);
}

TEST(StampKernelTest, LockedCellsAreSkipped) {
  Grid grid(9, 9, CellType::Hookable, Position(4, 4));
  WeightedSampler sampler(42);
  std::vector<bool> locked(81, false);
  locked[grid.index(4, 3)] = true;

  StampOptions opts;
  opts.locked = &locked;
  EXPECT_EQ(stampKernel(grid, Kernel(1, 0.0f), Position(4, 4), opts, sampler), 4u);
  EXPECT_EQ(grid.at(4, 3), CellType::Hookable);
}

TEST(StampKernelTest, ZeroEdgeProbabilityCarvesOnlyCore) {
  Grid grid(9, 9, CellType::Hookable, Position(4, 4));
  WeightedSampler sampler(42);
  StampOptions opts;
  opts.edge_prob = 0.0f;
  EXPECT_EQ(stampKernel(grid, Kernel(2, 0.0f), Position(4, 4), opts, sampler), 5u);
  EXPECT_EQ(grid.at(5, 4), CellType::Empty);
  EXPECT_EQ(grid.at(6, 4), CellType::Hookable);
}

TEST(StampKernelTest, FullEdgeProbabilityDrawsNothing) {
  Grid grid(9, 9, CellType::Hookable, Position(4, 4));
  WeightedSampler sampler(42);
  WeightedSampler reference(42);
  StampOptions opts;
  stampKernel(grid, Kernel(3, 0.0f), Position(4, 4), opts, sampler);
  EXPECT_EQ(sampler.uniformInt(0, 1000000), reference.uniformInt(0, 1000000));
}

}  // namespace
}  // namespace cavewalk
