// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "lsmetrics/landscape_grid.hpp"
#include "lsmetrics/metrics/class_metrics.hpp"
#include "lsmetrics/metrics/landscape_metrics.hpp"
#include "lsmetrics/patches/patch_geometry.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"

using namespace lsmetrics;

// ─── Helpers ────────────────────────────────────────────────────────────────

namespace {

LandscapeRecord landscapeOf(const LandscapeGrid& grid) {
  PatchRegistry patches = labelPatches(grid);
  const auto geometry = computePatchGeometry(grid, patches);
  const auto classes = aggregateClasses(grid, patches, geometry);
  return computeLandscapeMetrics(grid, classes, geometry);
}

LandscapeGrid checkerboard(int n, double cell_size) {
  ClassMatrix codes(n, n);
  for (int r = 0; r < n; ++r) {
    for (int c = 0; c < n; ++c) codes(r, c) = (r + c) % 2 == 0 ? 1 : 2;
  }
  return LandscapeGrid::withoutNodata(codes, cell_size);
}

}  // namespace

// ─── Diversity ──────────────────────────────────────────────────────────────

TEST(DiversityTest, SingleClassHasZeroDiversity) {
  const Diversity d = computeDiversity({1.0});

  EXPECT_EQ(d.richness, 1u);
  EXPECT_DOUBLE_EQ(d.shdi, 0.0);
  EXPECT_DOUBLE_EQ(d.sidi, 0.0);
  EXPECT_DOUBLE_EQ(d.msidi, 0.0);
  EXPECT_TRUE(std::isnan(d.shei));
  EXPECT_TRUE(std::isnan(d.siei));
}

TEST(DiversityTest, TwoEqualClasses) {
  const Diversity d = computeDiversity({0.5, 0.5});

  EXPECT_EQ(d.richness, 2u);
  EXPECT_NEAR(d.shdi, std::log(2.0), 1e-12);
  EXPECT_NEAR(d.shei, 1.0, 1e-12);
  EXPECT_NEAR(d.sidi, 0.5, 1e-12);
  EXPECT_NEAR(d.siei, 1.0, 1e-12);
  EXPECT_NEAR(d.msidi, std::log(2.0), 1e-12);
}

TEST(DiversityTest, FourEqualClasses) {
  const Diversity d = computeDiversity({0.25, 0.25, 0.25, 0.25});

  EXPECT_NEAR(d.shdi, std::log(4.0), 1e-12);
  EXPECT_NEAR(d.sidi, 0.75, 1e-12);
  EXPECT_NEAR(d.shei, 1.0, 1e-12);
  EXPECT_NEAR(d.siei, 1.0, 1e-12);
}

TEST(DiversityTest, UnevenClassesAreLessEven) {
  const Diversity d = computeDiversity({0.7, 0.2, 0.1});

  const double shdi = -(0.7 * std::log(0.7) + 0.2 * std::log(0.2) +
                        0.1 * std::log(0.1));
  EXPECT_NEAR(d.shdi, shdi, 1e-12);
  EXPECT_NEAR(d.sidi, 1.0 - (0.49 + 0.04 + 0.01), 1e-12);
  EXPECT_LT(d.shei, 1.0);
  EXPECT_LT(d.siei, 1.0);
}

TEST(DiversityTest, ZeroAndUndefinedProportionsSkipped) {
  const Diversity d = computeDiversity(
      {0.5, 0.0, 0.5, std::numeric_limits<double>::quiet_NaN()});

  EXPECT_EQ(d.richness, 2u);
  EXPECT_NEAR(d.shdi, std::log(2.0), 1e-12);
}

TEST(DiversityTest, NoClasses) {
  const Diversity d = computeDiversity({});

  EXPECT_EQ(d.richness, 0u);
  EXPECT_TRUE(std::isnan(d.shdi));
  EXPECT_TRUE(std::isnan(d.sidi));
  EXPECT_TRUE(std::isnan(d.msidi));
}

// ─── Landscape aggregation ──────────────────────────────────────────────────

TEST(LandscapeMetricsTest, SingleClassSquare) {
  const LandscapeRecord r = landscapeOf(
      LandscapeGrid::withoutNodata(ClassMatrix::Constant(4, 4, 1), 10.0));

  EXPECT_NEAR(r.ta, 0.16, 1e-12);
  EXPECT_NEAR(r.grid_area, 0.16, 1e-12);
  EXPECT_EQ(r.np, 1u);
  EXPECT_DOUBLE_EQ(r.te, 160.0);
  EXPECT_DOUBLE_EQ(r.lsi, 1.0);
  EXPECT_DOUBLE_EQ(r.ai, 100.0);
  EXPECT_DOUBLE_EQ(r.division, 0.0);
  EXPECT_DOUBLE_EQ(r.split, 1.0);
  EXPECT_NEAR(r.tca, 0.04, 1e-12);
  EXPECT_EQ(r.ndca, 1u);

  EXPECT_EQ(r.diversity.richness, 1u);
  EXPECT_DOUBLE_EQ(r.diversity.shdi, 0.0);
  EXPECT_DOUBLE_EQ(r.diversity.sidi, 0.0);
  EXPECT_NEAR(r.prd, 100.0 / 0.16, 1e-9);
}

TEST(LandscapeMetricsTest, SharedEdgesCountedOnce) {
  const LandscapeRecord r = landscapeOf(checkerboard(4, 1.0));

  // 24 internal unlike sides plus 16 border sides
  EXPECT_DOUBLE_EQ(r.te, 40.0);
  EXPECT_EQ(r.np, 16u);
  EXPECT_DOUBLE_EQ(r.ai, 0.0);
  EXPECT_NEAR(r.area_mn, 1e-4, 1e-15);
  EXPECT_NEAR(r.lsi, 40.0 / 16.0, 1e-12);
  EXPECT_EQ(r.diversity.richness, 2u);
  EXPECT_NEAR(r.diversity.shdi, std::log(2.0), 1e-12);
  EXPECT_NEAR(r.diversity.sidi, 0.5, 1e-12);
}

TEST(LandscapeMetricsTest, TwoHalves) {
  ClassMatrix codes(4, 4);
  codes << 1, 1, 2, 2,  //
      1, 1, 2, 2,       //
      1, 1, 2, 2,       //
      1, 1, 2, 2;
  const LandscapeRecord r =
      landscapeOf(LandscapeGrid::withoutNodata(codes, 1.0, 1.0));

  EXPECT_EQ(r.np, 2u);
  EXPECT_DOUBLE_EQ(r.ta, 16.0);
  EXPECT_DOUBLE_EQ(r.te, 20.0);
  EXPECT_DOUBLE_EQ(r.area_mn, 8.0);
  EXPECT_DOUBLE_EQ(r.area_sd, 0.0);
  EXPECT_NEAR(r.division, 0.5, 1e-12);
  EXPECT_NEAR(r.split, 2.0, 1e-12);
  EXPECT_NEAR(r.mesh, 8.0, 1e-12);
  // Each 2x4 half: 10 like adjacencies, the maximum for 8 cells
  EXPECT_NEAR(r.ai, 100.0, 1e-9);
}

TEST(LandscapeMetricsTest, AreaConservationWithNodata) {
  ClassMatrix codes(3, 4);
  codes << 1, 2, -9, 3,  //
      1, 2, 2, 3,        //
      -9, -9, 3, 3;
  LandscapeGrid grid = LandscapeGrid::withNodataValue(codes, -9, 30.0);
  PatchRegistry patches = labelPatches(grid);
  const auto geometry = computePatchGeometry(grid, patches);
  const auto classes = aggregateClasses(grid, patches, geometry);
  const LandscapeRecord r = computeLandscapeMetrics(grid, classes, geometry);

  double class_area = 0.0;
  for (const auto& c : classes) class_area += c.ca;
  EXPECT_NEAR(class_area, r.ta, 1e-12);
  EXPECT_NEAR(r.ta + grid.nodataAreaHa(), r.grid_area, 1e-12);
  EXPECT_NEAR(r.grid_area, 12 * 0.09, 1e-12);
}

TEST(LandscapeMetricsTest, AllNodata) {
  const LandscapeRecord r = landscapeOf(LandscapeGrid::withNodataValue(
      ClassMatrix::Constant(3, 3, 0), 0, 1.0));

  EXPECT_DOUBLE_EQ(r.ta, 0.0);
  EXPECT_EQ(r.np, 0u);
  EXPECT_DOUBLE_EQ(r.te, 0.0);
  EXPECT_TRUE(std::isnan(r.pd));
  EXPECT_TRUE(std::isnan(r.ed));
  EXPECT_TRUE(std::isnan(r.area_mn));
  EXPECT_TRUE(std::isnan(r.ai));
  EXPECT_EQ(r.diversity.richness, 0u);
  EXPECT_TRUE(std::isnan(r.diversity.shdi));
  EXPECT_TRUE(std::isnan(r.prd));
}

TEST(LandscapeMetricsTest, ExtentOverloadMatchesGridOverload) {
  LandscapeGrid grid = checkerboard(3, 5.0);
  PatchRegistry patches = labelPatches(grid);
  const auto geometry = computePatchGeometry(grid, patches);
  const auto classes = aggregateClasses(grid, patches, geometry);

  const LandscapeRecord a = computeLandscapeMetrics(grid, classes, geometry);
  const LandscapeRecord b = computeLandscapeMetrics(
      classes, geometry, LandscapeExtent::of(grid), grid.gridAreaHa());
  EXPECT_DOUBLE_EQ(a.ta, b.ta);
  EXPECT_DOUBLE_EQ(a.te, b.te);
  EXPECT_DOUBLE_EQ(a.diversity.shdi, b.diversity.shdi);
}
