// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patch_geometry.hpp
 *
 * Per-patch area, perimeter, core area and shape descriptors.
 */

#ifndef LSMETRICS_PATCHES_PATCH_GEOMETRY_HPP
#define LSMETRICS_PATCHES_PATCH_GEOMETRY_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include <Eigen/Core>

#include "lsmetrics/config/metrics.hpp"
#include "lsmetrics/landscape_grid.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"

namespace lsmetrics {

/**
 * @brief Geometric descriptors of one patch.
 *
 * Areas are in hectares, perimeter in the grid's linear unit. Shape indices
 * are computed from area in squared linear units (A) and perimeter (P):
 * - SHAPE  = P / (2 sqrt(pi A))
 * - FRAC   = 2 ln(0.25 P) / ln(A), 1 for single-cell patches
 * - PARA   = P / A
 * - CIRCLE = 1 - A / A_circ (A_circ: smallest enclosing circle of the cells)
 */
struct PatchGeometry {
  int32_t patch_id = kNoPatch;
  int32_t class_code = 0;

  size_t cell_count = 0;
  size_t edge_count = 0;       ///< Boundary cell sides
  size_t core_cell_count = 0;
  int core_count = 0;          ///< Disjunct core regions (NCORE)

  double area = 0.0;       ///< [ha]
  double perimeter = 0.0;  ///< [linear unit]
  double core_area = 0.0;  ///< [ha]

  double shape = 0.0;
  double frac = 0.0;
  double para = 0.0;
  double circle = 0.0;
  double cai = 0.0;  ///< 100 * core_area / area
};

/// Boundary side count of a patch: 4-neighbors that are out-of-grid, nodata
/// or of a different class.
size_t countBoundaryEdges(const LandscapeGrid& grid,
                          const PatchRegistry& registry, size_t patch_id);

/// Bitmap of the patch's core cells over its bounding box (row-major),
/// after peeling `edge_depth` boundary layers.
std::vector<uint8_t> erodeCore(const PatchRegistry& registry, size_t patch_id,
                               int edge_depth);

/// Number of connected regions in a bounding-box bitmap.
int countRegions(const std::vector<uint8_t>& bitmap, int rows, int cols,
                 Connectivity connectivity);

/// Smallest circle enclosing a point set.
struct Circle {
  Eigen::Vector2d center = Eigen::Vector2d::Zero();
  double radius = 0.0;
};

/// Minimum enclosing circle (randomized incremental, fixed seed).
Circle minimumEnclosingCircle(std::vector<Eigen::Vector2d> points);

/// Smallest circle enclosing every cell corner of a patch [linear unit].
Circle enclosingCircle(const LandscapeGrid& grid,
                       const PatchRegistry& registry, size_t patch_id);

/// Compute all descriptors of one patch.
PatchGeometry computePatchGeometry(const LandscapeGrid& grid,
                                   const PatchRegistry& registry,
                                   size_t patch_id,
                                   const config::CoreArea& core = {});

/// Compute descriptors of every patch, indexed by patch id.
std::vector<PatchGeometry> computePatchGeometry(
    const LandscapeGrid& grid, const PatchRegistry& registry,
    const config::CoreArea& core = {});

}  // namespace lsmetrics

#endif  // LSMETRICS_PATCHES_PATCH_GEOMETRY_HPP
