// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * class_metrics.hpp
 *
 * Class-level aggregation of patch geometry and adjacency tallies.
 */

#ifndef LSMETRICS_METRICS_CLASS_METRICS_HPP
#define LSMETRICS_METRICS_CLASS_METRICS_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "lsmetrics/landscape_grid.hpp"
#include "lsmetrics/metrics/adjacency.hpp"
#include "lsmetrics/patches/patch_geometry.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"

namespace lsmetrics {

/// Value of a metric that is undefined for a row.
inline constexpr double kNotApplicable =
    std::numeric_limits<double>::quiet_NaN();

namespace detail {

/// num / den, or NaN when den is zero.
inline double ratio(double num, double den) {
  return den == 0.0 ? kNotApplicable : num / den;
}

}  // namespace detail

/// Extent of the analysed landscape (non-nodata cells only).
struct LandscapeExtent {
  double total_area = 0.0;    ///< TA [ha]
  size_t data_cells = 0;      ///< Z
  double cell_size = 1.0;     ///< [linear unit]
  double cell_area_ha = 0.0;  ///< [ha]

  static LandscapeExtent of(const LandscapeGrid& grid);
};

/// Sums and means over a set of patches.
struct PatchSummary {
  size_t count = 0;
  double area = 0.0;         ///< Σ a_i [ha]
  double area_sq = 0.0;      ///< Σ a_i² [ha²]
  double area_sd = kNotApplicable;
  double core_area = 0.0;    ///< Σ core_i [ha]
  size_t core_regions = 0;   ///< Σ NCORE
  double shape_mn = kNotApplicable;
  double shape_am = kNotApplicable;
  double frac_mn = kNotApplicable;
  double para_mn = kNotApplicable;
  double circle_mn = kNotApplicable;
  double cai_mn = kNotApplicable;

  double area_mn() const { return detail::ratio(area, count); }
};

/// Summarize the patches `patch_ids` of `geometry`.
PatchSummary summarizePatches(const std::vector<PatchGeometry>& geometry,
                              const std::vector<int32_t>& patch_ids);

/// Summarize every patch of `geometry`.
PatchSummary summarizePatches(const std::vector<PatchGeometry>& geometry);

/**
 * @brief Metrics of one class.
 *
 * Areas in hectares, edge lengths in the grid's linear unit, densities per
 * hectare (ED) or per 100 ha (PD). Undefined values are NaN.
 */
struct ClassRecord {
  int32_t class_code = 0;

  // Area and density
  double ca = 0.0;
  double pland = kNotApplicable;
  size_t np = 0;
  double pd = kNotApplicable;
  double area_mn = kNotApplicable;
  double area_sd = kNotApplicable;

  // Edge
  double te = 0.0;
  double ed = kNotApplicable;
  double lsi = kNotApplicable;

  // Shape
  double shape_mn = kNotApplicable;
  double shape_am = kNotApplicable;
  double frac_mn = kNotApplicable;
  double para_mn = kNotApplicable;
  double circle_mn = kNotApplicable;

  // Core area
  double tca = 0.0;
  double cpland = kNotApplicable;
  double cai = kNotApplicable;
  double cai_mn = kNotApplicable;
  size_t ndca = 0;

  // Aggregation
  double ai = kNotApplicable;
  double clumpy = kNotApplicable;
  double cohesion = kNotApplicable;
  double division = kNotApplicable;
  double split = kNotApplicable;
  double mesh = kNotApplicable;

  // Raw tallies reused by the landscape aggregation
  ClassAdjacency adjacency;
  double area_sq = 0.0;  ///< Σ a_i² [ha²]
};

/// Compute the metrics of one class from its patches.
ClassRecord computeClassMetrics(int32_t class_code,
                                const std::vector<PatchGeometry>& geometry,
                                const std::vector<int32_t>& patch_ids,
                                const ClassAdjacency& adjacency,
                                const LandscapeExtent& extent);

/// Compute the metrics of every class present, ascending by class code.
std::vector<ClassRecord> aggregateClasses(
    const LandscapeGrid& grid, const PatchRegistry& registry,
    const std::vector<PatchGeometry>& geometry);

}  // namespace lsmetrics

#endif  // LSMETRICS_METRICS_CLASS_METRICS_HPP
